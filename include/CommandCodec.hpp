/**
 * @file CommandCodec.hpp
 * @brief Wire format of the cartridge's USB command protocol.
 *
 * Command frame (16-byte header, big-endian fields, then payload for writes):
 *
 *   [ 'c' 'm' 'd' ][ OPCODE ][ ADDRESS u32 ][ BLOCKS u32 ][ ARG u32 ][ PAYLOAD... ]
 *
 * BLOCKS is the transfer length divided by the device block size.
 *
 * Response frame:
 *
 *   [ 'c' 'm' 'd' ][ 'r' ][ PAYLOAD... ]   success, payload length set by the command
 *   [ 'c' 'm' 'd' ][ 'e' ][ CODE ]         device-side failure
 *
 * The codec is stateless: encoding and decoding depend only on the arguments
 * and the limits given at construction.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>
#include "EverdriveConfig.hpp"
#include "EverdriveError.hpp"

/**
 * @brief Addressable regions of the cartridge.
 */
enum class MemorySpace {
    ROM,  /**< Cartridge ROM space */
    SRAM  /**< Save RAM */
};

const char* memorySpaceName(MemorySpace space);

/**
 * @brief Command opcodes.
 */
enum class Opcode : uint8_t {
    TEST = 't',      /**< Handshake / status */
    READ = 'R',      /**< Memory read, payload comes back in the response */
    WRITE = 'W',     /**< Memory write, payload follows the header */
    FILL = 'c',      /**< Fill a region with the argument value */
    APP_START = 's'  /**< Leave the USB loop and boot the loaded ROM */
};

/**
 * @brief Read/write opcodes used for one memory space.
 */
struct CommandFamily {
    Opcode read;
    Opcode write;
};

CommandFamily commandFamily(MemorySpace space);

/**
 * @brief One encoded request. Only the codec builds non-empty frames.
 */
class CommandFrame {
public:
    CommandFrame() = default;

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    Opcode opcode() const;
    uint32_t address() const;
    uint32_t blocks() const;
    uint32_t argument() const;
    size_t payloadSize() const;

private:
    friend class CommandCodec;
    explicit CommandFrame(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    std::vector<uint8_t> bytes_;
};

/**
 * @brief One decoded reply.
 */
class ResponseFrame {
public:
    ResponseFrame() : status_(0) {}

    uint8_t status() const { return status_; }
    bool ok() const { return status_ == EverdriveConfig::RESP_OK; }
    const std::vector<uint8_t>& payload() const { return payload_; }

private:
    friend class CommandCodec;
    ResponseFrame(uint8_t status, std::vector<uint8_t> payload)
        : status_(status), payload_(std::move(payload)) {}

    uint8_t status_;
    std::vector<uint8_t> payload_;
};

class CommandCodec {
public:
    /**
     * @param block_size  Length unit of the BLOCKS field
     * @param max_payload Largest read or write a single command may carry
     */
    explicit CommandCodec(uint32_t block_size = EverdriveConfig::BLOCK_SIZE,
                          size_t max_payload = EverdriveConfig::MAX_COMMAND_PAYLOAD);

    uint32_t blockSize() const { return block_size_; }
    size_t maxPayload() const { return max_payload_; }

    /**
     * @brief Encode one command.
     *
     * For WRITE the payload size must equal length. READ and WRITE lengths are
     * bounded by maxPayload(); FILL only needs block alignment.
     *
     * @return ENCODING_PAYLOAD_TOO_LARGE, ENCODING_MISALIGNED or
     *         INVALID_ARGUMENT on failure; out is left untouched.
     */
    EverdriveError encode(Opcode opcode, uint32_t address, size_t length, uint32_t argument,
                          const uint8_t* payload, size_t payload_len, CommandFrame& out) const;

    EverdriveError encodeTest(CommandFrame& out) const;
    EverdriveError encodeRead(MemorySpace space, uint32_t address, size_t length,
                              CommandFrame& out) const;
    EverdriveError encodeWrite(MemorySpace space, uint32_t address, const uint8_t* data,
                               size_t length, CommandFrame& out) const;
    EverdriveError encodeFill(uint32_t address, size_t length, uint32_t value,
                              CommandFrame& out) const;
    EverdriveError encodeAppStart(bool with_save_name, CommandFrame& out) const;

    /**
     * @brief Decode a reply whose payload must be exactly expected_payload bytes.
     */
    EverdriveError decode(const std::vector<uint8_t>& bytes, size_t expected_payload,
                          ResponseFrame& out) const;

    /**
     * @brief Decode a reply whose payload length lies in [min_payload, max_payload].
     *
     * All-or-nothing: out is only assigned when OK is returned.
     */
    EverdriveError decode(const std::vector<uint8_t>& bytes, size_t min_payload,
                          size_t max_payload, ResponseFrame& out) const;

    /**
     * @brief Round a length up to the next block boundary.
     */
    size_t alignUp(size_t length) const;

private:
    uint32_t block_size_;
    size_t max_payload_;
};
