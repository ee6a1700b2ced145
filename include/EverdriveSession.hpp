/**
 * @file EverdriveSession.hpp
 * @brief Public operation surface of the driver.
 *
 * A session owns one open transport for its whole lifetime and runs every
 * operation as a sequence of command/response round-trips, one at a time:
 *
 * @code
 * std::unique_ptr<EverdriveSession> ed;
 * EverdriveError err = EverdriveSession::open(std::chrono::milliseconds(100), ed);
 * if (!err.ok()) {
 *     std::cerr << "Failed to find Everdrive: " << err << std::endl;
 *     return 1;
 * }
 *
 * std::vector<uint8_t> header;
 * err = ed->read(MemorySpace::ROM, EverdriveConfig::ROM_BASE_ADDR, 512, header);
 * @endcode
 *
 * Nothing is retried. A timeout leaves the outcome of the command unknown, so
 * repeating a read is safe but repeating a write is the caller's decision.
 * Whatever the device sends late for a timed-out command is discarded before
 * the next command goes out.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "Chunker.hpp"
#include "CommandCodec.hpp"
#include "EverdriveConfig.hpp"
#include "EverdriveError.hpp"
#include "Transport.hpp"
#include "UnfPacket.hpp"

/**
 * @brief Device state reported by the status command.
 */
struct StatusInfo {
    bool ok;                     /**< Device answered with the OK tag */
    uint8_t status;              /**< Raw status tag */
    std::vector<uint8_t> detail; /**< Trailing bytes of the status reply, if any */

    StatusInfo() : ok(false), status(0) {}
};

/**
 * @brief Limits and timeout policy of a session.
 */
struct SessionOptions {
    std::chrono::milliseconds timeout; /**< Applied to every round-trip */
    size_t max_chunk;                  /**< Largest piece of a read/write sent in one command */
    uint32_t block_size;               /**< Device length unit */
    size_t max_payload;                /**< Device command buffer size */
    uint16_t vendor_id;
    uint16_t product_id;

    SessionOptions();

    /**
     * @brief Check the limits agree with each other.
     *
     * @return INVALID_ARGUMENT describing the first inconsistency.
     */
    EverdriveError validate() const;
};

class EverdriveSession {
public:
    /**
     * @brief Round-trip progress.
     */
    enum State {
        IDLE,             /**< No command in flight */
        COMMAND_SENT,     /**< Bytes handed to the transport */
        AWAITING_RESPONSE /**< Waiting for the reply */
    };

    /**
     * @brief How the last round-trip ended.
     */
    enum Outcome {
        NO_COMMAND,       /**< Nothing sent yet */
        DECODED,          /**< A reply arrived and went through the codec */
        TIMED_OUT,        /**< No reply in time */
        TRANSPORT_FAILED  /**< The link failed; the session must be reopened */
    };

    /**
     * @brief Discover and open the cartridge over the default FTDI transport.
     *
     * @param timeout Round-trip timeout for the whole session
     * @param session Receives the open session on success
     */
    static EverdriveError open(std::chrono::milliseconds timeout,
                               std::unique_ptr<EverdriveSession>& session);

    /**
     * @brief Open the cartridge over a caller-supplied transport.
     *
     * The session takes ownership of the transport, opens it with the
     * options' vendor/product id and runs the status handshake.
     */
    static EverdriveError open(std::unique_ptr<Transport> transport, const SessionOptions& options,
                               std::unique_ptr<EverdriveSession>& session);

    ~EverdriveSession();

    EverdriveSession(const EverdriveSession&) = delete;
    EverdriveSession& operator=(const EverdriveSession&) = delete;

    EverdriveError status(StatusInfo& info);

    /**
     * @brief Read length bytes starting at address into an owned buffer.
     *
     * On failure data is cleared.
     */
    EverdriveError read(MemorySpace space, uint32_t address, size_t length, std::vector<uint8_t>& data);

    /**
     * @brief Read into a caller buffer.
     *
     * On failure the chunks completed before the failing one are in dest;
     * the rest of dest keeps its previous contents.
     */
    EverdriveError read(MemorySpace space, uint32_t address, uint8_t* dest, size_t length);

    /**
     * @brief Write data starting at address. The length must be block aligned.
     */
    EverdriveError write(MemorySpace space, uint32_t address, const std::vector<uint8_t>& data);
    EverdriveError write(MemorySpace space, uint32_t address, const uint8_t* data, size_t length);

    EverdriveError romRead(uint32_t address, size_t length, std::vector<uint8_t>& data)
    {
        return read(MemorySpace::ROM, address, length, data);
    }

    EverdriveError romWrite(uint32_t address, const std::vector<uint8_t>& data)
    {
        return write(MemorySpace::ROM, address, data);
    }

    /**
     * @brief Fill a region of the rom with a value.
     */
    EverdriveError romFill(uint32_t address, size_t length, uint32_t value);

    /**
     * @brief Boot the loaded ROM.
     *
     * A non-empty save_name selects the save file on the SD card. The
     * cartridge leaves the USB loop, so no reply is awaited.
     */
    EverdriveError appStart(const std::string& save_name = std::string());

    EverdriveError unfSend(const UnfPacket& packet);
    EverdriveError unfReceive(UnfPacket& packet);

    /**
     * @brief Release the transport. Later operations fail with TRANSPORT_IO.
     */
    void close();
    bool isOpen() const;

    const SessionOptions& getOptions() const { return options; }
    State getState() const { return state; }
    Outcome getLastOutcome() const { return lastOutcome; }

private:
    EverdriveSession(std::unique_ptr<Transport> transport, const SessionOptions& options);

    EverdriveError checkUsable() const;
    EverdriveError checkRange(uint32_t address, size_t length) const;

    /**
     * @brief Send one command and decode its reply.
     *
     * The reply is read in two steps (header, then the body its tag calls
     * for) against a single deadline.
     */
    EverdriveError roundTrip(const CommandFrame& command, size_t min_payload, size_t max_payload,
                             ResponseFrame& response);

    /**
     * @brief Send bytes that get no reply.
     */
    EverdriveError sendOnly(const std::vector<uint8_t>& bytes);

    void finishRoundTrip(const EverdriveError& error);

    /**
     * @brief Drop unread input left by a reply that came late or was cut short.
     *
     * Runs before the next command goes out whenever the last reply may not
     * have been consumed whole.
     */
    EverdriveError resync();

    std::unique_ptr<Transport> transport;
    SessionOptions options;
    CommandCodec codec;
    Chunker chunker;
    State state;
    Outcome lastOutcome;
    bool broken;
    bool outOfStep; // input may hold bytes of an earlier reply
};
