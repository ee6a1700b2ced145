/**
 * @file UnfPacket.hpp
 * @brief Debug-channel packets exchanged with code running on the console.
 *
 * Packet layout (big-endian):
 *
 *   [ "DMA@" ][ TYPE u8 ][ SIZE u24 ][ DATA... ][ 0xFF if SIZE is odd ][ "CMPH" ]
 *
 * The alignment byte is only written when sending; the console does not pad
 * what it sends back.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "EverdriveError.hpp"

class UnfPacket {
public:
    enum DataType {
        TEXT = 0x01,
        BINARY = 0x02,
        HEADER = 0x03,
        SCREENSHOT = 0x04,
        HEARTBEAT = 0x05,
        RDB_PACKET = 0x06,
        UNKNOWN = 0xFF
    };

    static constexpr uint32_t MAGIC = 0x444D4140;  // "DMA@"
    static constexpr uint32_t FOOTER = 0x434D5048; // "CMPH"
    static constexpr size_t MAX_DATA_SIZE = 0x00FFFFFF;
    static constexpr size_t HEADER_SIZE = 8;
    static constexpr size_t FOOTER_SIZE = 4;

    UnfPacket();
    UnfPacket(DataType type, const std::vector<uint8_t>& data);

    DataType type() const { return type_; }
    const std::vector<uint8_t>& data() const { return data_; }

    static DataType dataTypeFromByte(uint8_t byte);
    static const char* dataTypeName(DataType type);

    /**
     * @brief Serialize for sending, including the alignment byte.
     *
     * @return ENCODING_PAYLOAD_TOO_LARGE when the data does not fit 24 bits.
     */
    EverdriveError encode(std::vector<uint8_t>& out) const;

    /**
     * @brief Check the 8-byte header and extract type and data size.
     */
    static EverdriveError parseHeader(const std::vector<uint8_t>& header, DataType& type, size_t& size);

    /**
     * @brief Decode a complete received packet (no alignment byte).
     */
    static EverdriveError decode(const std::vector<uint8_t>& bytes, UnfPacket& out);

private:
    DataType type_;
    std::vector<uint8_t> data_;
};
