#include "UnfPacket.hpp"
#include <sstream>
#include <iomanip>

namespace {

uint32_t readWord(const std::vector<uint8_t>& buf, size_t offset)
{
    return (static_cast<uint32_t>(buf[offset]) << 24) |
           (static_cast<uint32_t>(buf[offset + 1]) << 16) |
           (static_cast<uint32_t>(buf[offset + 2]) << 8) |
           static_cast<uint32_t>(buf[offset + 3]);
}

void writeWord(std::vector<uint8_t>& buf, uint32_t word)
{
    buf.push_back(static_cast<uint8_t>(word >> 24));
    buf.push_back(static_cast<uint8_t>(word >> 16));
    buf.push_back(static_cast<uint8_t>(word >> 8));
    buf.push_back(static_cast<uint8_t>(word));
}

std::string hexWord(uint32_t word)
{
    std::stringstream ss;
    ss << "0x" << std::hex << std::setw(8) << std::setfill('0') << word;
    return ss.str();
}

} // namespace

UnfPacket::UnfPacket()
    : type_(UNKNOWN)
{
}

UnfPacket::UnfPacket(DataType type, const std::vector<uint8_t>& data)
    : type_(type), data_(data)
{
}

UnfPacket::DataType UnfPacket::dataTypeFromByte(uint8_t byte)
{
    switch (byte) {
        case TEXT: return TEXT;
        case BINARY: return BINARY;
        case HEADER: return HEADER;
        case SCREENSHOT: return SCREENSHOT;
        case HEARTBEAT: return HEARTBEAT;
        case RDB_PACKET: return RDB_PACKET;
        default: return UNKNOWN;
    }
}

const char* UnfPacket::dataTypeName(DataType type)
{
    switch (type) {
        case TEXT: return "text";
        case BINARY: return "binary";
        case HEADER: return "header";
        case SCREENSHOT: return "screenshot";
        case HEARTBEAT: return "heartbeat";
        case RDB_PACKET: return "rdb";
        case UNKNOWN: break;
    }
    return "unknown";
}

EverdriveError UnfPacket::encode(std::vector<uint8_t>& out) const
{
    if (data_.size() > MAX_DATA_SIZE) {
        return EverdriveError(EverdriveError::ENCODING_PAYLOAD_TOO_LARGE,
                              "Data size must be less than 0x00FFFFFF");
    }

    const size_t size = data_.size();
    const size_t align = size & 1;

    out.clear();
    out.reserve(HEADER_SIZE + size + align + FOOTER_SIZE);
    writeWord(out, MAGIC);
    writeWord(out, (static_cast<uint32_t>(type_) << 24) | static_cast<uint32_t>(size));
    out.insert(out.end(), data_.begin(), data_.end());
    if (align) {
        out.push_back(0xFF);
    }
    writeWord(out, FOOTER);

    return EverdriveError::success();
}

EverdriveError UnfPacket::parseHeader(const std::vector<uint8_t>& header, DataType& type, size_t& size)
{
    if (header.size() < HEADER_SIZE) {
        return EverdriveError(EverdriveError::PROTOCOL_TRUNCATED, "Failed to read UNF packet header");
    }

    uint32_t magic = readWord(header, 0);
    if (magic != MAGIC) {
        return EverdriveError(EverdriveError::PROTOCOL_MALFORMED,
                              "Invalid UNF packet magic " + hexWord(magic) + ", expected " + hexWord(MAGIC));
    }

    uint32_t word = readWord(header, 4);
    type = dataTypeFromByte(static_cast<uint8_t>(word >> 24));
    size = word & 0x00FFFFFF;
    return EverdriveError::success();
}

EverdriveError UnfPacket::decode(const std::vector<uint8_t>& bytes, UnfPacket& out)
{
    DataType type = UNKNOWN;
    size_t size = 0;
    EverdriveError error = parseHeader(bytes, type, size);
    if (!error.ok()) {
        return error;
    }

    if (bytes.size() < HEADER_SIZE + size + FOOTER_SIZE) {
        return EverdriveError(EverdriveError::PROTOCOL_TRUNCATED, "Failed to read UNF packet data");
    }

    uint32_t footer = readWord(bytes, HEADER_SIZE + size);
    if (footer != FOOTER) {
        return EverdriveError(EverdriveError::PROTOCOL_MALFORMED,
                              "Invalid UNF packet footer " + hexWord(footer) + ", expected " + hexWord(FOOTER));
    }

    out = UnfPacket(type, std::vector<uint8_t>(bytes.begin() + HEADER_SIZE,
                                               bytes.begin() + HEADER_SIZE + size));
    return EverdriveError::success();
}
