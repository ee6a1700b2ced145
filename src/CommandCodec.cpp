#include "CommandCodec.hpp"
#include <sstream>
#include <iomanip>

namespace {

void putWord(std::vector<uint8_t>& out, uint32_t word)
{
    out.push_back(static_cast<uint8_t>(word >> 24));
    out.push_back(static_cast<uint8_t>(word >> 16));
    out.push_back(static_cast<uint8_t>(word >> 8));
    out.push_back(static_cast<uint8_t>(word));
}

uint32_t getWord(const std::vector<uint8_t>& in, size_t offset)
{
    if (in.size() < offset + 4) {
        return 0;
    }
    return (static_cast<uint32_t>(in[offset]) << 24) |
           (static_cast<uint32_t>(in[offset + 1]) << 16) |
           (static_cast<uint32_t>(in[offset + 2]) << 8) |
           static_cast<uint32_t>(in[offset + 3]);
}

bool hasPrefix(const std::vector<uint8_t>& bytes)
{
    return bytes[0] == EverdriveConfig::CMD_PREFIX[0] &&
           bytes[1] == EverdriveConfig::CMD_PREFIX[1] &&
           bytes[2] == EverdriveConfig::CMD_PREFIX[2];
}

} // namespace

const char* memorySpaceName(MemorySpace space)
{
    switch (space) {
        case MemorySpace::ROM: return "ROM";
        case MemorySpace::SRAM: return "SRAM";
    }
    return "?";
}

CommandFamily commandFamily(MemorySpace space)
{
    // Both regions sit on the cartridge bus and share the memory commands,
    // the address alone selects the region.
    static const CommandFamily families[] = {
        {Opcode::READ, Opcode::WRITE}, // ROM
        {Opcode::READ, Opcode::WRITE}, // SRAM
    };
    return families[static_cast<int>(space)];
}

Opcode CommandFrame::opcode() const
{
    return bytes_.size() > 3 ? static_cast<Opcode>(bytes_[3]) : Opcode::TEST;
}

uint32_t CommandFrame::address() const
{
    return getWord(bytes_, 4);
}

uint32_t CommandFrame::blocks() const
{
    return getWord(bytes_, 8);
}

uint32_t CommandFrame::argument() const
{
    return getWord(bytes_, 12);
}

size_t CommandFrame::payloadSize() const
{
    return bytes_.size() > EverdriveConfig::CMD_HEADER_SIZE
               ? bytes_.size() - EverdriveConfig::CMD_HEADER_SIZE
               : 0;
}

CommandCodec::CommandCodec(uint32_t block_size, size_t max_payload)
    : block_size_(block_size), max_payload_(max_payload)
{
}

size_t CommandCodec::alignUp(size_t length) const
{
    if (block_size_ == 0) {
        return length;
    }
    size_t rem = length % block_size_;
    return rem == 0 ? length : length + (block_size_ - rem);
}

EverdriveError CommandCodec::encode(Opcode opcode, uint32_t address, size_t length, uint32_t argument,
                                    const uint8_t* payload, size_t payload_len, CommandFrame& out) const
{
    if (block_size_ == 0) {
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, "Block size must be non-zero");
    }

    const bool carries_payload = (opcode == Opcode::WRITE);
    if (carries_payload) {
        if (payload_len != length) {
            return EverdriveError(EverdriveError::INVALID_ARGUMENT, "Write payload does not match its length");
        }
        if (payload == nullptr && payload_len > 0) {
            return EverdriveError(EverdriveError::INVALID_ARGUMENT, "Write payload is null");
        }
    } else if (payload_len > 0) {
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, "Only write commands carry a payload");
    }

    if ((opcode == Opcode::READ || opcode == Opcode::WRITE) && length > max_payload_) {
        std::stringstream ss;
        ss << "Command length " << length << " exceeds per-command maximum " << max_payload_;
        return EverdriveError(EverdriveError::ENCODING_PAYLOAD_TOO_LARGE, ss.str());
    }

    if (length % block_size_ != 0) {
        std::stringstream ss;
        ss << "Size must be a multiple of " << block_size_ << " (got " << length << ")";
        return EverdriveError(EverdriveError::ENCODING_MISALIGNED, ss.str());
    }

    const size_t blocks = length / block_size_;
    if (blocks > 0xFFFFFFFFu) {
        return EverdriveError(EverdriveError::ENCODING_PAYLOAD_TOO_LARGE, "Block count does not fit the length field");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(EverdriveConfig::CMD_HEADER_SIZE + payload_len);
    bytes.insert(bytes.end(), EverdriveConfig::CMD_PREFIX, EverdriveConfig::CMD_PREFIX + 3);
    bytes.push_back(static_cast<uint8_t>(opcode));
    putWord(bytes, address);
    putWord(bytes, static_cast<uint32_t>(blocks));
    putWord(bytes, argument);
    if (payload_len > 0) {
        bytes.insert(bytes.end(), payload, payload + payload_len);
    }

    out = CommandFrame(std::move(bytes));
    return EverdriveError::success();
}

EverdriveError CommandCodec::encodeTest(CommandFrame& out) const
{
    return encode(Opcode::TEST, 0, 0, 0, nullptr, 0, out);
}

EverdriveError CommandCodec::encodeRead(MemorySpace space, uint32_t address, size_t length,
                                        CommandFrame& out) const
{
    return encode(commandFamily(space).read, address, length, 0, nullptr, 0, out);
}

EverdriveError CommandCodec::encodeWrite(MemorySpace space, uint32_t address, const uint8_t* data,
                                         size_t length, CommandFrame& out) const
{
    return encode(commandFamily(space).write, address, length, 0, data, length, out);
}

EverdriveError CommandCodec::encodeFill(uint32_t address, size_t length, uint32_t value,
                                        CommandFrame& out) const
{
    return encode(Opcode::FILL, address, length, value, nullptr, 0, out);
}

EverdriveError CommandCodec::encodeAppStart(bool with_save_name, CommandFrame& out) const
{
    return encode(Opcode::APP_START, 0, 0, with_save_name ? 1 : 0, nullptr, 0, out);
}

EverdriveError CommandCodec::decode(const std::vector<uint8_t>& bytes, size_t expected_payload,
                                    ResponseFrame& out) const
{
    return decode(bytes, expected_payload, expected_payload, out);
}

EverdriveError CommandCodec::decode(const std::vector<uint8_t>& bytes, size_t min_payload,
                                    size_t max_payload, ResponseFrame& out) const
{
    const size_t header = EverdriveConfig::RESP_HEADER_SIZE;

    if (bytes.size() < header) {
        std::stringstream ss;
        ss << "Response has " << bytes.size() << " bytes, header needs " << header;
        return EverdriveError(EverdriveError::PROTOCOL_TRUNCATED, ss.str());
    }

    if (!hasPrefix(bytes)) {
        return EverdriveError(EverdriveError::PROTOCOL_MALFORMED, "Invalid response from Everdrive device");
    }

    const uint8_t tag = bytes[3];

    if (tag == EverdriveConfig::RESP_ERROR) {
        if (bytes.size() < header + 1) {
            return EverdriveError(EverdriveError::PROTOCOL_TRUNCATED, "Error response without error code");
        }
        return EverdriveError::deviceError(bytes[header]);
    }

    if (tag != EverdriveConfig::RESP_OK) {
        std::stringstream ss;
        ss << "Unknown response tag 0x" << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(tag);
        return EverdriveError(EverdriveError::PROTOCOL_MALFORMED, ss.str());
    }

    const size_t payload_len = bytes.size() - header;
    if (payload_len < min_payload) {
        std::stringstream ss;
        ss << "Response payload has " << payload_len << " bytes, expected " << min_payload;
        return EverdriveError(EverdriveError::PROTOCOL_TRUNCATED, ss.str());
    }
    if (payload_len > max_payload) {
        std::stringstream ss;
        ss << "Response payload has " << payload_len << " bytes, at most " << max_payload << " allowed";
        return EverdriveError(EverdriveError::PROTOCOL_MALFORMED, ss.str());
    }

    out = ResponseFrame(tag, std::vector<uint8_t>(bytes.begin() + header, bytes.end()));
    return EverdriveError::success();
}
