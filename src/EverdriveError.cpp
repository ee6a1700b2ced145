#include "EverdriveError.hpp"
#include <iomanip>
#include <sstream>

EverdriveError::EverdriveError()
    : kind_(OK), device_code_(0)
{
}

EverdriveError::EverdriveError(Kind kind, const std::string& message)
    : kind_(kind), device_code_(0), message_(message)
{
}

EverdriveError::EverdriveError(Kind kind, uint8_t device_code, const std::string& message)
    : kind_(kind), device_code_(device_code), message_(message)
{
}

EverdriveError EverdriveError::deviceError(uint8_t code)
{
    std::stringstream ss;
    ss << "Device reported error code 0x" << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(code);
    return EverdriveError(PROTOCOL_DEVICE_ERROR, code, ss.str());
}

bool EverdriveError::isDeviceError() const
{
    return kind_ == DEVICE_NOT_FOUND || kind_ == DEVICE_BUSY;
}

bool EverdriveError::isTransportError() const
{
    return kind_ == TRANSPORT_TIMEOUT || kind_ == TRANSPORT_IO;
}

bool EverdriveError::isProtocolError() const
{
    return kind_ == PROTOCOL_TRUNCATED || kind_ == PROTOCOL_MALFORMED ||
           kind_ == PROTOCOL_DEVICE_ERROR;
}

bool EverdriveError::isEncodingError() const
{
    return kind_ == ENCODING_PAYLOAD_TOO_LARGE || kind_ == ENCODING_MISALIGNED;
}

bool EverdriveError::isProgrammingError() const
{
    return isEncodingError() || kind_ == INVALID_ARGUMENT;
}

const char* EverdriveError::kindName() const
{
    return kindName(kind_);
}

const char* EverdriveError::kindName(Kind kind)
{
    switch (kind) {
        case OK: return "OK";
        case DEVICE_NOT_FOUND: return "DeviceNotFound";
        case DEVICE_BUSY: return "DeviceBusy";
        case TRANSPORT_TIMEOUT: return "TransportTimeout";
        case TRANSPORT_IO: return "TransportIo";
        case PROTOCOL_TRUNCATED: return "ProtocolTruncated";
        case PROTOCOL_MALFORMED: return "ProtocolMalformed";
        case PROTOCOL_DEVICE_ERROR: return "ProtocolDeviceError";
        case ENCODING_PAYLOAD_TOO_LARGE: return "EncodingPayloadTooLarge";
        case ENCODING_MISALIGNED: return "EncodingMisaligned";
        case INVALID_ARGUMENT: return "InvalidArgument";
    }
    return "Unknown";
}

std::string EverdriveError::toString() const
{
    if (message_.empty()) {
        return kindName();
    }
    return std::string(kindName()) + ": " + message_;
}

std::ostream& operator<<(std::ostream& os, const EverdriveError& error)
{
    return os << error.toString();
}
