/**
 * @file EverdriveError.hpp
 * @brief Error taxonomy shared by every layer of the driver.
 *
 * Transports, the command codec, the chunker and the session all report
 * failures through EverdriveError, so a caller handles one type no matter
 * which layer failed.
 */

#pragma once

#include <cstdint>
#include <string>
#include <ostream>

/**
 * @class EverdriveError
 * @brief Result of a driver operation: OK or one classified failure.
 */
class EverdriveError {
public:
    /**
     * @brief Failure classes.
     */
    enum Kind {
        OK = 0,                     /**< No error */
        DEVICE_NOT_FOUND,           /**< No matching device enumerated */
        DEVICE_BUSY,                /**< Device present but could not be opened or claimed */
        TRANSPORT_TIMEOUT,          /**< No response within the configured timeout */
        TRANSPORT_IO,               /**< Disconnect, stall or other link failure */
        PROTOCOL_TRUNCATED,         /**< Response shorter than its header declares */
        PROTOCOL_MALFORMED,         /**< Response does not match the frame shape */
        PROTOCOL_DEVICE_ERROR,      /**< Device explicitly reported a failure */
        ENCODING_PAYLOAD_TOO_LARGE, /**< Command payload above the per-command maximum */
        ENCODING_MISALIGNED,        /**< Length not a multiple of the device block size */
        INVALID_ARGUMENT            /**< Caller passed unusable parameters */
    };

    EverdriveError();
    EverdriveError(Kind kind, const std::string& message);
    EverdriveError(Kind kind, uint8_t device_code, const std::string& message);

    static EverdriveError success() { return EverdriveError(); }
    static EverdriveError deviceError(uint8_t code);

    bool ok() const { return kind_ == OK; }
    Kind kind() const { return kind_; }

    /**
     * @brief Raw code reported by the device.
     *
     * Only meaningful when kind() is PROTOCOL_DEVICE_ERROR.
     */
    uint8_t deviceCode() const { return device_code_; }
    const std::string& message() const { return message_; }

    bool isDeviceError() const;
    bool isTransportError() const;
    bool isProtocolError() const;
    bool isEncodingError() const;

    /**
     * @brief Whether the failure comes from misuse rather than a runtime fault.
     */
    bool isProgrammingError() const;

    const char* kindName() const;
    static const char* kindName(Kind kind);

    std::string toString() const;

private:
    Kind kind_;
    uint8_t device_code_;
    std::string message_;
};

std::ostream& operator<<(std::ostream& os, const EverdriveError& error);
