#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <chrono>
#include "EverdriveError.hpp"

/**
 * Abstract byte pipe to the cartridge.
 *
 * A transport only moves bytes; framing and sequencing belong to the session.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Find and open the device.
     *
     * @return DEVICE_NOT_FOUND when nothing matches, DEVICE_BUSY when the
     *         device exists but cannot be opened or claimed.
     */
    virtual EverdriveError open(uint16_t vendor_id, uint16_t product_id,
                                std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /**
     * @brief Write all bytes or fail.
     */
    virtual EverdriveError send(const std::vector<uint8_t>& data) = 0;

    /**
     * @brief Collect up to max_len bytes before the deadline.
     *
     * Returns TRANSPORT_TIMEOUT when no byte arrived. When some bytes arrived
     * but not max_len, returns OK with the short buffer.
     */
    virtual EverdriveError receive(size_t max_len, std::chrono::milliseconds timeout,
                                   std::vector<uint8_t>& out) = 0;

    /**
     * @brief Drop every received byte not yet handed out by receive().
     */
    virtual EverdriveError purge() = 0;
};

/**
 * Factory for the concrete transports
 */
class TransportFactory {
public:
    static std::unique_ptr<Transport> createFtdiTransport(int device_index = 0);
    static std::unique_ptr<Transport> createSerialTransport(const std::string& device = std::string(),
                                                            uint32_t baud_rate = 115200);
};
