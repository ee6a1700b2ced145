#pragma once

#include "Transport.hpp"
#include <libusb.h>
#include <vector>
#include <string>
#include <chrono>

/**
 * Transport over the cartridge FTDI bridge, driven directly through libusb
 */
class FtdiTransport : public Transport {
public:
    FtdiTransport(int device_index = 0);
    ~FtdiTransport() override;

    // Transport
    EverdriveError open(uint16_t vendor_id, uint16_t product_id,
                        std::chrono::milliseconds timeout) override;
    void close() override;
    bool isOpen() const override { return device != nullptr; }
    EverdriveError send(const std::vector<uint8_t>& data) override;
    EverdriveError receive(size_t max_len, std::chrono::milliseconds timeout,
                           std::vector<uint8_t>& out) override;
    EverdriveError purge() override;

    /**
     * @brief Encode a baud rate into the FT232 divisor (wValue, wIndex).
     */
    static bool baudDivisor(uint32_t baud, uint16_t& value, uint16_t& index);

    /**
     * @brief Strip the modem status bytes from a raw bulk-in read.
     *
     * Every packet of FTDI_PACKET_SIZE bytes starts with two status bytes.
     */
    static void stripStatusBytes(const uint8_t* raw, size_t raw_len, std::vector<uint8_t>& out);

private:
    libusb_device_handle *device;
    libusb_context *context;
    int device_index;
    unsigned int io_timeout_ms;
    std::vector<uint8_t> pending; // bytes read past the last receive() request

    bool configureChip();
    bool controlOut(uint8_t request, uint16_t value, uint16_t index);
    static EverdriveError usbError(int ret, const std::string& what);
};
