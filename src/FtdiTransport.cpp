/**
 * @file FtdiTransport.cpp
 * @brief Implementation of the FtdiTransport class for talking to the cartridge over its FT232 bridge.
 *
 * The cartridge exposes a plain FT232 USB-serial chip. Instead of going through the
 * kernel ftdi_sio driver this class claims the interface with libusb, programs the
 * SIO engine (reset, 115200 8N1, latency timer, purge) and moves bytes with bulk
 * transfers, stripping the two modem status bytes FTDI prepends to every IN packet.
 */

#include "FtdiTransport.hpp"
#include "EverdriveConfig.hpp"
#include "EverdriveLog.hpp"
#include <iostream>
#include <algorithm>

FtdiTransport::FtdiTransport(int device_index)
    : device(nullptr),
      context(nullptr),
      device_index(device_index),
      io_timeout_ms(EverdriveConfig::USB_TIMEOUT)
{
    // Initialize libusb context
    int ret = libusb_init(&context);
    if (ret != 0)
    {
        std::cerr << "Failed to initialize libusb: " << libusb_error_name(ret) << std::endl;
        context = nullptr;
    }
}

FtdiTransport::~FtdiTransport()
{
    // Ensure device is closed
    close();

    // Free libusb context
    if (context)
    {
        libusb_exit(context);
        context = nullptr;
    }
}

EverdriveError FtdiTransport::usbError(int ret, const std::string& what)
{
    std::string message = what + ": " + libusb_error_name(ret);
    switch (ret)
    {
    case LIBUSB_ERROR_TIMEOUT:
        return EverdriveError(EverdriveError::TRANSPORT_TIMEOUT, message);
    case LIBUSB_ERROR_BUSY:
    case LIBUSB_ERROR_ACCESS:
        return EverdriveError(EverdriveError::DEVICE_BUSY, message);
    default:
        return EverdriveError(EverdriveError::TRANSPORT_IO, message);
    }
}

EverdriveError FtdiTransport::open(uint16_t vendor_id, uint16_t product_id,
                                   std::chrono::milliseconds timeout)
{
    if (!context)
    {
        return EverdriveError(EverdriveError::TRANSPORT_IO, "libusb not initialized");
    }

    if (device)
    {
        return EverdriveError(EverdriveError::DEVICE_BUSY, "Transport already open");
    }

    io_timeout_ms = timeout.count() > 0 ? static_cast<unsigned int>(timeout.count())
                                        : EverdriveConfig::USB_TIMEOUT;

    try
    {
        // Get list of devices
        libusb_device **device_list;
        ssize_t count = libusb_get_device_list(context, &device_list);
        if (count < 0)
        {
            std::cerr << "Failed to get device list: " << libusb_error_name(count) << std::endl;
            return usbError(static_cast<int>(count), "Failed to get device list");
        }

        // Find matching bridges
        std::vector<libusb_device *> matches;
        for (ssize_t i = 0; i < count; i++)
        {
            libusb_device *dev = device_list[i];
            libusb_device_descriptor desc;

            int ret = libusb_get_device_descriptor(dev, &desc);
            if (ret < 0)
                continue;

            if (desc.idVendor == vendor_id && desc.idProduct == product_id)
            {
                matches.push_back(dev);
            }
        }

        if (matches.empty())
        {
            libusb_free_device_list(device_list, 1);
            return EverdriveError(EverdriveError::DEVICE_NOT_FOUND, "Everdrive USB device not found");
        }

        if (device_index < 0 || device_index >= static_cast<int>(matches.size()))
        {
            libusb_free_device_list(device_list, 1);
            return EverdriveError(EverdriveError::DEVICE_NOT_FOUND,
                                  "Device index " + std::to_string(device_index) + " out of range, only " +
                                      std::to_string(matches.size()) + " devices found");
        }

        // Open selected device
        int ret = libusb_open(matches[device_index], &device);
        libusb_free_device_list(device_list, 1);

        if (ret != 0)
        {
            device = nullptr;
            std::cerr << "Failed to open device: " << libusb_error_name(ret) << std::endl;
            // Present but unopenable
            return EverdriveError(EverdriveError::DEVICE_BUSY,
                                  std::string("Failed to open device: ") + libusb_error_name(ret));
        }

        // ftdi_sio usually owns the interface
        libusb_set_auto_detach_kernel_driver(device, 1);

        // Claim interface
        ret = libusb_claim_interface(device, EverdriveConfig::USB_INTERFACE);
        if (ret != 0)
        {
            std::cerr << "Failed to claim interface: " << libusb_error_name(ret) << std::endl;
            libusb_close(device);
            device = nullptr;
            return EverdriveError(EverdriveError::DEVICE_BUSY,
                                  std::string("Failed to claim interface: ") + libusb_error_name(ret));
        }

        if (!configureChip())
        {
            close();
            return EverdriveError(EverdriveError::DEVICE_BUSY, "Failed to configure FTDI bridge");
        }

        pending.clear();
        DEBUG_PRINTLN("FTDI bridge " << std::hex << vendor_id << ":" << product_id << std::dec
                      << " opened (index " << device_index << ")");
        return EverdriveError::success();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Exception in open: " << e.what() << std::endl;
        if (device)
        {
            libusb_close(device);
            device = nullptr;
        }
        return EverdriveError(EverdriveError::TRANSPORT_IO, e.what());
    }
}

void FtdiTransport::close()
{
    if (device)
    {
        libusb_release_interface(device, EverdriveConfig::USB_INTERFACE);
        libusb_close(device);
        device = nullptr;
        DEBUG_PRINTLN("FTDI bridge closed");
    }
    pending.clear();
}

bool FtdiTransport::controlOut(uint8_t request, uint16_t value, uint16_t index)
{
    int ret = libusb_control_transfer(device, EverdriveConfig::FTDI_REQTYPE_OUT, request,
                                      value, index, nullptr, 0,
                                      EverdriveConfig::CONTROL_TIMEOUT);
    if (ret < 0)
    {
        std::cerr << "FTDI control request 0x" << std::hex << static_cast<int>(request) << std::dec
                  << " failed: " << libusb_error_name(ret) << std::endl;
        return false;
    }
    return true;
}

bool FtdiTransport::baudDivisor(uint32_t baud, uint16_t& value, uint16_t& index)
{
    // Sub-integer divisor codes for 0, 1/8, 2/8 ... 7/8
    static const uint8_t frac_code[8] = {0, 3, 2, 4, 1, 5, 6, 7};

    if (baud == 0)
        return false;

    uint32_t divisor8 = (EverdriveConfig::FTDI_BASE_CLOCK * 8 + baud / 2) / baud;
    uint32_t integer = divisor8 >> 3;
    if (integer == 0 || integer > 0x3FFF)
        return false;

    uint8_t code = frac_code[divisor8 & 0x07];
    value = static_cast<uint16_t>(integer | ((code & 0x03) << 14));
    index = static_cast<uint16_t>((code >> 2) & 0x01);
    return true;
}

bool FtdiTransport::configureChip()
{
    if (!device)
        return false;

    uint16_t baud_value = 0;
    uint16_t baud_index = 0;
    if (!baudDivisor(EverdriveConfig::BAUD_RATE, baud_value, baud_index))
        return false;

    return controlOut(EverdriveConfig::SIO_RESET, EverdriveConfig::SIO_RESET_SIO, 0) &&
           controlOut(EverdriveConfig::SIO_SET_BAUDRATE, baud_value, baud_index) &&
           controlOut(EverdriveConfig::SIO_SET_DATA, EverdriveConfig::SIO_DATA_8N1, 0) &&
           controlOut(EverdriveConfig::SIO_SET_FLOW_CTRL, 0, 0) &&
           controlOut(EverdriveConfig::SIO_SET_LATENCY_TIMER, EverdriveConfig::FTDI_LATENCY_MS, 0) &&
           controlOut(EverdriveConfig::SIO_RESET, EverdriveConfig::SIO_RESET_PURGE_RX, 0) &&
           controlOut(EverdriveConfig::SIO_RESET, EverdriveConfig::SIO_RESET_PURGE_TX, 0);
}

void FtdiTransport::stripStatusBytes(const uint8_t* raw, size_t raw_len, std::vector<uint8_t>& out)
{
    for (size_t packet = 0; packet < raw_len; packet += EverdriveConfig::FTDI_PACKET_SIZE)
    {
        size_t packet_len = std::min(EverdriveConfig::FTDI_PACKET_SIZE, raw_len - packet);
        if (packet_len <= EverdriveConfig::FTDI_STATUS_BYTES)
            continue;

        out.insert(out.end(), raw + packet + EverdriveConfig::FTDI_STATUS_BYTES, raw + packet + packet_len);
    }
}

EverdriveError FtdiTransport::send(const std::vector<uint8_t>& data)
{
    if (!device)
    {
        return EverdriveError(EverdriveError::TRANSPORT_IO, "Transport not open");
    }

    size_t offset = 0;
    while (offset < data.size())
    {
        int transferred = 0;
        int chunk = static_cast<int>(std::min<size_t>(data.size() - offset, 0x4000));
        int ret = libusb_bulk_transfer(device, EverdriveConfig::BULK_WRITE_EP,
                                       const_cast<uint8_t *>(data.data() + offset), chunk,
                                       &transferred, io_timeout_ms);

        offset += static_cast<size_t>(transferred);
        if (ret != 0)
        {
            std::cerr << "Error in bulk write: " << libusb_error_name(ret) << std::endl;
            if (ret == LIBUSB_ERROR_TIMEOUT && offset > 0)
            {
                // The device holds half a command now
                return EverdriveError(EverdriveError::TRANSPORT_IO,
                                      "Bulk write timed out after " + std::to_string(offset) + " of " +
                                          std::to_string(data.size()) + " bytes");
            }
            return usbError(ret, "Bulk write failed");
        }
    }

    return EverdriveError::success();
}

EverdriveError FtdiTransport::purge()
{
    if (!device)
    {
        return EverdriveError(EverdriveError::TRANSPORT_IO, "Transport not open");
    }

    pending.clear();
    if (!controlOut(EverdriveConfig::SIO_RESET, EverdriveConfig::SIO_RESET_PURGE_RX, 0))
    {
        return EverdriveError(EverdriveError::TRANSPORT_IO, "Failed to purge the FTDI receive buffer");
    }
    return EverdriveError::success();
}

EverdriveError FtdiTransport::receive(size_t max_len, std::chrono::milliseconds timeout,
                                      std::vector<uint8_t>& out)
{
    out.clear();
    if (!device)
    {
        return EverdriveError(EverdriveError::TRANSPORT_IO, "Transport not open");
    }

    // Serve what is left over from the previous read first
    size_t take = std::min(max_len, pending.size());
    out.insert(out.end(), pending.begin(), pending.begin() + take);
    pending.erase(pending.begin(), pending.begin() + take);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<uint8_t> raw(EverdriveConfig::FTDI_READ_BUFFER);
    std::vector<uint8_t> data;

    while (out.size() < max_len)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            break;

        int transferred = 0;
        int ret = libusb_bulk_transfer(device, EverdriveConfig::BULK_READ_EP,
                                       raw.data(), static_cast<int>(raw.size()), &transferred,
                                       static_cast<unsigned int>(remaining.count()));

        if (ret == LIBUSB_ERROR_TIMEOUT && transferred == 0)
            break;

        if (ret != 0 && ret != LIBUSB_ERROR_TIMEOUT)
        {
            std::cerr << "Error in bulk read: " << libusb_error_name(ret) << std::endl;
            return usbError(ret, "Bulk read failed");
        }

        data.clear();
        stripStatusBytes(raw.data(), static_cast<size_t>(transferred), data);

        size_t wanted = max_len - out.size();
        if (data.size() > wanted)
        {
            out.insert(out.end(), data.begin(), data.begin() + wanted);
            pending.insert(pending.end(), data.begin() + wanted, data.end());
        }
        else
        {
            out.insert(out.end(), data.begin(), data.end());
        }
    }

    if (out.empty() && max_len > 0)
    {
        return EverdriveError(EverdriveError::TRANSPORT_TIMEOUT,
                              "No response within " + std::to_string(timeout.count()) + " ms");
    }

    return EverdriveError::success();
}
