#ifndef EVERDRIVE_CONFIG_HPP
#define EVERDRIVE_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace EverdriveConfig
{
    // Device identifiers (FT232 bridge on the cartridge)
    constexpr uint16_t VENDOR_ID = 0x0403;
    constexpr uint16_t PRODUCT_ID = 0x6001;

    // Endpoints
    constexpr uint8_t BULK_WRITE_EP = 0x02;
    constexpr uint8_t BULK_READ_EP = 0x81;
    constexpr int USB_INTERFACE = 0;

    // FTDI packets carry two modem status bytes in front of the data
    constexpr size_t FTDI_PACKET_SIZE = 64;
    constexpr size_t FTDI_STATUS_BYTES = 2;
    constexpr size_t FTDI_READ_BUFFER = FTDI_PACKET_SIZE * 64;

    // FTDI SIO vendor requests
    constexpr uint8_t FTDI_REQTYPE_OUT = 0x40;
    constexpr uint8_t SIO_RESET = 0x00;
    constexpr uint8_t SIO_SET_FLOW_CTRL = 0x02;
    constexpr uint8_t SIO_SET_BAUDRATE = 0x03;
    constexpr uint8_t SIO_SET_DATA = 0x04;
    constexpr uint8_t SIO_SET_LATENCY_TIMER = 0x09;
    constexpr uint16_t SIO_RESET_SIO = 0;
    constexpr uint16_t SIO_RESET_PURGE_RX = 1;
    constexpr uint16_t SIO_RESET_PURGE_TX = 2;
    constexpr uint16_t SIO_DATA_8N1 = 0x0008;
    constexpr uint8_t FTDI_LATENCY_MS = 1;
    constexpr uint32_t FTDI_BASE_CLOCK = 3000000;

    // Serial link
    constexpr uint32_t BAUD_RATE = 115200;

    // Memory map
    constexpr uint32_t ROM_BASE_ADDR = 0x10000000;
    constexpr uint32_t ROM_BASE_ADDR_EMU = 0x10200000;
    constexpr uint32_t SRAM_BASE_ADDR = 0x08000000;

    // Command protocol
    constexpr uint8_t CMD_PREFIX[3] = {'c', 'm', 'd'};
    constexpr size_t CMD_HEADER_SIZE = 16;
    constexpr size_t RESP_HEADER_SIZE = 4;
    constexpr size_t STATUS_REPLY_SIZE = 16;
    constexpr uint8_t RESP_OK = 'r';
    constexpr uint8_t RESP_ERROR = 'e';
    constexpr uint32_t BLOCK_SIZE = 512;
    constexpr size_t MAX_COMMAND_PAYLOAD = 0x10000;
    constexpr size_t DEFAULT_MAX_CHUNK = 0x8000;
    constexpr size_t APP_NAME_SIZE = 256;

    // Timeouts (ms)
    constexpr unsigned int USB_TIMEOUT = 1000;
    constexpr unsigned int CONTROL_TIMEOUT = 500;
    // Wait for optional trailing reply bytes (status padding)
    constexpr unsigned int TRAILING_BYTES_WAIT = 5;
}

#endif // EVERDRIVE_CONFIG_HPP
