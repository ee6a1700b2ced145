/**
 * @brief Implementation of Transport using the kernel USB-serial driver
 *
 * This class talks to the cartridge through the tty the ftdi_sio driver
 * creates for it (/dev/ttyUSBn). The tty is either given explicitly or found
 * by matching the USB vendor/product id of its parent device in sysfs.
 *
 * @note This class is designed to work on Linux systems.
 */
#pragma once

#include "Transport.hpp"
#include <string>
#include <chrono>

/**
 * @class SerialTransport
 * @brief Raw 8N1 tty transport with poll()-bounded reads.
 */
class SerialTransport : public Transport {
    public:
    /**
     * @brief Constructs a new SerialTransport object.
     *
     * @param device The tty path, or empty to discover it by USB id.
     * @param baud_rate The line speed (default is 115200).
     */
    SerialTransport(const std::string& device = std::string(),
                    uint32_t baud_rate = 115200);

    ~SerialTransport() override;

    /**
     * @brief Opens the tty.
     *
     * When no path was given the tty is looked up under /sys/class/tty.
     * The tty is locked with flock() so a second session cannot share it.
     *
     * @return DEVICE_NOT_FOUND if no tty matches, DEVICE_BUSY if it cannot be
     *         opened, locked or configured.
     */
    EverdriveError open(uint16_t vendor_id, uint16_t product_id,
                        std::chrono::milliseconds timeout) override;

    /**
     * @brief Closes the tty and drops the lock.
     */
    void close() override;

    bool isOpen() const override { return fd >= 0; }

    EverdriveError send(const std::vector<uint8_t>& data) override;

    EverdriveError receive(size_t max_len, std::chrono::milliseconds timeout,
                           std::vector<uint8_t>& out) override;

    /**
     * @brief Discards input queued in the tty (tcflush).
     */
    EverdriveError purge() override;

    /**
     * @brief Finds the tty whose USB parent matches vendor_id:product_id.
     *
     * @param tty_class_root Directory holding the ttyUSB* entries (normally /sys/class/tty).
     * @param vendor_id The USB vendor id.
     * @param product_id The USB product id.
     * @param dev_path Receives "/dev/ttyUSBn" on success.
     * @return true if a matching tty was found.
     */
    static bool findTtyByUsbId(const std::string& tty_class_root,
                               uint16_t vendor_id, uint16_t product_id,
                               std::string& dev_path);

    const std::string& devicePath() const { return device_path; }

private:
    std::string device_path;
    uint32_t baud_rate;
    int fd;
    unsigned int io_timeout_ms;

    /**
     * @brief Puts the tty in raw 8N1 mode at baud_rate.
     *
     * @return true if the tty was configured.
     */
    bool configureTty();

    /**
     * @brief Reads a sysfs attribute holding a hex number.
     */
    static bool readHexAttribute(const std::string& path, uint16_t& value);
};
