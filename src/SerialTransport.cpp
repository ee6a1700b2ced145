#include "SerialTransport.hpp"
#include "EverdriveConfig.hpp"
#include "EverdriveLog.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <poll.h>
#include <dirent.h>
#include <climits>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <sys/file.h>
#ifdef __linux__
#include <termios.h>
#endif
#include <fstream>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <vector>

SerialTransport::SerialTransport(const std::string& device, uint32_t baud_rate)
    : device_path(device),
      baud_rate(baud_rate),
      fd(-1),
      io_timeout_ms(EverdriveConfig::USB_TIMEOUT)
{
#ifndef __linux__
    std::cerr << "Warning: SerialTransport implementation is only available on Linux systems." << std::endl;
#endif
}

SerialTransport::~SerialTransport() {
    close();
}

bool SerialTransport::readHexAttribute(const std::string& path, uint16_t& value) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string text;
    file >> text;
    if (text.empty()) {
        return false;
    }

    char* end = nullptr;
    unsigned long parsed = std::strtoul(text.c_str(), &end, 16);
    if (end == text.c_str() || parsed > 0xFFFF) {
        return false;
    }

    value = static_cast<uint16_t>(parsed);
    return true;
}

bool SerialTransport::findTtyByUsbId(const std::string& tty_class_root,
                                     uint16_t vendor_id, uint16_t product_id,
                                     std::string& dev_path) {
    DIR* dir = opendir(tty_class_root.c_str());
    if (dir == nullptr) {
        return false;
    }

    std::vector<std::string> names;
    while (struct dirent* entry = readdir(dir)) {
        std::string name = entry->d_name;
        if (name.compare(0, 6, "ttyUSB") == 0) {
            names.push_back(name);
        }
    }
    closedir(dir);

    // ttyUSB0 before ttyUSB1
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        std::string link = tty_class_root + "/" + name + "/device";
        char resolved[PATH_MAX];
        if (realpath(link.c_str(), resolved) == nullptr) {
            continue;
        }

        // Walk up from the tty's device node to the USB device carrying idVendor
        std::string current = resolved;
        for (int depth = 0; depth < 4 && !current.empty(); depth++) {
            uint16_t vid = 0;
            uint16_t pid = 0;
            if (readHexAttribute(current + "/idVendor", vid) &&
                readHexAttribute(current + "/idProduct", pid)) {
                if (vid == vendor_id && pid == product_id) {
                    dev_path = "/dev/" + name;
                    return true;
                }
                break;
            }

            size_t slash = current.find_last_of('/');
            if (slash == std::string::npos || slash == 0) {
                break;
            }
            current = current.substr(0, slash);
        }
    }

    return false;
}

EverdriveError SerialTransport::open(uint16_t vendor_id, uint16_t product_id,
                                     std::chrono::milliseconds timeout) {
#ifdef __linux__
    if (fd >= 0) {
        return EverdriveError(EverdriveError::DEVICE_BUSY, "Transport already open");
    }

    io_timeout_ms = timeout.count() > 0 ? static_cast<unsigned int>(timeout.count())
                                        : EverdriveConfig::USB_TIMEOUT;

    std::string path = device_path;
    if (path.empty()) {
        if (!findTtyByUsbId("/sys/class/tty", vendor_id, product_id, path)) {
            return EverdriveError(EverdriveError::DEVICE_NOT_FOUND, "Everdrive USB device not found");
        }
        DEBUG_PRINTLN("Found Everdrive tty: " << path);
    }

    fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        int err = errno;
        std::cerr << "Error: could not open tty " << path << ": " << std::strerror(err) << std::endl;
        if (err == ENOENT || err == ENODEV || err == ENXIO) {
            return EverdriveError(EverdriveError::DEVICE_NOT_FOUND, "No tty at " + path);
        }
        return EverdriveError(EverdriveError::DEVICE_BUSY, path + ": " + std::strerror(err));
    }

    // One session per tty
    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        std::cerr << "Error: tty " << path << " is in use" << std::endl;
        ::close(fd);
        fd = -1;
        return EverdriveError(EverdriveError::DEVICE_BUSY, path + " is locked by another process");
    }

    if (!configureTty()) {
        ::close(fd);
        fd = -1;
        return EverdriveError(EverdriveError::DEVICE_BUSY, "Could not configure " + path);
    }

    device_path = path;
    return EverdriveError::success();
#else
    (void)vendor_id;
    (void)product_id;
    (void)timeout;
    return EverdriveError(EverdriveError::DEVICE_NOT_FOUND, "Serial transport not supported on this platform");
#endif
}

bool SerialTransport::configureTty() {
#ifdef __linux__
    struct termios tty;
    if (tcgetattr(fd, &tty) != 0) {
        std::cerr << "Error: tcgetattr failed: " << std::strerror(errno) << std::endl;
        return false;
    }

    speed_t speed;
    switch (baud_rate) {
        case 9600: speed = B9600; break;
        case 19200: speed = B19200; break;
        case 38400: speed = B38400; break;
        case 57600: speed = B57600; break;
        case 115200: speed = B115200; break;
        case 230400: speed = B230400; break;
        case 460800: speed = B460800; break;
        case 921600: speed = B921600; break;
        default:
            std::cerr << "Error: unsupported baud rate " << baud_rate << std::endl;
            return false;
    }

    cfmakeraw(&tty);
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~CRTSCTS;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tty) != 0) {
        std::cerr << "Error: tcsetattr failed: " << std::strerror(errno) << std::endl;
        return false;
    }

    tcflush(fd, TCIOFLUSH);
    return true;
#else
    return false;
#endif
}

void SerialTransport::close() {
    if (fd >= 0) {
        flock(fd, LOCK_UN);
        ::close(fd);
        fd = -1;
        DEBUG_PRINTLN("Closed tty " << device_path);
    }
}

EverdriveError SerialTransport::send(const std::vector<uint8_t>& data) {
    if (fd < 0) {
        return EverdriveError(EverdriveError::TRANSPORT_IO, "Transport not open");
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(io_timeout_ms);
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
        if (written > 0) {
            offset += static_cast<size_t>(written);
            continue;
        }
        if (written < 0 && errno != EAGAIN && errno != EINTR) {
            std::cerr << "Error: tty write failed: " << std::strerror(errno) << std::endl;
            return EverdriveError(EverdriveError::TRANSPORT_IO, std::string("tty write failed: ") + std::strerror(errno));
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            if (offset > 0) {
                // Part of the command is already on the wire
                return EverdriveError(EverdriveError::TRANSPORT_IO,
                                      "tty write timed out after " + std::to_string(offset) + " bytes");
            }
            return EverdriveError(EverdriveError::TRANSPORT_TIMEOUT, "tty write timed out");
        }

        struct pollfd pfd = {fd, POLLOUT, 0};
        if (poll(&pfd, 1, static_cast<int>(remaining.count())) < 0 && errno != EINTR) {
            return EverdriveError(EverdriveError::TRANSPORT_IO, std::string("poll failed: ") + std::strerror(errno));
        }
    }

    return EverdriveError::success();
}

EverdriveError SerialTransport::receive(size_t max_len, std::chrono::milliseconds timeout,
                                        std::vector<uint8_t>& out) {
    out.clear();
    if (fd < 0) {
        return EverdriveError(EverdriveError::TRANSPORT_IO, "Transport not open");
    }

    out.resize(max_len);
    size_t received = 0;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (received < max_len) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        struct pollfd pfd = {fd, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            out.clear();
            return EverdriveError(EverdriveError::TRANSPORT_IO, std::string("poll failed: ") + std::strerror(errno));
        }
        if (ready == 0) {
            break;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            out.clear();
            return EverdriveError(EverdriveError::TRANSPORT_IO, "tty hung up");
        }

        ssize_t n = ::read(fd, out.data() + received, max_len - received);
        if (n > 0) {
            received += static_cast<size_t>(n);
        } else if (n == 0) {
            out.clear();
            return EverdriveError(EverdriveError::TRANSPORT_IO, "tty closed by device");
        } else if (errno != EAGAIN && errno != EINTR) {
            std::cerr << "Error: tty read failed: " << std::strerror(errno) << std::endl;
            out.clear();
            return EverdriveError(EverdriveError::TRANSPORT_IO, std::string("tty read failed: ") + std::strerror(errno));
        }
    }

    out.resize(received);
    if (received == 0 && max_len > 0) {
        return EverdriveError(EverdriveError::TRANSPORT_TIMEOUT,
                              "No response within " + std::to_string(timeout.count()) + " ms");
    }

    return EverdriveError::success();
}

EverdriveError SerialTransport::purge() {
    if (fd < 0) {
        return EverdriveError(EverdriveError::TRANSPORT_IO, "Transport not open");
    }
#ifdef __linux__
    if (tcflush(fd, TCIFLUSH) != 0) {
        return EverdriveError(EverdriveError::TRANSPORT_IO, std::string("tcflush failed: ") + std::strerror(errno));
    }
    return EverdriveError::success();
#else
    return EverdriveError(EverdriveError::TRANSPORT_IO, "tcflush not available");
#endif
}
