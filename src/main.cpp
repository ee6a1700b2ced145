#include "EverdriveSession.hpp"
#include "EverdriveLog.hpp"
#include "ConfigManager.hpp"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace {

std::atomic<bool> interrupted(false);

void onSignal(int)
{
    interrupted = true;
}

void showHelp()
{
    std::cout << "Usage: everdrive [options] <command> [args]" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  status                            Check the cartridge answers" << std::endl;
    std::cout << "  read <rom|sram> <addr> <len> <file>  Dump memory to a file" << std::endl;
    std::cout << "  write <rom|sram> <addr> <file>    Load a file into memory" << std::endl;
    std::cout << "  fill <addr> <len> <value>         Fill a ROM region with a value" << std::endl;
    std::cout << "  start [save-name]                 Boot the loaded ROM" << std::endl;
    std::cout << "  debug                             Print debug packets until Ctrl+C" << std::endl;
    std::cout << "  send-text <text>                  Send a text packet to the console" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c, --config        Specify configuration file (default: config.json)" << std::endl;
    std::cout << "  -v, --verbose       Enable detailed debug messages" << std::endl;
    std::cout << "  --transport=<type>  Transport: 'ftdi' or 'serial' (overrides config.json)" << std::endl;
    std::cout << "  --device=<path>     Serial tty path (overrides config.json)" << std::endl;
    std::cout << "  --device-index=<n>  FTDI device index (0,1,2...) (overrides config.json)" << std::endl;
    std::cout << "  --timeout=<ms>      Round-trip timeout in ms (overrides config.json)" << std::endl;
    std::cout << "  -h, --help          Show this help" << std::endl;
}

bool parseNumber(const std::string& text, uint32_t& value)
{
    if (text.empty() || text[0] == '-') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = strtoull(text.c_str(), &end, 0);
    if (errno != 0 || *end != '\0' || parsed > 0xFFFFFFFFULL) {
        return false;
    }
    value = static_cast<uint32_t>(parsed);
    return true;
}

bool parseSpace(const std::string& text, MemorySpace& space)
{
    if (text == "rom") {
        space = MemorySpace::ROM;
        return true;
    }
    if (text == "sram") {
        space = MemorySpace::SRAM;
        return true;
    }
    return false;
}

int report(const EverdriveError& error)
{
    std::cerr << "Error: " << error << std::endl;
    return 1;
}

int runStatus(EverdriveSession& ed)
{
    StatusInfo info;
    EverdriveError error = ed.status(info);
    if (!error.ok()) {
        return report(error);
    }
    std::cout << "Everdrive status: " << (info.ok ? "OK" : "not ready") << std::endl;
    EverdriveLog::dumpHex("Status detail", info.detail);
    return 0;
}

int runRead(EverdriveSession& ed, const std::vector<std::string>& args)
{
    MemorySpace space;
    uint32_t address = 0;
    uint32_t length = 0;
    if (args.size() != 4 || !parseSpace(args[0], space) || !parseNumber(args[1], address) ||
        !parseNumber(args[2], length)) {
        std::cerr << "Usage: read <rom|sram> <addr> <len> <file>" << std::endl;
        return 1;
    }

    std::vector<uint8_t> data;
    EverdriveError error = ed.read(space, address, length, data);
    if (!error.ok()) {
        return report(error);
    }

    std::ofstream out(args[3], std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "Error: could not create " << args[3] << std::endl;
        return 1;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        std::cerr << "Error: failed writing " << args[3] << std::endl;
        return 1;
    }

    std::cout << "Read " << data.size() << " bytes from " << memorySpaceName(space) << std::endl;
    return 0;
}

int runWrite(EverdriveSession& ed, const std::vector<std::string>& args)
{
    MemorySpace space;
    uint32_t address = 0;
    if (args.size() != 3 || !parseSpace(args[0], space) || !parseNumber(args[1], address)) {
        std::cerr << "Usage: write <rom|sram> <addr> <file>" << std::endl;
        return 1;
    }

    std::ifstream in(args[2], std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "Error: could not open " << args[2] << std::endl;
        return 1;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    // The device only takes whole blocks
    size_t block = ed.getOptions().block_size;
    if (data.size() % block != 0) {
        size_t padded = (data.size() / block + 1) * block;
        DEBUG_PRINTLN("Padding " << data.size() << " bytes to " << padded);
        data.resize(padded, 0);
    }

    EverdriveError error = ed.write(space, address, data);
    if (!error.ok()) {
        return report(error);
    }

    std::cout << "Wrote " << data.size() << " bytes to " << memorySpaceName(space) << std::endl;
    return 0;
}

int runFill(EverdriveSession& ed, const std::vector<std::string>& args)
{
    uint32_t address = 0;
    uint32_t length = 0;
    uint32_t value = 0;
    if (args.size() != 3 || !parseNumber(args[0], address) || !parseNumber(args[1], length) ||
        !parseNumber(args[2], value)) {
        std::cerr << "Usage: fill <addr> <len> <value>" << std::endl;
        return 1;
    }

    EverdriveError error = ed.romFill(address, length, value);
    if (!error.ok()) {
        return report(error);
    }

    std::cout << "Filled " << length << " bytes" << std::endl;
    return 0;
}

int runStart(EverdriveSession& ed, const std::vector<std::string>& args)
{
    if (args.size() > 1) {
        std::cerr << "Usage: start [save-name]" << std::endl;
        return 1;
    }

    EverdriveError error = ed.appStart(args.empty() ? std::string() : args[0]);
    if (!error.ok()) {
        return report(error);
    }

    std::cout << "Application started" << std::endl;
    return 0;
}

int runDebug(EverdriveSession& ed)
{
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    std::cout << "Waiting for debug packets, press Ctrl+C to stop" << std::endl;

    while (!interrupted) {
        UnfPacket packet;
        EverdriveError error = ed.unfReceive(packet);
        if (error.kind() == EverdriveError::TRANSPORT_TIMEOUT) {
            continue;
        }
        if (error.isProtocolError()) {
            // Garbage on the line; keep listening
            std::cerr << "Warning: " << error << std::endl;
            continue;
        }
        if (!error.ok()) {
            return report(error);
        }

        if (packet.type() == UnfPacket::TEXT) {
            std::cout << std::string(packet.data().begin(), packet.data().end()) << std::flush;
        } else {
            std::cout << "[" << UnfPacket::dataTypeName(packet.type()) << " packet, "
                      << packet.data().size() << " bytes]" << std::endl;
            EverdriveLog::dumpHex("Data", packet.data());
        }
    }

    std::cout << std::endl << "Stopped" << std::endl;
    return 0;
}

int runSendText(EverdriveSession& ed, const std::vector<std::string>& args)
{
    if (args.size() != 1) {
        std::cerr << "Usage: send-text <text>" << std::endl;
        return 1;
    }

    UnfPacket packet(UnfPacket::TEXT, std::vector<uint8_t>(args[0].begin(), args[0].end()));
    EverdriveError error = ed.unfSend(packet);
    if (!error.ok()) {
        return report(error);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    bool verbose = false;
    std::string configPath = "config.json";

    // Command line options that override config.json
    bool hasTransport = false;
    std::string cmdTransport;
    bool hasDevicePath = false;
    std::string cmdDevicePath;
    bool hasDeviceIndex = false;
    uint32_t cmdDeviceIndex = 0;
    bool hasTimeout = false;
    uint32_t cmdTimeout = 0;

    std::string command;
    std::vector<std::string> commandArgs;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (!command.empty()) {
            commandArgs.push_back(arg);
        }
        else if (arg == "-h" || arg == "--help") {
            showHelp();
            return 0;
        }
        else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configPath = argv[i + 1];
                i++;
            } else {
                std::cerr << "Error: Missing configuration file path" << std::endl;
                return 1;
            }
        }
        else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        }
        else if (arg.find("--transport=") == 0) {
            cmdTransport = arg.substr(12);
            hasTransport = true;
            if (cmdTransport != "ftdi" && cmdTransport != "serial") {
                std::cerr << "Error: Invalid transport. Use 'ftdi' or 'serial'" << std::endl;
                return 1;
            }
        }
        else if (arg.find("--device=") == 0) {
            cmdDevicePath = arg.substr(9);
            hasDevicePath = true;
        }
        else if (arg.find("--device-index=") == 0) {
            if (!parseNumber(arg.substr(15), cmdDeviceIndex)) {
                std::cerr << "Error: Invalid device index" << std::endl;
                return 1;
            }
            hasDeviceIndex = true;
        }
        else if (arg.find("--timeout=") == 0) {
            if (!parseNumber(arg.substr(10), cmdTimeout) || cmdTimeout == 0) {
                std::cerr << "Error: Invalid timeout" << std::endl;
                return 1;
            }
            hasTimeout = true;
        }
        else if (arg[0] == '-') {
            std::cerr << "Unknown argument: " << arg << std::endl;
            showHelp();
            return 1;
        }
        else {
            command = arg;
        }
    }

    if (command.empty()) {
        showHelp();
        return 1;
    }

    static const char* const commands[] = {"status", "read", "write", "fill", "start", "debug", "send-text"};
    bool known = false;
    for (const char* name : commands) {
        known = known || command == name;
    }
    if (!known) {
        std::cerr << "Unknown command: " << command << std::endl;
        showHelp();
        return 1;
    }

    ConfigManager config(configPath);

    std::string transport_type = config.getNestedString("connection.transport", "ftdi");
    std::string device_path = config.getNestedString("connection.device", "");
    uint32_t device_index = config.getNestedUInt("connection.device_index", 0);
    uint32_t baud_rate = config.getNestedUInt("connection.baud_rate", EverdriveConfig::BAUD_RATE);

    uint32_t vendor_id = 0;
    uint32_t product_id = 0;
    if (!config.getNestedUInt("connection.vendor_id", 0xFFFF, EverdriveConfig::VENDOR_ID, vendor_id) ||
        !config.getNestedUInt("connection.product_id", 0xFFFF, EverdriveConfig::PRODUCT_ID, product_id)) {
        std::cerr << "Error: Invalid USB id in " << configPath << std::endl;
        return 1;
    }

    SessionOptions options;
    options.vendor_id = static_cast<uint16_t>(vendor_id);
    options.product_id = static_cast<uint16_t>(product_id);
    options.timeout = std::chrono::milliseconds(
        config.getNestedUInt("protocol.timeout_ms", EverdriveConfig::USB_TIMEOUT));
    options.max_chunk = config.getNestedUInt("protocol.max_chunk", EverdriveConfig::DEFAULT_MAX_CHUNK);
    options.block_size = config.getNestedUInt("protocol.block_size", EverdriveConfig::BLOCK_SIZE);

    verbose = verbose || config.getNestedBool("options.verbose", false);
    EverdriveLog::setVerbose(verbose);

    if (hasTransport) {
        transport_type = cmdTransport;
        DEBUG_PRINTLN("Overriding transport with command line value: " << transport_type);
    }

    if (hasDevicePath) {
        device_path = cmdDevicePath;
        DEBUG_PRINTLN("Overriding serial device with command line value: " << device_path);
    }

    if (hasDeviceIndex) {
        device_index = cmdDeviceIndex;
        DEBUG_PRINTLN("Overriding FTDI device index with command line value: " << device_index);
    }

    if (hasTimeout) {
        options.timeout = std::chrono::milliseconds(cmdTimeout);
        DEBUG_PRINTLN("Overriding timeout with command line value: " << cmdTimeout << " ms");
    }

    DEBUG_PRINTLN("Final configuration:");
    DEBUG_PRINT("  Transport: " << transport_type);
    if (transport_type == "ftdi") {
        DEBUG_PRINTLN(" (index: " << device_index << ")");
    } else {
        DEBUG_PRINTLN(" (device: " << (device_path.empty() ? "auto" : device_path)
                      << ", baud: " << baud_rate << ")");
    }
    DEBUG_PRINT("  USB id: ");
    DEBUG_HEX(options.vendor_id);
    DEBUG_PRINT(":");
    DEBUG_HEX(options.product_id);
    DEBUG_PRINTLN("");
    DEBUG_PRINTLN("  Timeout: " << options.timeout.count() << " ms");
    DEBUG_PRINTLN("  Chunk: " << options.max_chunk << " bytes, block: " << options.block_size);

    std::unique_ptr<Transport> transport;
    if (transport_type == "ftdi") {
        transport = TransportFactory::createFtdiTransport(static_cast<int>(device_index));
    }
    else if (transport_type == "serial") {
        transport = TransportFactory::createSerialTransport(device_path, baud_rate);
    }
    else {
        std::cerr << "Unsupported transport type: " << transport_type << std::endl;
        return 1;
    }

    std::unique_ptr<EverdriveSession> ed;
    EverdriveError error = EverdriveSession::open(std::move(transport), options, ed);
    if (!error.ok()) {
        std::cerr << "Failed to open Everdrive: " << error << std::endl;
        return 1;
    }

    if (command == "status") {
        return runStatus(*ed);
    }
    if (command == "read") {
        return runRead(*ed, commandArgs);
    }
    if (command == "write") {
        return runWrite(*ed, commandArgs);
    }
    if (command == "fill") {
        return runFill(*ed, commandArgs);
    }
    if (command == "start") {
        return runStart(*ed, commandArgs);
    }
    if (command == "debug") {
        return runDebug(*ed);
    }
    return runSendText(*ed, commandArgs);
}
