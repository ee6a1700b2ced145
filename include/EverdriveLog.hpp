#pragma once

#include <iostream>
#include <iomanip>
#include <cstdint>
#include <cstddef>
#include <vector>

/**
 * Verbose switch shared by the driver and the command-line tool.
 */
class EverdriveLog {
public:
    /**
     * @brief Set verbose mode.
     *
     * @param verbose Whether to enable verbose mode
     */
    static void setVerbose(bool verbose) { isVerbose = verbose; }

    /**
     * @brief Get verbose mode.
     *
     * @return true if verbose mode is enabled, false otherwise
     */
    static bool getVerbose() { return isVerbose; }

    /**
     * @brief Print up to max_bytes of a buffer as hex when verbose.
     */
    static void dumpHex(const char* label, const uint8_t* data, size_t len, size_t max_bytes = 32);
    static void dumpHex(const char* label, const std::vector<uint8_t>& data, size_t max_bytes = 32)
    {
        dumpHex(label, data.data(), data.size(), max_bytes);
    }

private:
    static bool isVerbose;
};

// Debug helper for conditional output
#define DEBUG_PRINT(x) do { if(EverdriveLog::getVerbose()) { std::cout << x; } } while(0)
#define DEBUG_PRINTLN(x) do { if(EverdriveLog::getVerbose()) { std::cout << x << std::endl; } } while(0)
#define DEBUG_HEX(x) do { if(EverdriveLog::getVerbose()) { std::cout << std::hex << (x) << std::dec; } } while(0)
