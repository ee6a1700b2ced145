#include "EverdriveLog.hpp"

bool EverdriveLog::isVerbose = false;

void EverdriveLog::dumpHex(const char* label, const uint8_t* data, size_t len, size_t max_bytes)
{
    if (!isVerbose) {
        return;
    }

    std::cout << label << " (" << len << " bytes): ";
    size_t shown = len < max_bytes ? len : max_bytes;
    for (size_t i = 0; i < shown; i++) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(data[i]) << " ";
    }
    if (shown < len) {
        std::cout << "...";
    }
    std::cout << std::dec << std::endl;
}
