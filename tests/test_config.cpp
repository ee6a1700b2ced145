/**
 * @file test_config.cpp
 * @brief JSON configuration lookups
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

#include "ConfigManager.hpp"

namespace {

const char* const SAMPLE = R"({
  "connection": {
    "transport": "serial",
    "device": "/dev/ttyUSB3",
    "device_index": 2,
    "baud_rate": 115200,
    "vendor_id": "0x0403",
    "product_id": 24577
  },
  "protocol": { "timeout_ms": 250, "max_chunk": 4096, "block_size": 512 },
  "options": { "verbose": true }
})";

} // namespace

TEST_CASE("Lookups on a loaded configuration")
{
    ConfigManager config("/nonexistent/everdrive.json");
    CHECK_FALSE(config.isLoaded());
    REQUIRE(config.loadFromString(SAMPLE));
    CHECK(config.isLoaded());

    SUBCASE("Strings")
    {
        CHECK(config.getNestedString("connection.transport", "ftdi") == "serial");
        CHECK(config.getNestedString("connection.device") == "/dev/ttyUSB3");
    }

    SUBCASE("Numbers")
    {
        CHECK(config.getNestedInt("connection.device_index") == 2);
        CHECK(config.getNestedInt("protocol.timeout_ms", 1000) == 250);
        CHECK(config.getNestedUInt("protocol.max_chunk") == 4096);
    }

    SUBCASE("USB ids as hex strings or numbers")
    {
        CHECK(config.getNestedUInt("connection.vendor_id") == 0x0403);
        CHECK(config.getNestedUInt("connection.product_id") == 0x6001);
    }

    SUBCASE("Booleans")
    {
        CHECK(config.getNestedBool("options.verbose"));
    }

    SUBCASE("Missing keys and wrong types fall back")
    {
        CHECK(config.getNestedString("connection.nothing", "x") == "x");
        CHECK(config.getNestedInt("connection.transport", 7) == 7);
        CHECK(config.getNestedBool("protocol.timeout_ms", true));
        CHECK(config.getNestedUInt("options.verbose", 9) == 9);
        CHECK(config.getNestedUInt("connection.transport.deeper", 5) == 5);
    }
}

TEST_CASE("Unsigned parsing")
{
    ConfigManager config("/nonexistent/everdrive.json");
    REQUIRE(config.loadFromString(R"({"a": -1, "b": "-5", "c": "0xZZ", "d": "", "e": "1027", "f": 4294967296})"));
    CHECK(config.getNestedUInt("a", 3) == 3);
    CHECK(config.getNestedUInt("b", 3) == 3);
    CHECK(config.getNestedUInt("c", 3) == 3);
    CHECK(config.getNestedUInt("d", 3) == 3);
    CHECK(config.getNestedUInt("e", 3) == 1027);
    CHECK(config.getNestedUInt("f", 3) == 3);
}

TEST_CASE("Bounded unsigned lookups")
{
    ConfigManager config("/nonexistent/everdrive.json");
    REQUIRE(config.loadFromString(R"({"usb": {"vid": "0x0403", "pid": 70000, "big": "0x10403", "bad": "x"}})"));
    uint32_t value = 7;

    SUBCASE("In range")
    {
        CHECK(config.getNestedUInt("usb.vid", 0xFFFF, 1, value));
        CHECK(value == 0x0403);
    }

    SUBCASE("Absent key takes the default")
    {
        CHECK(config.getNestedUInt("usb.serial", 0xFFFF, 0x6001, value));
        CHECK(value == 0x6001);
    }

    SUBCASE("Above the limit is rejected, not truncated")
    {
        CHECK_FALSE(config.getNestedUInt("usb.pid", 0xFFFF, 1, value));
        CHECK_FALSE(config.getNestedUInt("usb.big", 0xFFFF, 1, value));
        CHECK(value == 7);
    }

    SUBCASE("Unparsable is rejected")
    {
        CHECK_FALSE(config.getNestedUInt("usb.bad", 0xFFFF, 1, value));
    }
}

TEST_CASE("Loading")
{
    SUBCASE("Invalid JSON")
    {
        ConfigManager config("/nonexistent/everdrive.json");
        CHECK_FALSE(config.loadFromString("{ not json"));
        CHECK_FALSE(config.isLoaded());
        CHECK(config.getNestedInt("protocol.timeout_ms", 1000) == 1000);
    }

    SUBCASE("Root must be an object")
    {
        ConfigManager config("/nonexistent/everdrive.json");
        CHECK_FALSE(config.loadFromString("[1, 2]"));
    }

    SUBCASE("From a file")
    {
        char path[] = "/tmp/everdrive_config_XXXXXX";
        int fd = mkstemp(path);
        REQUIRE(fd >= 0);
        close(fd);
        {
            std::ofstream out(path);
            out << SAMPLE;
        }

        ConfigManager config(path);
        CHECK(config.isLoaded());
        CHECK(config.getPath() == path);
        CHECK(config.getNestedUInt("protocol.block_size") == 512);

        std::remove(path);
    }
}
