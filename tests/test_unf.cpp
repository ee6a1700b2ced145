/**
 * @file test_unf.cpp
 * @brief Debug-channel packet framing
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <string>
#include <vector>

#include "UnfPacket.hpp"

TEST_CASE("Packet encoding")
{
    SUBCASE("Even size has no alignment byte")
    {
        UnfPacket packet(UnfPacket::TEXT, {'h', 'i'});
        std::vector<uint8_t> out;
        REQUIRE(packet.encode(out).ok());
        const std::vector<uint8_t> expected = {'D', 'M', 'A', '@', 0x01, 0x00, 0x00, 0x02,
                                               'h', 'i', 'C', 'M', 'P', 'H'};
        CHECK(out == expected);
    }

    SUBCASE("Odd size is padded with 0xFF")
    {
        UnfPacket packet(UnfPacket::BINARY, {1, 2, 3});
        std::vector<uint8_t> out;
        REQUIRE(packet.encode(out).ok());
        REQUIRE(out.size() == 8 + 3 + 1 + 4);
        CHECK(out[4] == 0x02);
        CHECK(out[7] == 0x03);
        CHECK(out[11] == 0xFF);
        CHECK(std::string(out.end() - 4, out.end()) == "CMPH");
    }

    SUBCASE("Empty packet")
    {
        UnfPacket packet(UnfPacket::HEARTBEAT, {});
        std::vector<uint8_t> out;
        REQUIRE(packet.encode(out).ok());
        CHECK(out.size() == 12);
    }

    SUBCASE("Data beyond 24 bits of size")
    {
        UnfPacket packet(UnfPacket::BINARY, std::vector<uint8_t>(UnfPacket::MAX_DATA_SIZE + 1));
        std::vector<uint8_t> out;
        CHECK(packet.encode(out).kind() == EverdriveError::ENCODING_PAYLOAD_TOO_LARGE);
    }
}

TEST_CASE("Packet decoding")
{
    UnfPacket packet;

    SUBCASE("Text packet")
    {
        REQUIRE(UnfPacket::decode({'D', 'M', 'A', '@', 0x01, 0x00, 0x00, 0x05,
                                   'h', 'e', 'l', 'l', 'o', 'C', 'M', 'P', 'H'}, packet).ok());
        CHECK(packet.type() == UnfPacket::TEXT);
        CHECK(std::string(packet.data().begin(), packet.data().end()) == "hello");
    }

    SUBCASE("Unknown type is kept as unknown")
    {
        REQUIRE(UnfPacket::decode({'D', 'M', 'A', '@', 0x42, 0x00, 0x00, 0x00, 'C', 'M', 'P', 'H'}, packet).ok());
        CHECK(packet.type() == UnfPacket::UNKNOWN);
        CHECK(std::string(UnfPacket::dataTypeName(packet.type())) == "unknown");
    }

    SUBCASE("Bad magic")
    {
        CHECK(UnfPacket::decode({'D', 'M', 'A', '#', 0x01, 0x00, 0x00, 0x00, 'C', 'M', 'P', 'H'}, packet).kind() ==
              EverdriveError::PROTOCOL_MALFORMED);
    }

    SUBCASE("Bad footer")
    {
        CHECK(UnfPacket::decode({'D', 'M', 'A', '@', 0x01, 0x00, 0x00, 0x00, 'C', 'M', 'P', 'X'}, packet).kind() ==
              EverdriveError::PROTOCOL_MALFORMED);
    }

    SUBCASE("Short packet")
    {
        CHECK(UnfPacket::decode({'D', 'M', 'A'}, packet).kind() == EverdriveError::PROTOCOL_TRUNCATED);
        CHECK(UnfPacket::decode({'D', 'M', 'A', '@', 0x01, 0x00, 0x00, 0x04, 'a', 'b'}, packet).kind() ==
              EverdriveError::PROTOCOL_TRUNCATED);
    }
}

TEST_CASE("Header parsing")
{
    UnfPacket::DataType type = UnfPacket::UNKNOWN;
    size_t size = 0;
    REQUIRE(UnfPacket::parseHeader({'D', 'M', 'A', '@', 0x04, 0x12, 0x34, 0x56}, type, size).ok());
    CHECK(type == UnfPacket::SCREENSHOT);
    CHECK(size == 0x123456);
    CHECK(UnfPacket::dataTypeFromByte(0x06) == UnfPacket::RDB_PACKET);
    CHECK(UnfPacket::dataTypeFromByte(0x00) == UnfPacket::UNKNOWN);
}
