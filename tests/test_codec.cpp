/**
 * @file test_codec.cpp
 * @brief Command frame encoding, response decoding and error values
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <sstream>
#include <vector>

#include "CommandCodec.hpp"
#include "EverdriveError.hpp"

/* ========================================================================= */
/* Command encoding                                                          */
/* ========================================================================= */

TEST_CASE("Command frame layout")
{
    CommandCodec codec;

    SUBCASE("Test command")
    {
        CommandFrame frame;
        REQUIRE(codec.encodeTest(frame).ok());
        const std::vector<uint8_t> expected = {'c', 'm', 'd', 't', 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
        CHECK(frame.bytes() == expected);
        CHECK(frame.opcode() == Opcode::TEST);
        CHECK(frame.payloadSize() == 0);
    }

    SUBCASE("ROM read")
    {
        CommandFrame frame;
        REQUIRE(codec.encodeRead(MemorySpace::ROM, 0x10000000, 0x1000, frame).ok());
        const std::vector<uint8_t> expected = {'c', 'm', 'd', 'R', 0x10, 0x00, 0x00, 0x00,
                                               0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00, 0x00};
        CHECK(frame.bytes() == expected);
        CHECK(frame.address() == 0x10000000);
        CHECK(frame.blocks() == 8);
    }

    SUBCASE("SRAM write carries its payload")
    {
        std::vector<uint8_t> data(512);
        for (size_t i = 0; i < data.size(); i++) {
            data[i] = static_cast<uint8_t>(i);
        }
        CommandFrame frame;
        REQUIRE(codec.encodeWrite(MemorySpace::SRAM, 0x08000000, data.data(), data.size(), frame).ok());
        REQUIRE(frame.size() == 16 + 512);
        CHECK(frame.opcode() == Opcode::WRITE);
        CHECK(frame.address() == 0x08000000);
        CHECK(frame.blocks() == 1);
        CHECK(frame.payloadSize() == 512);
        CHECK(std::vector<uint8_t>(frame.bytes().begin() + 16, frame.bytes().end()) == data);
    }

    SUBCASE("Fill puts the value in the argument")
    {
        CommandFrame frame;
        REQUIRE(codec.encodeFill(0x10000000, 0x100000, 0xFFFFFFFF, frame).ok());
        CHECK(frame.opcode() == Opcode::FILL);
        CHECK(frame.blocks() == 0x800);
        CHECK(frame.argument() == 0xFFFFFFFF);
        CHECK(frame.size() == 16);
    }

    SUBCASE("Application start flag")
    {
        CommandFrame plain;
        CommandFrame with_save;
        REQUIRE(codec.encodeAppStart(false, plain).ok());
        REQUIRE(codec.encodeAppStart(true, with_save).ok());
        CHECK(plain.opcode() == Opcode::APP_START);
        CHECK(plain.argument() == 0);
        CHECK(with_save.argument() == 1);
    }
}

TEST_CASE("Memory spaces map to command families")
{
    CHECK(commandFamily(MemorySpace::ROM).read == Opcode::READ);
    CHECK(commandFamily(MemorySpace::ROM).write == Opcode::WRITE);
    CHECK(commandFamily(MemorySpace::SRAM).read == Opcode::READ);
    CHECK(commandFamily(MemorySpace::SRAM).write == Opcode::WRITE);
    CHECK(std::string(memorySpaceName(MemorySpace::SRAM)) == "SRAM");
}

TEST_CASE("Encoding rejects what the device cannot take")
{
    CommandCodec codec;
    CommandFrame frame;
    std::vector<uint8_t> data(0x20000, 0);

    SUBCASE("Read above the command buffer")
    {
        CHECK(codec.encodeRead(MemorySpace::ROM, 0x10000000, 0x10200, frame).kind() ==
              EverdriveError::ENCODING_PAYLOAD_TOO_LARGE);
        CHECK(frame.empty());
    }

    SUBCASE("Write above the command buffer")
    {
        CHECK(codec.encodeWrite(MemorySpace::ROM, 0x10000000, data.data(), data.size(), frame).kind() ==
              EverdriveError::ENCODING_PAYLOAD_TOO_LARGE);
    }

    SUBCASE("Exactly the command buffer is fine")
    {
        CHECK(codec.encodeWrite(MemorySpace::ROM, 0x10000000, data.data(), 0x10000, frame).ok());
    }

    SUBCASE("Length off the block grid")
    {
        CHECK(codec.encodeRead(MemorySpace::ROM, 0x10000000, 100, frame).kind() ==
              EverdriveError::ENCODING_MISALIGNED);
        CHECK(codec.encodeFill(0x10000000, 513, 0, frame).kind() == EverdriveError::ENCODING_MISALIGNED);
    }

    SUBCASE("Payload on a command that takes none")
    {
        uint8_t byte = 0;
        CHECK(codec.encode(Opcode::READ, 0, 512, 0, &byte, 1, frame).kind() ==
              EverdriveError::INVALID_ARGUMENT);
    }

    SUBCASE("Write payload that does not match the length")
    {
        CHECK(codec.encode(Opcode::WRITE, 0, 512, 0, data.data(), 1024, frame).kind() ==
              EverdriveError::INVALID_ARGUMENT);
    }
}

TEST_CASE("Block size is a parameter")
{
    CommandCodec codec(1, 0x10000);
    CommandFrame frame;
    REQUIRE(codec.encodeRead(MemorySpace::ROM, 0x10000000, 100, frame).ok());
    CHECK(frame.blocks() == 100);
    CHECK(codec.alignUp(100) == 100);

    CommandCodec blocks;
    CHECK(blocks.alignUp(0) == 0);
    CHECK(blocks.alignUp(1) == 512);
    CHECK(blocks.alignUp(512) == 512);
    CHECK(blocks.alignUp(513) == 1024);
}

/* ========================================================================= */
/* Response decoding                                                         */
/* ========================================================================= */

TEST_CASE("Response decoding")
{
    CommandCodec codec;
    ResponseFrame response;

    SUBCASE("OK without payload")
    {
        REQUIRE(codec.decode({'c', 'm', 'd', 'r'}, 0, response).ok());
        CHECK(response.ok());
        CHECK(response.payload().empty());
    }

    SUBCASE("OK with payload")
    {
        REQUIRE(codec.decode({'c', 'm', 'd', 'r', 1, 2, 3, 4}, 4, response).ok());
        CHECK(response.payload() == std::vector<uint8_t>{1, 2, 3, 4});
    }

    SUBCASE("Payload within a range")
    {
        REQUIRE(codec.decode({'c', 'm', 'd', 'r', 9, 9}, 0, 12, response).ok());
        CHECK(response.payload().size() == 2);
    }

    SUBCASE("Device error")
    {
        EverdriveError err = codec.decode({'c', 'm', 'd', 'e', 0x42}, 0, response);
        CHECK(err.kind() == EverdriveError::PROTOCOL_DEVICE_ERROR);
        CHECK(err.deviceCode() == 0x42);
        CHECK(err.message() == "Device reported error code 0x42");
    }

    SUBCASE("Device error without its code")
    {
        CHECK(codec.decode({'c', 'm', 'd', 'e'}, 0, response).kind() == EverdriveError::PROTOCOL_TRUNCATED);
    }

    SUBCASE("Short header")
    {
        CHECK(codec.decode({'c', 'm'}, 0, response).kind() == EverdriveError::PROTOCOL_TRUNCATED);
        CHECK(codec.decode({}, 0, response).kind() == EverdriveError::PROTOCOL_TRUNCATED);
    }

    SUBCASE("Short payload")
    {
        CHECK(codec.decode({'c', 'm', 'd', 'r', 1, 2}, 4, response).kind() == EverdriveError::PROTOCOL_TRUNCATED);
    }

    SUBCASE("Extra payload")
    {
        CHECK(codec.decode({'c', 'm', 'd', 'r', 1, 2}, 0, response).kind() == EverdriveError::PROTOCOL_MALFORMED);
    }

    SUBCASE("Wrong prefix")
    {
        CHECK(codec.decode({'C', 'M', 'D', 'r'}, 0, response).kind() == EverdriveError::PROTOCOL_MALFORMED);
    }

    SUBCASE("Unknown tag")
    {
        CHECK(codec.decode({'c', 'm', 'd', 'x'}, 0, response).kind() == EverdriveError::PROTOCOL_MALFORMED);
    }

    SUBCASE("Failed decode leaves the frame alone")
    {
        REQUIRE(codec.decode({'c', 'm', 'd', 'r', 7}, 1, response).ok());
        CHECK_FALSE(codec.decode({'c', 'm', 'd', 'r'}, 1, response).ok());
        CHECK(response.payload() == std::vector<uint8_t>{7});
    }
}

/* ========================================================================= */
/* Error values                                                              */
/* ========================================================================= */

TEST_CASE("Error classification")
{
    CHECK(EverdriveError().ok());
    CHECK(EverdriveError::success().kindName() == std::string("OK"));

    EverdriveError busy(EverdriveError::DEVICE_BUSY, "claimed");
    CHECK(busy.isDeviceError());
    CHECK_FALSE(busy.isTransportError());

    EverdriveError timeout(EverdriveError::TRANSPORT_TIMEOUT, "late");
    CHECK(timeout.isTransportError());
    CHECK(timeout.toString() == "TransportTimeout: late");

    EverdriveError misaligned(EverdriveError::ENCODING_MISALIGNED, "odd");
    CHECK(misaligned.isEncodingError());
    CHECK(misaligned.isProgrammingError());
    CHECK_FALSE(misaligned.isProtocolError());

    CHECK(EverdriveError(EverdriveError::INVALID_ARGUMENT, "").isProgrammingError());
    CHECK(EverdriveError::deviceError(1).isProtocolError());

    std::stringstream ss;
    ss << EverdriveError(EverdriveError::DEVICE_NOT_FOUND, "no cart");
    CHECK(ss.str() == "DeviceNotFound: no cart");
}
