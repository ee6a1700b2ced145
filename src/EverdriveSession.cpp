/**
 * @file EverdriveSession.cpp
 * @brief Implementation of the EverdriveSession class.
 *
 * Every public operation is built from round-trips: encode a command, hand it
 * to the transport, read the reply header, read the body the header calls
 * for, decode. Reads and writes larger than the session's chunk size are split
 * by the Chunker and issued strictly in ascending address order; the first
 * failing chunk ends the operation.
 *
 * @section Debugging
 * With verbose mode on, each command is traced with its opcode, address and
 * block count, and short replies are dumped in hex.
 */

#include "EverdriveSession.hpp"
#include "EverdriveLog.hpp"
#include <algorithm>
#include <sstream>

SessionOptions::SessionOptions()
    : timeout(std::chrono::milliseconds(EverdriveConfig::USB_TIMEOUT)),
      max_chunk(EverdriveConfig::DEFAULT_MAX_CHUNK),
      block_size(EverdriveConfig::BLOCK_SIZE),
      max_payload(EverdriveConfig::MAX_COMMAND_PAYLOAD),
      vendor_id(EverdriveConfig::VENDOR_ID),
      product_id(EverdriveConfig::PRODUCT_ID)
{
}

EverdriveError SessionOptions::validate() const
{
    if (timeout.count() <= 0) {
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, "Timeout must be positive");
    }
    if (block_size == 0) {
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, "Block size must be non-zero");
    }
    if (max_chunk == 0) {
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, "Chunk size must be non-zero");
    }
    if (max_chunk > max_payload) {
        std::stringstream ss;
        ss << "Chunk size " << max_chunk << " exceeds the device command buffer (" << max_payload << ")";
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, ss.str());
    }
    if (max_chunk % block_size != 0) {
        std::stringstream ss;
        ss << "Chunk size " << max_chunk << " is not a multiple of the block size " << block_size;
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, ss.str());
    }
    return EverdriveError::success();
}

EverdriveSession::EverdriveSession(std::unique_ptr<Transport> transport, const SessionOptions& options)
    : transport(std::move(transport)),
      options(options),
      codec(options.block_size, options.max_payload),
      chunker(options.max_chunk),
      state(IDLE),
      lastOutcome(NO_COMMAND),
      broken(false),
      outOfStep(false)
{
}

EverdriveSession::~EverdriveSession()
{
    close();
}

EverdriveError EverdriveSession::open(std::chrono::milliseconds timeout,
                                      std::unique_ptr<EverdriveSession>& session)
{
    SessionOptions options;
    options.timeout = timeout;
    return open(TransportFactory::createFtdiTransport(0), options, session);
}

EverdriveError EverdriveSession::open(std::unique_ptr<Transport> transport, const SessionOptions& options,
                                      std::unique_ptr<EverdriveSession>& session)
{
    if (!transport) {
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, "No transport given");
    }

    EverdriveError error = options.validate();
    if (!error.ok()) {
        return error;
    }

    error = transport->open(options.vendor_id, options.product_id, options.timeout);
    if (!error.ok()) {
        return error;
    }

    std::unique_ptr<EverdriveSession> opened(new EverdriveSession(std::move(transport), options));

    // Handshake: the device must answer the test command
    StatusInfo info;
    error = opened->status(info);
    if (!error.ok()) {
        DEBUG_PRINTLN("Handshake failed: " << error);
        return error;
    }

    DEBUG_PRINTLN("Everdrive session open, timeout " << options.timeout.count() << " ms, chunk "
                  << options.max_chunk << " bytes");
    session = std::move(opened);
    return EverdriveError::success();
}

void EverdriveSession::close()
{
    if (transport) {
        transport->close();
        transport.reset();
    }
    state = IDLE;
}

bool EverdriveSession::isOpen() const
{
    return transport && transport->isOpen() && !broken;
}

EverdriveError EverdriveSession::checkUsable() const
{
    if (!transport || !transport->isOpen()) {
        return EverdriveError(EverdriveError::TRANSPORT_IO, "Session is closed");
    }
    if (broken) {
        return EverdriveError(EverdriveError::TRANSPORT_IO, "Transport failed earlier, session must be reopened");
    }
    if (state != IDLE) {
        return EverdriveError(EverdriveError::DEVICE_BUSY, "A command is already in flight");
    }
    return EverdriveError::success();
}

EverdriveError EverdriveSession::checkRange(uint32_t address, size_t length) const
{
    if (static_cast<uint64_t>(address) + static_cast<uint64_t>(length) > 0x100000000ULL) {
        std::stringstream ss;
        ss << "Range 0x" << std::hex << address << " + 0x" << length << " overflows the address space";
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, ss.str());
    }
    return EverdriveError::success();
}

void EverdriveSession::finishRoundTrip(const EverdriveError& error)
{
    state = IDLE;
    if (error.kind() == EverdriveError::TRANSPORT_TIMEOUT) {
        lastOutcome = TIMED_OUT;
    } else if (error.kind() == EverdriveError::TRANSPORT_IO) {
        lastOutcome = TRANSPORT_FAILED;
        broken = true;
    } else {
        lastOutcome = DECODED;
    }

    if (error.kind() == EverdriveError::TRANSPORT_TIMEOUT ||
        error.kind() == EverdriveError::PROTOCOL_TRUNCATED ||
        error.kind() == EverdriveError::PROTOCOL_MALFORMED) {
        outOfStep = true;
    }
}

EverdriveError EverdriveSession::resync()
{
    if (!outOfStep) {
        return EverdriveError::success();
    }

    DEBUG_PRINTLN("Discarding unread input before the next command");
    EverdriveError error = transport->purge();
    if (error.kind() == EverdriveError::TRANSPORT_IO) {
        lastOutcome = TRANSPORT_FAILED;
        broken = true;
    }
    if (!error.ok()) {
        return error;
    }

    outOfStep = false;
    return EverdriveError::success();
}

EverdriveError EverdriveSession::roundTrip(const CommandFrame& command, size_t min_payload,
                                           size_t max_payload, ResponseFrame& response)
{
    EverdriveError error = checkUsable();
    if (!error.ok()) {
        return error;
    }

    error = resync();
    if (!error.ok()) {
        return error;
    }

    DEBUG_PRINTLN("-> cmd '" << static_cast<char>(command.opcode()) << "' addr 0x" << std::hex
                  << command.address() << std::dec << " blocks " << command.blocks()
                  << " arg " << command.argument() << " payload " << command.payloadSize());

    state = COMMAND_SENT;
    error = transport->send(command.bytes());
    if (!error.ok()) {
        finishRoundTrip(error);
        return error;
    }

    state = AWAITING_RESPONSE;
    auto deadline = std::chrono::steady_clock::now() + options.timeout;

    std::vector<uint8_t> reply;
    error = transport->receive(EverdriveConfig::RESP_HEADER_SIZE, options.timeout, reply);
    if (!error.ok()) {
        finishRoundTrip(error);
        return error;
    }

    // The header tag tells how much body follows. Of a ranged reply only
    // min_payload bytes are owed; the rest is taken if it is already there.
    size_t body = 0;
    size_t optional = 0;
    if (reply.size() == EverdriveConfig::RESP_HEADER_SIZE) {
        uint8_t tag = reply[3];
        if (tag == EverdriveConfig::RESP_OK) {
            body = min_payload;
            optional = max_payload - min_payload;
        } else if (tag == EverdriveConfig::RESP_ERROR) {
            body = 1;
        }
    }

    if (body > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 1) {
            remaining = std::chrono::milliseconds(1);
        }

        std::vector<uint8_t> rest;
        error = transport->receive(body, remaining, rest);
        if (error.kind() == EverdriveError::TRANSPORT_IO) {
            finishRoundTrip(error);
            return error;
        }
        // A timeout here means a partial reply; the codec reports it as truncated
        reply.insert(reply.end(), rest.begin(), rest.end());
    }

    bool shortOfOptional = false;
    if (optional > 0 && reply.size() == EverdriveConfig::RESP_HEADER_SIZE + body) {
        std::vector<uint8_t> rest;
        error = transport->receive(optional, std::chrono::milliseconds(EverdriveConfig::TRAILING_BYTES_WAIT),
                                   rest);
        if (error.kind() == EverdriveError::TRANSPORT_IO) {
            finishRoundTrip(error);
            return error;
        }
        reply.insert(reply.end(), rest.begin(), rest.end());
        shortOfOptional = rest.size() < optional;
    }

    if (reply.size() <= 32) {
        EverdriveLog::dumpHex("<- reply", reply);
    } else {
        DEBUG_PRINTLN("<- reply (" << reply.size() << " bytes)");
    }

    ResponseFrame decoded;
    error = codec.decode(reply, min_payload, max_payload, decoded);
    finishRoundTrip(error);
    if (!error.ok()) {
        return error;
    }
    if (shortOfOptional) {
        // Late padding must not be read as the next reply
        outOfStep = true;
    }

    response = decoded;
    return EverdriveError::success();
}

EverdriveError EverdriveSession::sendOnly(const std::vector<uint8_t>& bytes)
{
    EverdriveError error = checkUsable();
    if (!error.ok()) {
        return error;
    }

    error = resync();
    if (!error.ok()) {
        return error;
    }

    state = COMMAND_SENT;
    error = transport->send(bytes);
    state = IDLE;
    if (error.kind() == EverdriveError::TRANSPORT_IO) {
        lastOutcome = TRANSPORT_FAILED;
        broken = true;
    } else if (error.kind() == EverdriveError::TRANSPORT_TIMEOUT) {
        lastOutcome = TIMED_OUT;
    }
    return error;
}

EverdriveError EverdriveSession::status(StatusInfo& info)
{
    CommandFrame command;
    EverdriveError error = codec.encodeTest(command);
    if (!error.ok()) {
        return error;
    }

    // The device pads its status reply to 16 bytes
    ResponseFrame response;
    error = roundTrip(command, 0,
                      EverdriveConfig::STATUS_REPLY_SIZE - EverdriveConfig::RESP_HEADER_SIZE,
                      response);
    if (!error.ok()) {
        return error;
    }

    info.ok = response.ok();
    info.status = response.status();
    info.detail = response.payload();
    return EverdriveError::success();
}

EverdriveError EverdriveSession::read(MemorySpace space, uint32_t address, size_t length,
                                      std::vector<uint8_t>& data)
{
    data.assign(length, 0);
    EverdriveError error = read(space, address, data.data(), length);
    if (!error.ok()) {
        data.clear();
    }
    return error;
}

EverdriveError EverdriveSession::read(MemorySpace space, uint32_t address, uint8_t* dest, size_t length)
{
    EverdriveError error = checkUsable();
    if (!error.ok()) {
        return error;
    }

    error = checkRange(address, length);
    if (!error.ok()) {
        return error;
    }

    DEBUG_PRINTLN("Reading " << length << " bytes of " << memorySpaceName(space) << " at 0x"
                  << std::hex << address << std::dec);

    return chunker.readInto(dest, length,
        [this, space, address](const Chunker::Chunk& chunk, std::vector<uint8_t>& out) {
            // A short last chunk is requested whole and trimmed
            size_t request = codec.alignUp(chunk.length);

            CommandFrame command;
            EverdriveError err = codec.encodeRead(space, address + static_cast<uint32_t>(chunk.offset),
                                                  request, command);
            if (!err.ok()) {
                return err;
            }

            ResponseFrame response;
            err = roundTrip(command, request, request, response);
            if (!err.ok()) {
                return err;
            }

            const std::vector<uint8_t>& payload = response.payload();
            out.assign(payload.begin(), payload.begin() + chunk.length);
            return EverdriveError::success();
        });
}

EverdriveError EverdriveSession::write(MemorySpace space, uint32_t address, const std::vector<uint8_t>& data)
{
    return write(space, address, data.data(), data.size());
}

EverdriveError EverdriveSession::write(MemorySpace space, uint32_t address, const uint8_t* data, size_t length)
{
    EverdriveError error = checkUsable();
    if (!error.ok()) {
        return error;
    }

    error = checkRange(address, length);
    if (!error.ok()) {
        return error;
    }

    // Reject before anything reaches the device
    if (length % options.block_size != 0) {
        std::stringstream ss;
        ss << "Size must be a multiple of " << options.block_size << " (got " << length << ")";
        return EverdriveError(EverdriveError::ENCODING_MISALIGNED, ss.str());
    }

    DEBUG_PRINTLN("Writing " << length << " bytes of " << memorySpaceName(space) << " at 0x"
                  << std::hex << address << std::dec);

    return chunker.writeFrom(data, length,
        [this, space, address](const Chunker::Chunk& chunk, const uint8_t* piece) {
            CommandFrame command;
            EverdriveError err = codec.encodeWrite(space, address + static_cast<uint32_t>(chunk.offset),
                                                   piece, chunk.length, command);
            if (!err.ok()) {
                return err;
            }

            ResponseFrame response;
            return roundTrip(command, 0, 0, response);
        });
}

EverdriveError EverdriveSession::romFill(uint32_t address, size_t length, uint32_t value)
{
    EverdriveError error = checkRange(address, length);
    if (!error.ok()) {
        return error;
    }

    CommandFrame command;
    error = codec.encodeFill(address, length, value, command);
    if (!error.ok()) {
        return error;
    }

    ResponseFrame response;
    return roundTrip(command, 0, 0, response);
}

EverdriveError EverdriveSession::appStart(const std::string& save_name)
{
    if (save_name.size() >= EverdriveConfig::APP_NAME_SIZE) {
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, "File name is too long");
    }

    CommandFrame command;
    EverdriveError error = codec.encodeAppStart(!save_name.empty(), command);
    if (!error.ok()) {
        return error;
    }

    std::vector<uint8_t> bytes = command.bytes();
    if (!save_name.empty()) {
        std::vector<uint8_t> name(EverdriveConfig::APP_NAME_SIZE, 0);
        std::copy(save_name.begin(), save_name.end(), name.begin());
        bytes.insert(bytes.end(), name.begin(), name.end());
    }

    DEBUG_PRINTLN("Starting application" << (save_name.empty() ? "" : " with save file " + save_name));
    return sendOnly(bytes);
}

EverdriveError EverdriveSession::unfSend(const UnfPacket& packet)
{
    std::vector<uint8_t> bytes;
    EverdriveError error = packet.encode(bytes);
    if (!error.ok()) {
        return error;
    }

    DEBUG_PRINTLN("Sending UNF " << UnfPacket::dataTypeName(packet.type()) << " packet, "
                  << packet.data().size() << " bytes");
    return sendOnly(bytes);
}

EverdriveError EverdriveSession::unfReceive(UnfPacket& packet)
{
    EverdriveError error = checkUsable();
    if (!error.ok()) {
        return error;
    }

    error = resync();
    if (!error.ok()) {
        return error;
    }

    state = AWAITING_RESPONSE;
    auto deadline = std::chrono::steady_clock::now() + options.timeout;

    std::vector<uint8_t> bytes;
    error = transport->receive(UnfPacket::HEADER_SIZE, options.timeout, bytes);
    if (error.kind() == EverdriveError::TRANSPORT_TIMEOUT) {
        // Nothing was asked for, so an idle line leaves nothing behind
        state = IDLE;
        lastOutcome = TIMED_OUT;
        return error;
    }
    if (!error.ok()) {
        finishRoundTrip(error);
        return error;
    }

    UnfPacket::DataType type = UnfPacket::UNKNOWN;
    size_t size = 0;
    error = UnfPacket::parseHeader(bytes, type, size);
    if (!error.ok()) {
        finishRoundTrip(error);
        return error;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 1) {
        remaining = std::chrono::milliseconds(1);
    }

    std::vector<uint8_t> rest;
    error = transport->receive(size + UnfPacket::FOOTER_SIZE, remaining, rest);
    if (error.kind() == EverdriveError::TRANSPORT_IO) {
        finishRoundTrip(error);
        return error;
    }
    bytes.insert(bytes.end(), rest.begin(), rest.end());

    UnfPacket decoded;
    error = UnfPacket::decode(bytes, decoded);
    finishRoundTrip(error);
    if (!error.ok()) {
        return error;
    }

    DEBUG_PRINTLN("Received UNF " << UnfPacket::dataTypeName(decoded.type()) << " packet, "
                  << decoded.data().size() << " bytes");
    packet = decoded;
    return EverdriveError::success();
}
