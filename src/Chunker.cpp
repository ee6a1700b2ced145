#include "Chunker.hpp"
#include "EverdriveLog.hpp"
#include <cstring>
#include <sstream>

Chunker::Chunker(size_t max_chunk)
    : max_chunk(max_chunk)
{
}

bool Chunker::plan(size_t total_length, size_t max_chunk, std::vector<Chunk>& chunks)
{
    chunks.clear();
    if (total_length == 0) {
        return true;
    }
    if (max_chunk == 0) {
        return false;
    }

    chunks.reserve((total_length + max_chunk - 1) / max_chunk);
    for (size_t offset = 0; offset < total_length; offset += max_chunk) {
        size_t left = total_length - offset;
        chunks.push_back(Chunk{offset, left < max_chunk ? left : max_chunk});
    }
    return true;
}

EverdriveError Chunker::readInto(uint8_t* dest, size_t total_length, const ChunkReader& reader) const
{
    std::vector<Chunk> chunks;
    if (!plan(total_length, max_chunk, chunks)) {
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, "Chunk size must be non-zero");
    }
    if (total_length > 0 && dest == nullptr) {
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, "Destination buffer is null");
    }

    std::vector<uint8_t> piece;
    for (size_t i = 0; i < chunks.size(); i++) {
        const Chunk& chunk = chunks[i];
        piece.clear();

        EverdriveError error = reader(chunk, piece);
        if (!error.ok()) {
            DEBUG_PRINTLN("Chunk " << (i + 1) << "/" << chunks.size() << " failed: " << error);
            return error;
        }

        if (piece.size() != chunk.length) {
            std::stringstream ss;
            ss << "Chunk at offset " << chunk.offset << " returned " << piece.size()
               << " bytes, expected " << chunk.length;
            return EverdriveError(EverdriveError::PROTOCOL_MALFORMED, ss.str());
        }

        std::memcpy(dest + chunk.offset, piece.data(), chunk.length);
    }

    return EverdriveError::success();
}

EverdriveError Chunker::writeFrom(const uint8_t* src, size_t total_length, const ChunkWriter& writer) const
{
    std::vector<Chunk> chunks;
    if (!plan(total_length, max_chunk, chunks)) {
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, "Chunk size must be non-zero");
    }
    if (total_length > 0 && src == nullptr) {
        return EverdriveError(EverdriveError::INVALID_ARGUMENT, "Source buffer is null");
    }

    for (size_t i = 0; i < chunks.size(); i++) {
        EverdriveError error = writer(chunks[i], src + chunks[i].offset);
        if (!error.ok()) {
            DEBUG_PRINTLN("Chunk " << (i + 1) << "/" << chunks.size() << " failed: " << error);
            return error;
        }
    }

    return EverdriveError::success();
}
