#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>
#include "EverdriveError.hpp"

/**
 * Splits a transfer into command-sized pieces and runs them in address order.
 */
class Chunker {
public:
    struct Chunk {
        size_t offset;
        size_t length;
    };

    /**
     * Fetch one chunk's bytes; out must end up exactly chunk.length long.
     */
    typedef std::function<EverdriveError(const Chunk&, std::vector<uint8_t>&)> ChunkReader;

    /**
     * Store one chunk taken from data[0, chunk.length).
     */
    typedef std::function<EverdriveError(const Chunk&, const uint8_t*)> ChunkWriter;

    explicit Chunker(size_t max_chunk);

    size_t maxChunk() const { return max_chunk; }

    /**
     * @brief Cover [0, total_length) with chunks of at most max_chunk bytes.
     *
     * Offsets are strictly increasing with no gaps or overlaps; the last chunk
     * is short when total_length is not a multiple of max_chunk.
     *
     * @return false if max_chunk is 0 and total_length is not.
     */
    static bool plan(size_t total_length, size_t max_chunk, std::vector<Chunk>& chunks);

    /**
     * @brief Fill dest[0, total_length) one chunk at a time.
     *
     * Stops at the first failing chunk. Chunks completed before it stay in
     * dest; nothing past it is touched.
     */
    EverdriveError readInto(uint8_t* dest, size_t total_length, const ChunkReader& reader) const;

    /**
     * @brief Send src[0, total_length) one chunk at a time, stopping at the first failure.
     */
    EverdriveError writeFrom(const uint8_t* src, size_t total_length, const ChunkWriter& writer) const;

private:
    size_t max_chunk;
};
