#pragma once

#include "audio_chunk.hpp"

#include <optional>

// Pull interface over live capture and decoded files.
// next() returns std::nullopt for end of stream.
class AudioChunkSource {
public:
    virtual ~AudioChunkSource() = default;

    virtual std::optional<AudioChunk> next() = 0;

    // Releases whatever the source holds. Safe to call more than once.
    virtual void close() = 0;

    virtual bool is_live() const = 0;
    virtual const ChunkFormat& format() const = 0;
};
