#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <format>
#include <span>
#include <vector>

// Shape of the sample stream for one session. Fixed from open() to the end.
struct ChunkFormat {
    uint32_t sample_rate = 16000;
    uint16_t channels = 1;
    size_t chunk_samples = 4000;

    size_t chunk_bytes() const { return chunk_samples * channels * sizeof(int16_t); }
};

struct AudioChunk {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 16000;
    uint16_t channels = 1;

    double duration_s() const {
        if (sample_rate == 0 || channels == 0) return 0.0;
        return static_cast<double>(samples.size()) / channels / sample_rate;
    }

    // Raw S16_LE bytes as delivered by a capture device.
    static std::expected<AudioChunk, Error>
    from_bytes(std::span<const uint8_t> bytes, uint32_t sample_rate, uint16_t channels = 1) {
        if (bytes.size() % sizeof(int16_t) != 0) {
            return fail(ErrorCode::InvalidChunk,
                        std::format("{} bytes is not a whole number of 16-bit samples",
                                    bytes.size()));
        }
        AudioChunk chunk;
        chunk.sample_rate = sample_rate;
        chunk.channels = channels;
        chunk.samples.resize(bytes.size() / sizeof(int16_t));
        std::memcpy(chunk.samples.data(), bytes.data(), bytes.size());
        return chunk;
    }
};
