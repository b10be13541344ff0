#pragma once

#include "audio_source.hpp"
#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

// Finite source over a fully decoded sample buffer. Never blocks; yields
// chunk_samples slices (the last one possibly shorter), then end of stream
// for good.
class FileChunkSource : public AudioChunkSource {
public:
    FileChunkSource(std::vector<int16_t> samples, const ChunkFormat& format);

    // Reads and decodes a WAVE file. With allow_resample the audio is
    // normalized to the session format, otherwise anything but an exact match
    // fails with UnsupportedFormat naming the mismatched property.
    static std::expected<std::unique_ptr<FileChunkSource>, Error>
        open(const std::string& path, const ChunkFormat& format, bool allow_resample);

    static std::expected<std::unique_ptr<FileChunkSource>, Error>
        from_wav(std::span<const uint8_t> bytes, const ChunkFormat& format, bool allow_resample);

    std::optional<AudioChunk> next() override;
    void close() override;
    bool is_live() const override { return false; }
    const ChunkFormat& format() const override { return format_; }

    size_t total_samples() const { return samples_.size(); }
    size_t position() const { return pos_; }
    double duration_s() const;

private:
    std::vector<int16_t> samples_;
    ChunkFormat format_;
    size_t pos_ = 0;
};
