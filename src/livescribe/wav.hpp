#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <expected>
#include <format>
#include <span>
#include <string>
#include <vector>

// In-memory RIFF/WAVE encoding and parsing for integer and float PCM.
namespace wav {

constexpr uint16_t FORMAT_PCM = 1;
constexpr uint16_t FORMAT_FLOAT = 3;
constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;

// Parsed contents of a WAVE file. `data` holds interleaved little-endian
// frames exactly as stored.
struct Pcm {
    uint16_t format = FORMAT_PCM;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    std::vector<uint8_t> data;

    size_t bytes_per_sample() const { return bits_per_sample / 8; }
    size_t frame_count() const {
        size_t frame = bytes_per_sample() * channels;
        return frame ? data.size() / frame : 0;
    }
};

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                                   uint16_t channels = 1) {
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(FORMAT_PCM);
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + 44, samples.data(), data_size);
    }

    return out;
}

inline std::expected<Pcm, std::string> decode(std::span<const uint8_t> bytes) {
    auto u16 = [&bytes](size_t pos) {
        uint16_t v;
        std::memcpy(&v, bytes.data() + pos, 2);
        return v;
    };
    auto u32 = [&bytes](size_t pos) {
        uint32_t v;
        std::memcpy(&v, bytes.data() + pos, 4);
        return v;
    };
    auto tag = [&bytes](size_t pos, const char* expected) {
        return std::memcmp(bytes.data() + pos, expected, 4) == 0;
    };

    if (bytes.size() < 12 || !tag(0, "RIFF") || !tag(8, "WAVE")) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    Pcm pcm;
    bool have_fmt = false;
    bool have_data = false;
    size_t pos = 12;

    while (pos + 8 <= bytes.size()) {
        uint32_t size = u32(pos + 4);
        size_t body = pos + 8;
        size_t avail = std::min<size_t>(size, bytes.size() - body);

        if (tag(pos, "fmt ")) {
            if (avail < 16) return std::unexpected("truncated fmt chunk");
            pcm.format = u16(body);
            pcm.channels = u16(body + 2);
            pcm.sample_rate = u32(body + 4);
            pcm.bits_per_sample = u16(body + 14);
            if (pcm.format == FORMAT_EXTENSIBLE) {
                // The sub-format GUID starts with the plain format tag.
                if (avail < 26) return std::unexpected("truncated extensible fmt chunk");
                pcm.format = u16(body + 24);
            }
            have_fmt = true;
        } else if (tag(pos, "data")) {
            pcm.data.assign(bytes.begin() + body, bytes.begin() + body + avail);
            have_data = true;
        }

        // Chunks are word aligned.
        pos = body + size + (size & 1);
    }

    if (!have_fmt) return std::unexpected("missing fmt chunk");
    if (!have_data) return std::unexpected("missing data chunk");
    if (pcm.format != FORMAT_PCM && pcm.format != FORMAT_FLOAT) {
        return std::unexpected(std::format("compressed encoding (format tag {}) is not supported",
                                           pcm.format));
    }
    if (pcm.channels == 0 || pcm.sample_rate == 0 || pcm.bits_per_sample == 0 ||
        pcm.bits_per_sample % 8 != 0) {
        return std::unexpected("invalid fmt chunk");
    }
    bool width_ok = pcm.format == FORMAT_FLOAT
        ? (pcm.bits_per_sample == 32 || pcm.bits_per_sample == 64)
        : pcm.bits_per_sample <= 32;
    if (!width_ok) {
        return std::unexpected(std::format("{}-bit {} samples are not supported",
                                           pcm.bits_per_sample,
                                           pcm.format == FORMAT_FLOAT ? "float" : "integer"));
    }

    // Drop a trailing partial frame.
    pcm.data.resize(pcm.frame_count() * pcm.bytes_per_sample() * pcm.channels);
    return pcm;
}

} // namespace wav
