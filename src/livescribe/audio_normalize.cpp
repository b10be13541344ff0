#include "audio_normalize.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace audio {

namespace {

// One sample at `p`, scaled to [-1, 1].
float read_sample(const uint8_t* p, uint16_t bits, uint16_t format) {
    if (format == wav::FORMAT_FLOAT) {
        if (bits == 64) {
            double d;
            std::memcpy(&d, p, sizeof(d));
            return static_cast<float>(d);
        }
        float f;
        std::memcpy(&f, p, sizeof(f));
        return f;
    }

    switch (bits) {
        case 8:
            // 8-bit WAVE is unsigned
            return (static_cast<int>(p[0]) - 128) / 128.0f;
        case 16: {
            int16_t v;
            std::memcpy(&v, p, 2);
            return v / 32768.0f;
        }
        case 24: {
            int32_t v = p[0] | (p[1] << 8) | (p[2] << 16);
            if (v & 0x800000) v |= ~0xFFFFFF;
            return v / 8388608.0f;
        }
        case 32: {
            int32_t v;
            std::memcpy(&v, p, 4);
            return static_cast<float>(v / 2147483648.0);
        }
        default:
            return 0.0f;
    }
}

int16_t to_s16(float v) {
    v = std::clamp(v, -1.0f, 1.0f);
    return static_cast<int16_t>(std::lround(v * 32767.0f));
}

} // namespace

std::optional<std::string> format_mismatch(const wav::Pcm& pcm, uint32_t target_rate) {
    if (pcm.channels != 1) return "channel count";
    if (pcm.bits_per_sample != 16 || pcm.format != wav::FORMAT_PCM) return "sample width";
    if (pcm.sample_rate != target_rate) return "sample rate";
    return std::nullopt;
}

std::vector<int16_t> to_mono_s16(const wav::Pcm& pcm) {
    size_t frames = pcm.frame_count();
    size_t width = pcm.bytes_per_sample();
    std::vector<int16_t> out(frames);

    if (pcm.channels == 1 && pcm.bits_per_sample == 16 && pcm.format == wav::FORMAT_PCM) {
        std::memcpy(out.data(), pcm.data.data(), frames * sizeof(int16_t));
        return out;
    }

    const uint8_t* p = pcm.data.data();
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (uint16_t c = 0; c < pcm.channels; ++c) {
            sum += read_sample(p, pcm.bits_per_sample, pcm.format);
            p += width;
        }
        out[i] = to_s16(sum / pcm.channels);
    }
    return out;
}

std::vector<int16_t> resample_linear(std::span<const int16_t> in,
                                     uint32_t from_rate, uint32_t to_rate) {
    if (from_rate == to_rate || in.empty() || from_rate == 0 || to_rate == 0) {
        return {in.begin(), in.end()};
    }

    size_t out_len = static_cast<size_t>(
        static_cast<uint64_t>(in.size()) * to_rate / from_rate);
    std::vector<int16_t> out(out_len);
    double step = static_cast<double>(from_rate) / to_rate;

    for (size_t i = 0; i < out_len; ++i) {
        double pos = i * step;
        size_t idx = static_cast<size_t>(pos);
        double frac = pos - static_cast<double>(idx);
        int16_t a = in[std::min(idx, in.size() - 1)];
        int16_t b = in[std::min(idx + 1, in.size() - 1)];
        out[i] = static_cast<int16_t>(std::lround(a + (b - a) * frac));
    }
    return out;
}

std::vector<int16_t> normalize(const wav::Pcm& pcm, uint32_t target_rate) {
    auto mono = to_mono_s16(pcm);
    if (pcm.sample_rate == target_rate) return mono;
    return resample_linear(mono, pcm.sample_rate, target_rate);
}

} // namespace audio
