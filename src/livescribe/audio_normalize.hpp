#pragma once

#include "wav.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace audio {

// First property of `pcm` that differs from mono / 16-bit / target_rate:
// "channel count", "sample width" or "sample rate". Empty when it matches.
std::optional<std::string> format_mismatch(const wav::Pcm& pcm, uint32_t target_rate);

// Decode any supported integer or float layout to int16, averaging channels.
std::vector<int16_t> to_mono_s16(const wav::Pcm& pcm);

std::vector<int16_t> resample_linear(std::span<const int16_t> in,
                                     uint32_t from_rate, uint32_t to_rate);

// Remix, convert and resample wholesale to mono S16 at target_rate.
std::vector<int16_t> normalize(const wav::Pcm& pcm, uint32_t target_rate);

} // namespace audio
