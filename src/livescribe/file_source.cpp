#include "file_source.hpp"

#include "audio_normalize.hpp"
#include "wav.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>

FileChunkSource::FileChunkSource(std::vector<int16_t> samples, const ChunkFormat& format)
    : samples_(std::move(samples)), format_(format) {}

std::expected<std::unique_ptr<FileChunkSource>, Error>
FileChunkSource::open(const std::string& path, const ChunkFormat& format, bool allow_resample) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return fail(ErrorCode::IoError,
                    std::format("could not open {}: {}", path, std::strerror(errno)));
    }

    std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    if (f.bad()) {
        return fail(ErrorCode::IoError, std::format("could not read {}", path));
    }

    return from_wav(bytes, format, allow_resample);
}

std::expected<std::unique_ptr<FileChunkSource>, Error>
FileChunkSource::from_wav(std::span<const uint8_t> bytes, const ChunkFormat& format,
                          bool allow_resample) {
    auto pcm = wav::decode(bytes);
    if (!pcm) {
        return fail(ErrorCode::UnsupportedFormat, pcm.error());
    }

    auto mismatch = audio::format_mismatch(*pcm, format.sample_rate);
    if (mismatch && !allow_resample) {
        return fail(ErrorCode::UnsupportedFormat,
                    std::format("{} mismatch: file is {} ch / {}-bit / {} Hz, "
                                "expected 1 ch / 16-bit / {} Hz",
                                *mismatch, pcm->channels, pcm->bits_per_sample,
                                pcm->sample_rate, format.sample_rate));
    }

    auto samples = mismatch ? audio::normalize(*pcm, format.sample_rate)
                            : audio::to_mono_s16(*pcm);
    return std::make_unique<FileChunkSource>(std::move(samples), format);
}

std::optional<AudioChunk> FileChunkSource::next() {
    if (pos_ >= samples_.size() || format_.chunk_samples == 0) return std::nullopt;

    size_t n = std::min(format_.chunk_samples, samples_.size() - pos_);
    AudioChunk chunk;
    chunk.sample_rate = format_.sample_rate;
    chunk.channels = 1;
    chunk.samples.assign(samples_.begin() + pos_, samples_.begin() + pos_ + n);
    pos_ += n;
    return chunk;
}

void FileChunkSource::close() {
    pos_ = samples_.size();
}

double FileChunkSource::duration_s() const {
    if (format_.sample_rate == 0) return 0.0;
    return static_cast<double>(samples_.size()) / format_.sample_rate;
}
