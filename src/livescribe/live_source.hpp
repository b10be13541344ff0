#pragma once

#include "audio_source.hpp"
#include "errors.hpp"
#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <stop_token>

// Infinite source backed by a capture device. The capture thread fills the
// ring; next() hands out chunk_samples-sized chunks in capture order.
// Holds the device from open() until close(), cancellation or destruction.
class LiveChunkSource : public AudioChunkSource {
public:
    static std::expected<std::unique_ptr<LiveChunkSource>, Error>
        open(AudioCapture& capture, RingBuffer& ring_buf, const ChunkFormat& format,
             std::stop_token stop, std::chrono::milliseconds poll_interval);

    ~LiveChunkSource() override;

    LiveChunkSource(const LiveChunkSource&) = delete;
    LiveChunkSource& operator=(const LiveChunkSource&) = delete;

    // Waits for a full chunk, polling the stop token every poll_interval.
    // Cancellation and device loss end the stream; buffered audio is discarded.
    std::optional<AudioChunk> next() override;
    void close() override;
    bool is_live() const override { return true; }
    const ChunkFormat& format() const override { return format_; }

    size_t dropped_bytes() const { return ring_buf_.dropped_bytes(); }

private:
    LiveChunkSource(AudioCapture& capture, RingBuffer& ring_buf, const ChunkFormat& format,
                    std::stop_token stop, std::chrono::milliseconds poll_interval);

    AudioCapture& capture_;
    RingBuffer& ring_buf_;
    ChunkFormat format_;
    std::stop_token stop_;
    std::chrono::milliseconds poll_interval_;
    bool closed_ = false;
};
