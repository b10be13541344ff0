#include "live_source.hpp"

#include <format>
#include <print>
#include <thread>

LiveChunkSource::LiveChunkSource(AudioCapture& capture, RingBuffer& ring_buf,
                                 const ChunkFormat& format, std::stop_token stop,
                                 std::chrono::milliseconds poll_interval)
    : capture_(capture), ring_buf_(ring_buf), format_(format),
      stop_(std::move(stop)), poll_interval_(poll_interval) {}

std::expected<std::unique_ptr<LiveChunkSource>, Error>
LiveChunkSource::open(AudioCapture& capture, RingBuffer& ring_buf, const ChunkFormat& format,
                      std::stop_token stop, std::chrono::milliseconds poll_interval) {
    if (format.channels != 1 || format.chunk_samples == 0) {
        return fail(ErrorCode::UnsupportedFormat,
                    std::format("live capture needs mono chunks, got {} ch x {} samples",
                                format.channels, format.chunk_samples));
    }
    if (format.chunk_bytes() > ring_buf.capacity()) {
        return fail(ErrorCode::UnsupportedFormat,
                    std::format("chunk of {} bytes does not fit the {} byte capture buffer",
                                format.chunk_bytes(), ring_buf.capacity()));
    }

    ring_buf.reset();
    auto started = capture.start();
    if (!started) {
        return fail(ErrorCode::DeviceUnavailable, started.error());
    }

    return std::unique_ptr<LiveChunkSource>(
        new LiveChunkSource(capture, ring_buf, format, std::move(stop), poll_interval));
}

LiveChunkSource::~LiveChunkSource() {
    close();
}

std::optional<AudioChunk> LiveChunkSource::next() {
    while (!closed_) {
        if (stop_.stop_requested()) {
            close();
            return std::nullopt;
        }

        if (auto samples = ring_buf_.read_samples(format_.chunk_samples)) {
            return AudioChunk{
                .samples = std::move(*samples),
                .sample_rate = format_.sample_rate,
                .channels = format_.channels,
            };
        }

        if (!capture_.is_capturing()) {
            std::println(stderr, "audio: capture stopped unexpectedly, ending stream");
            close();
            return std::nullopt;
        }

        std::this_thread::sleep_for(poll_interval_);
    }
    return std::nullopt;
}

void LiveChunkSource::close() {
    if (closed_) return;
    closed_ = true;
    capture_.stop();

    if (size_t dropped = ring_buf_.dropped_bytes(); dropped > 0) {
        std::println(stderr, "audio: capture buffer overflowed, {} bytes dropped", dropped);
    }
}
