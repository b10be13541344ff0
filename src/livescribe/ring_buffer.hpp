#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <vector>

// Lock-free single-producer single-consumer byte ring.
// Producer (capture thread) calls write(). Consumer (session worker) calls
// read() / read_samples(). Order is strictly FIFO; when full, the newest bytes
// are dropped and counted rather than blocking the producer.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_bytes)
        : buf_(capacity_bytes), capacity_(capacity_bytes) {}

    // Producer: returns bytes actually written.
    size_t write(const void* data, size_t len) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t avail = capacity_ - (w - r);
        size_t to_write = std::min(len, avail);
        if (to_write < len) {
            dropped_.fetch_add(len - to_write, std::memory_order_relaxed);
        }
        if (to_write == 0) return 0;

        auto src = static_cast<const uint8_t*>(data);
        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::memcpy(buf_.data() + offset, src, first);
        if (first < to_write) {
            std::memcpy(buf_.data(), src + first, to_write - first);
        }

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: read up to max_len bytes. Returns bytes actually read.
    size_t read(void* dest, size_t max_len) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(max_len, w - r);
        if (to_read == 0) return 0;

        auto dst = static_cast<uint8_t*>(dest);
        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::memcpy(dst, buf_.data() + offset, first);
        if (first < to_read) {
            std::memcpy(dst + first, buf_.data(), to_read - first);
        }

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    // Consumer: exactly `count` int16 samples, or nothing if fewer are buffered.
    std::optional<std::vector<int16_t>> read_samples(size_t count) {
        size_t bytes = count * sizeof(int16_t);
        if (count == 0 || available() < bytes) return std::nullopt;

        std::vector<int16_t> samples(count);
        read(samples.data(), bytes);
        return samples;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }
    size_t dropped_bytes() const { return dropped_.load(std::memory_order_relaxed); }

    // Only safe while the producer is stopped.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<uint8_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
