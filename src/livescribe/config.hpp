#pragma once

#include "audio_chunk.hpp"

#include <chrono>
#include <cstdint>
#include <string>

struct Config {
    struct Model {
        std::string path = "vosk-model-small-en-us-0.15";
        int log_level = -1;
    } model;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t chunk_samples = 4000;
        uint32_t max_seconds = 30;
        uint32_t device_timeout_ms = 3000;
        uint32_t poll_interval_ms = 20;

        // Capture ring sized from max_seconds (no independent config key).
        size_t ring_buffer_bytes() const {
            return static_cast<size_t>(max_seconds) * sample_rate * sizeof(int16_t);
        }

        ChunkFormat chunk_format() const {
            return ChunkFormat{.sample_rate = sample_rate, .channels = 1, .chunk_samples = chunk_samples};
        }

        std::chrono::milliseconds device_timeout() const {
            return std::chrono::milliseconds(device_timeout_ms);
        }
        std::chrono::milliseconds poll_interval() const {
            return std::chrono::milliseconds(poll_interval_ms);
        }
    } audio;

    struct File {
        bool resample = true;
    } file;

    struct Transcript {
        std::string separator = " ";
        std::string export_dir; // empty: platform data dir
    } transcript;

    static Config load(const std::string& path);
    static Config load_default();
};
