#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "live_source.hpp"
#include "ring_buffer.hpp"

#include <chrono>
#include <stop_token>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("LiveChunkSource", "[live_source]") {
    MockAudioCapture capture;
    RingBuffer ring(16 * 1024);
    ChunkFormat fmt{.sample_rate = 16000, .channels = 1, .chunk_samples = 1600};
    std::stop_source stop;

    SECTION("OpenStartsDevice") {
        auto src = LiveChunkSource::open(capture, ring, fmt, stop.get_token(), 1ms);
        REQUIRE(src.has_value());
        REQUIRE((*src)->is_live());
        REQUIRE(capture.start_calls == 1);
        REQUIRE(capture.capturing);
    }

    SECTION("DeviceFailureIsDeviceUnavailable") {
        capture.fail_start = true;
        auto src = LiveChunkSource::open(capture, ring, fmt, stop.get_token(), 1ms);
        REQUIRE_FALSE(src.has_value());
        REQUIRE(src.error().code == ErrorCode::DeviceUnavailable);
    }

    SECTION("ChunkLargerThanRingRejected") {
        RingBuffer tiny(1000);
        auto src = LiveChunkSource::open(capture, tiny, fmt, stop.get_token(), 1ms);
        REQUIRE_FALSE(src.has_value());
        REQUIRE(src.error().code == ErrorCode::UnsupportedFormat);
        REQUIRE(capture.start_calls == 0);
    }

    SECTION("ChunksInCaptureOrder") {
        auto src = LiveChunkSource::open(capture, ring, fmt, stop.get_token(), 1ms);
        REQUIRE(src.has_value());

        std::vector<int16_t> a(1600, 1), b(1600, 2);
        ring.write(a.data(), a.size() * sizeof(int16_t));
        ring.write(b.data(), b.size() * sizeof(int16_t));

        auto first = (*src)->next();
        auto second = (*src)->next();
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(first->samples == a);
        REQUIRE(second->samples == b);
        REQUIRE(first->sample_rate == 16000);
    }

    SECTION("WaitsForFullChunk") {
        auto src = LiveChunkSource::open(capture, ring, fmt, stop.get_token(), 1ms);
        REQUIRE(src.has_value());

        std::vector<int16_t> half(800, 5);
        ring.write(half.data(), half.size() * sizeof(int16_t));

        std::jthread producer([&ring, half]() {
            std::this_thread::sleep_for(20ms);
            ring.write(half.data(), half.size() * sizeof(int16_t));
        });

        auto chunk = (*src)->next();
        REQUIRE(chunk.has_value());
        REQUIRE(chunk->samples.size() == 1600);
    }

    SECTION("CancellationEndsStreamAndReleasesDeviceOnce") {
        auto src = LiveChunkSource::open(capture, ring, fmt, stop.get_token(), 1ms);
        REQUIRE(src.has_value());

        std::jthread canceller([&stop]() {
            std::this_thread::sleep_for(20ms);
            stop.request_stop();
        });

        REQUIRE_FALSE((*src)->next().has_value());
        REQUIRE(capture.stop_calls == 1);

        (*src)->close();
        REQUIRE_FALSE((*src)->next().has_value());
        src->reset();
        REQUIRE(capture.stop_calls == 1);
    }

    SECTION("DeviceLossEndsStream") {
        auto src = LiveChunkSource::open(capture, ring, fmt, stop.get_token(), 1ms);
        REQUIRE(src.has_value());

        capture.capturing = false;
        REQUIRE_FALSE((*src)->next().has_value());
        REQUIRE(capture.stop_calls == 1);
    }

    SECTION("DestructorReleasesDevice") {
        {
            auto src = LiveChunkSource::open(capture, ring, fmt, stop.get_token(), 1ms);
            REQUIRE(src.has_value());
        }
        REQUIRE(capture.stop_calls == 1);
        REQUIRE_FALSE(capture.capturing);
    }
}
