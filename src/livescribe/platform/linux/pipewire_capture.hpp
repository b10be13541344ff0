#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

class PipeWireCapture : public AudioCapture {
public:
    PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate = 16000,
                    std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(3000));
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    // Connects a capture stream and waits until it is streaming, fails on a
    // stream error or when connect_timeout elapses.
    std::expected<void, std::string> start() override;
    void stop() override;
    // False once the stream has failed, even before stop() is called.
    bool is_capturing() const override {
        return capturing_.load(std::memory_order_relaxed) &&
               stream_state_.load(std::memory_order_relaxed) != PW_STREAM_STATE_ERROR;
    }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    RingBuffer& ring_buf_;
    uint32_t sample_rate_;
    std::chrono::milliseconds connect_timeout_;
    std::atomic<bool> capturing_{false};
    std::atomic<int> stream_state_{PW_STREAM_STATE_UNCONNECTED};

    std::mutex error_mu_;
    std::string stream_error_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
