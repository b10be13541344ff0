#include "platform/linux/pipewire_capture.hpp"

#include <format>
#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>
#include <thread>

PipeWireCapture::PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate,
                                 std::chrono::milliseconds connect_timeout)
    : ring_buf_(ring_buf), sample_rate_(sample_rate), connect_timeout_(connect_timeout) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

std::expected<void, std::string> PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) return {};

    stream_state_.store(PW_STREAM_STATE_UNCONNECTED, std::memory_order_relaxed);
    {
        std::lock_guard lock(error_mu_);
        stream_error_.clear();
    }

    loop_ = pw_thread_loop_new("livescribe", nullptr);
    if (!loop_) {
        return std::unexpected("failed to create PipeWire thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "livescribe",
        PW_KEY_APP_NAME, "livescribe",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "livescribe-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown();
        return std::unexpected("failed to create PipeWire capture stream");
    }

    // S16_LE, mono, session rate
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        teardown();
        return std::unexpected(std::format("stream connect failed: {}", spa_strerror(ret)));
    }

    capturing_.store(true, std::memory_order_release);

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        teardown();
        return std::unexpected(std::format("thread loop start failed: {}", spa_strerror(ret)));
    }

    auto deadline = std::chrono::steady_clock::now() + connect_timeout_;
    while (true) {
        int state = stream_state_.load(std::memory_order_acquire);
        if (state == PW_STREAM_STATE_STREAMING) break;

        if (state == PW_STREAM_STATE_ERROR) {
            std::string error;
            {
                std::lock_guard lock(error_mu_);
                error = stream_error_;
            }
            stop();
            return std::unexpected("capture stream error: " + error);
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            stop();
            return std::unexpected(std::format("no capture device started streaming within {} ms",
                                               connect_timeout_.count()));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    return {};
}

void PipeWireCapture::stop() {
    if (!capturing_.exchange(false, std::memory_order_acq_rel)) return;
    teardown();
}

void PipeWireCapture::teardown() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
    size_t size = d->chunk->size;

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_buf_.write(data, size);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
        std::lock_guard lock(self->error_mu_);
        self->stream_error_ = error;
    }

    self->stream_state_.store(state, std::memory_order_release);
}
