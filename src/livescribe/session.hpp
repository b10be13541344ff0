#pragma once

#include "audio_source.hpp"
#include "config.hpp"
#include "driver.hpp"
#include "errors.hpp"
#include "platform/audio_capture.hpp"
#include "recognizer/recognizer.hpp"
#include "ring_buffer.hpp"
#include "streaming_transcriber.hpp"
#include "transcript_buffer.hpp"
#include "update.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

enum class SessionState { Idle, Running, Stopped };

constexpr std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Running: return "running";
        case SessionState::Stopped: return "stopped";
    }
    return "unknown";
}

struct SessionSummary {
    bool live = false;
    std::optional<SessionOutcome> outcome; // empty when the session aborted
    std::optional<Error> error;
    std::string transcript;
    double elapsed_s = 0.0;
    double audio_s = 0.0;
    DriverStats stats;
};

// Observer of one session. Callbacks run on the session worker thread and
// must not call back into the controller.
struct SessionObserver {
    std::function<void(const Update&)> on_update;
    std::function<void(const Error&)> on_error;
    std::function<void(const SessionSummary&)> on_finished;
};

// Runs at most one transcription session at a time on a worker thread.
// Each session gets its own stop source, transcriber and recognizer; the
// transcript buffer outlives the session until cleared or restarted.
class SessionController {
public:
    SessionController(Config config, RecognizerFactory& factory,
                      AudioCapture& capture, RingBuffer& ring_buf, bool verbose = false);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    std::expected<void, Error> start_live();
    std::expected<void, Error> start_file(const std::string& path);
    std::expected<void, Error> start(std::unique_ptr<AudioChunkSource> source,
                                     std::stop_source stop = {});

    // Cancels the running session and waits for it to wind down.
    std::expected<SessionSummary, Error> stop();

    // Waits for the current session to end on its own (file sources).
    std::expected<SessionSummary, Error> wait();

    // Cancels any running session and joins the worker. Once this returns no
    // observer callback is in flight. Safe to call in any state.
    void shutdown();

    void clear();

    void subscribe(SessionObserver observer);

    SessionState state() const { return state_.load(std::memory_order_acquire); }
    TranscriptSnapshot snapshot() const { return buffer_.snapshot(); }
    double elapsed() const;
    std::optional<SessionSummary> last_summary() const;

    std::expected<std::filesystem::path, Error>
        export_transcript(const std::filesystem::path& dir, std::string_view prefix = "vosk") const;

    const Config& config() const { return config_; }

private:
    std::expected<void, Error> ensure_idle();
    void run_worker(std::unique_ptr<AudioChunkSource> source, std::stop_token stop);

    void emit_update(const Update& update);
    void emit_error(const Error& error);
    void emit_finished(const SessionSummary& summary);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    RecognizerFactory& factory_;
    AudioCapture& capture_;
    RingBuffer& ring_buf_;

    TranscriptBuffer buffer_;
    std::unique_ptr<StreamingTranscriber> transcriber_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::stop_source stop_;
    std::chrono::steady_clock::time_point started_at_;

    mutable std::mutex summary_mu_;
    std::optional<SessionSummary> summary_;

    std::mutex observers_mu_;
    std::vector<SessionObserver> observers_;

    std::jthread worker_;
};
