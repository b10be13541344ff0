#include "session.hpp"

#include "file_source.hpp"
#include "live_source.hpp"
#include "transcript_export.hpp"

#include <format>
#include <print>

SessionController::SessionController(Config config, RecognizerFactory& factory,
                                     AudioCapture& capture, RingBuffer& ring_buf, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      factory_(factory), capture_(capture), ring_buf_(ring_buf),
      buffer_(config_.transcript.separator) {}

SessionController::~SessionController() {
    shutdown();
}

std::expected<void, Error> SessionController::start_live() {
    if (auto ready = ensure_idle(); !ready) return ready;

    std::stop_source stop;
    auto source = LiveChunkSource::open(capture_, ring_buf_, config_.audio.chunk_format(),
                                        stop.get_token(), config_.audio.poll_interval());
    if (!source) {
        std::println(stderr, "session: cannot start live capture: {}", source.error().message);
        return std::unexpected(source.error());
    }

    return start(std::move(*source), std::move(stop));
}

std::expected<void, Error> SessionController::start_file(const std::string& path) {
    if (auto ready = ensure_idle(); !ready) return ready;

    auto source = FileChunkSource::open(path, config_.audio.chunk_format(), config_.file.resample);
    if (!source) {
        std::println(stderr, "session: cannot open {}: {}", path, source.error().message);
        return std::unexpected(source.error());
    }

    log(std::format("File loaded, {:.1f}s audio", (*source)->duration_s()));
    return start(std::move(*source));
}

std::expected<void, Error> SessionController::start(std::unique_ptr<AudioChunkSource> source,
                                                    std::stop_source stop) {
    if (auto ready = ensure_idle(); !ready) {
        source->close();
        return ready;
    }

    buffer_.clear();
    transcriber_ = std::make_unique<StreamingTranscriber>(factory_, buffer_,
                                                          source->format().sample_rate);
    if (auto started = transcriber_->start(); !started) {
        source->close();
        transcriber_.reset();
        return started;
    }

    {
        std::lock_guard lock(summary_mu_);
        summary_.reset();
    }

    stop_ = std::move(stop);
    started_at_ = std::chrono::steady_clock::now();
    state_.store(SessionState::Running, std::memory_order_release);
    log(source->is_live() ? "Live session started" : "File session started");

    worker_ = std::jthread([this, source = std::move(source), token = stop_.get_token()]() mutable {
        run_worker(std::move(source), std::move(token));
    });
    return {};
}

std::expected<SessionSummary, Error> SessionController::stop() {
    if (state() != SessionState::Running) {
        std::println(stderr, "session: stop requested while {}", to_string(state()));
        return fail(ErrorCode::NotActive, "no session is running");
    }

    stop_.request_stop();
    return wait();
}

std::expected<SessionSummary, Error> SessionController::wait() {
    if (worker_.joinable()) {
        worker_.join();
    }

    auto summary = last_summary();
    if (!summary) {
        return fail(ErrorCode::NotActive, "no session has run");
    }
    return *summary;
}

void SessionController::shutdown() {
    stop_.request_stop();
    if (worker_.joinable()) worker_.join();
}

void SessionController::clear() {
    buffer_.clear();
}

void SessionController::subscribe(SessionObserver observer) {
    std::lock_guard lock(observers_mu_);
    observers_.push_back(std::move(observer));
}

double SessionController::elapsed() const {
    if (state() == SessionState::Running) {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
    }
    auto summary = last_summary();
    return summary ? summary->elapsed_s : 0.0;
}

std::optional<SessionSummary> SessionController::last_summary() const {
    std::lock_guard lock(summary_mu_);
    return summary_;
}

std::expected<std::filesystem::path, Error>
SessionController::export_transcript(const std::filesystem::path& dir, std::string_view prefix) const {
    auto text = buffer_.finalized_text();
    if (text.empty()) {
        return fail(ErrorCode::IoError, "transcript is empty, nothing to export");
    }
    return transcript_export::write(dir, prefix, text);
}

std::expected<void, Error> SessionController::ensure_idle() {
    if (state() == SessionState::Running) {
        std::println(stderr, "session: cannot start, a session is already running");
        return fail(ErrorCode::AlreadyActive, "a session is already running");
    }
    // Reap a session that ended on its own.
    if (worker_.joinable()) worker_.join();
    return {};
}

void SessionController::run_worker(std::unique_ptr<AudioChunkSource> source, std::stop_token stop) {
    DriverLoop driver(
        [this](const Update& u) { emit_update(u); },
        [this](const Error& e) { emit_error(e); });

    auto result = driver.run(*source, *transcriber_, stop);
    source->close();

    SessionSummary summary;
    summary.live = source->is_live();
    summary.stats = driver.stats();
    summary.transcript = buffer_.finalized_text();
    summary.elapsed_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started_at_).count();
    summary.audio_s = static_cast<double>(summary.stats.samples_fed) /
                      source->format().sample_rate;

    if (result) {
        summary.outcome = *result;
        log(std::format("Session {} after {:.1f}s, {} chunks, {} chars",
                        to_string(*result), summary.elapsed_s,
                        summary.stats.chunks_fed, summary.transcript.size()));
    } else {
        summary.error = result.error();
        // Chunk errors already went out through the driver.
        if (!is_chunk_local(result.error().code)) emit_error(result.error());
        std::println(stderr, "session: aborted: {}", result.error().message);
    }

    {
        std::lock_guard lock(summary_mu_);
        summary_ = summary;
    }
    state_.store(SessionState::Stopped, std::memory_order_release);
    emit_finished(summary);
}

void SessionController::emit_update(const Update& update) {
    std::lock_guard lock(observers_mu_);
    for (auto& obs : observers_) {
        if (obs.on_update) obs.on_update(update);
    }
}

void SessionController::emit_error(const Error& error) {
    std::lock_guard lock(observers_mu_);
    for (auto& obs : observers_) {
        if (obs.on_error) obs.on_error(error);
    }
}

void SessionController::emit_finished(const SessionSummary& summary) {
    std::lock_guard lock(observers_mu_);
    for (auto& obs : observers_) {
        if (obs.on_finished) obs.on_finished(summary);
    }
}

void SessionController::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[livescribe] {}", msg);
    }
}
