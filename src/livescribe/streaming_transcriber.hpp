#pragma once

#include "audio_chunk.hpp"
#include "errors.hpp"
#include "recognizer/recognizer.hpp"
#include "transcript_buffer.hpp"
#include "update.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

enum class TranscriberState { Idle, Active, Stopped };

constexpr std::string_view to_string(TranscriberState state) {
    switch (state) {
        case TranscriberState::Idle: return "idle";
        case TranscriberState::Active: return "active";
        case TranscriberState::Stopped: return "stopped";
    }
    return "unknown";
}

// Feeds chunks, in arrival order, into a recognizer owned for the duration of
// one start()/stop() bracket and applies every result to `buffer`.
class StreamingTranscriber {
public:
    StreamingTranscriber(RecognizerFactory& factory, TranscriptBuffer& buffer,
                         uint32_t sample_rate);

    StreamingTranscriber(const StreamingTranscriber&) = delete;
    StreamingTranscriber& operator=(const StreamingTranscriber&) = delete;

    // Allocates a fresh recognizer. AlreadyActive while active.
    std::expected<void, Error> start();

    // InvalidChunk leaves the recognizer untouched. DecodeFailed means the
    // recognizer dropped this chunk; the session can go on.
    std::expected<Update, Error> feed(const AudioChunk& chunk);

    // Flushes the in-flight utterance as a Final, then releases the recognizer.
    std::expected<Update, Error> stop();

    TranscriberState state() const { return state_; }
    uint32_t sample_rate() const { return sample_rate_; }
    uint64_t samples_fed() const { return samples_fed_; }

private:
    Error contract_violation(ErrorCode code, std::string_view op) const;

    RecognizerFactory& factory_;
    TranscriptBuffer& buffer_;
    uint32_t sample_rate_;

    TranscriberState state_ = TranscriberState::Idle;
    std::unique_ptr<Recognizer> recognizer_;
    std::string partial_;
    uint64_t samples_fed_ = 0;
};
