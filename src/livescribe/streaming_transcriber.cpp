#include "streaming_transcriber.hpp"

#include <format>
#include <print>

namespace {

std::string trim(std::string text) {
    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

} // namespace

StreamingTranscriber::StreamingTranscriber(RecognizerFactory& factory, TranscriptBuffer& buffer,
                                           uint32_t sample_rate)
    : factory_(factory), buffer_(buffer), sample_rate_(sample_rate) {}

std::expected<void, Error> StreamingTranscriber::start() {
    if (state_ == TranscriberState::Active) {
        return std::unexpected(contract_violation(ErrorCode::AlreadyActive, "start"));
    }

    auto rec = factory_.create(sample_rate_);
    if (!rec) return std::unexpected(rec.error());

    recognizer_ = std::move(*rec);
    partial_.clear();
    samples_fed_ = 0;
    state_ = TranscriberState::Active;
    return {};
}

std::expected<Update, Error> StreamingTranscriber::feed(const AudioChunk& chunk) {
    if (state_ != TranscriberState::Active) {
        return std::unexpected(contract_violation(ErrorCode::NotActive, "feed"));
    }
    if (chunk.channels != 1) {
        return fail(ErrorCode::InvalidChunk,
                    std::format("expected mono chunk, got {} channels", chunk.channels));
    }
    if (chunk.sample_rate != sample_rate_) {
        return fail(ErrorCode::InvalidChunk,
                    std::format("chunk is {} Hz, session runs at {} Hz",
                                chunk.sample_rate, sample_rate_));
    }
    if (chunk.samples.empty()) return Update::make_empty();

    auto endpoint = recognizer_->accept(chunk.samples);
    if (!endpoint) {
        return fail(ErrorCode::DecodeFailed, endpoint.error());
    }
    samples_fed_ += chunk.samples.size();

    if (*endpoint) {
        auto text = trim(recognizer_->result());
        bool had_partial = !partial_.empty();
        partial_.clear();
        // An endpoint over pure silence carries nothing to commit.
        if (text.empty() && !had_partial) return Update::make_empty();
        buffer_.commit(text);
        return Update::make_final(std::move(text));
    }

    auto partial = trim(recognizer_->partial_result());
    if (partial == partial_) return Update::make_empty();

    partial_ = partial;
    buffer_.set_partial(partial);
    return Update::make_partial(std::move(partial));
}

std::expected<Update, Error> StreamingTranscriber::stop() {
    if (state_ != TranscriberState::Active) {
        return std::unexpected(contract_violation(ErrorCode::NotActive, "stop"));
    }

    auto text = trim(recognizer_->final_result());
    buffer_.commit(text);

    recognizer_.reset();
    partial_.clear();
    state_ = TranscriberState::Stopped;
    return Update::make_final(std::move(text));
}

Error StreamingTranscriber::contract_violation(ErrorCode code, std::string_view op) const {
    auto msg = std::format("{}() called while {}", op, to_string(state_));
    std::println(stderr, "transcriber: {}: {}", to_string(code), msg);
    return Error{code, std::move(msg)};
}
