#include "relay.hpp"

#include <format>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace {

std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

} // namespace

std::expected<ExternalState, Error> ExternalState::parse(std::string_view line) {
    try {
        auto j = json::parse(line);
        if (!j.is_object()) {
            return fail(ErrorCode::ExternalError, "relay state is not a JSON object");
        }

        ExternalState s;
        if (j.contains("transcript") && j["transcript"].is_string()) {
            s.transcript = j["transcript"].get<std::string>();
        }
        if (j.contains("isListening")) s.is_listening = j["isListening"].get<bool>();
        if (j.contains("error") && j["error"].is_string()) s.error = j["error"].get<std::string>();
        return s;
    } catch (const json::exception& e) {
        return fail(ErrorCode::ExternalError, std::format("bad relay state: {}", e.what()));
    }
}

ExternalTranscriptRelay::ExternalTranscriptRelay(TranscriptBuffer& buffer) : buffer_(buffer) {}

std::expected<Update, Error> ExternalTranscriptRelay::apply(const ExternalState& state) {
    bool was_listening = listening_;
    listening_ = state.is_listening;
    last_transcript_ = state.transcript;

    // Cleared on the other side.
    if (state.transcript.empty() && !committed_.empty()) {
        committed_.clear();
        pending_.clear();
        buffer_.clear();
    }

    if (!state.transcript.starts_with(committed_)) {
        std::println(stderr, "relay: committed text was rewritten externally, restarting");
        committed_.clear();
        pending_.clear();
        buffer_.clear();
    }

    Update update;
    std::string pending = trim(state.transcript.substr(committed_.size()));

    if (state.is_listening) {
        if (pending != pending_) {
            pending_ = pending;
            buffer_.set_partial(pending);
            update = Update::make_partial(pending);
        }
    } else if (was_listening || !pending.empty()) {
        buffer_.commit(pending);
        committed_ = state.transcript;
        pending_.clear();
        update = Update::make_final(pending);
    }

    if (!state.error.empty() && state.error != last_error_) {
        last_error_ = state.error;
        return fail(ErrorCode::ExternalError, state.error);
    }
    if (state.error.empty()) last_error_.clear();

    return update;
}

Update ExternalTranscriptRelay::finish() {
    if (!listening_) return Update::make_empty();

    auto update = apply(ExternalState{.transcript = last_transcript_, .is_listening = false, .error = ""});
    return update ? *update : Update::make_empty();
}
