#pragma once

#include "errors.hpp"
#include "transcript_buffer.hpp"
#include "update.hpp"

#include <expected>
#include <string>
#include <string_view>

// State reported by an external (browser) recognizer.
struct ExternalState {
    std::string transcript;
    bool is_listening = false;
    std::string error;

    // {"transcript": "...", "isListening": true, "error": ""}; missing keys
    // keep their defaults.
    static std::expected<ExternalState, Error> parse(std::string_view line);
};

// Turns successive ExternalState snapshots into the Update stream the
// engine produces. The external transcript may be revised freely while
// listening; those revisions surface as Partial. Stopping commits it.
class ExternalTranscriptRelay {
public:
    explicit ExternalTranscriptRelay(TranscriptBuffer& buffer);

    // An external error is returned as ExternalError once per distinct message;
    // the transcript carried by the same state is still applied.
    std::expected<Update, Error> apply(const ExternalState& state);

    // The external stream ended. Commits anything still pending as if the
    // recognizer had stopped listening.
    Update finish();

    bool listening() const { return listening_; }

private:
    TranscriptBuffer& buffer_;
    std::string last_transcript_;
    std::string committed_;  // prefix of the external transcript already finalized
    std::string pending_;
    std::string last_error_;
    bool listening_ = false;
};
