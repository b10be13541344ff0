#pragma once

#include "audio_source.hpp"
#include "errors.hpp"
#include "streaming_transcriber.hpp"
#include "update.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <stop_token>
#include <string_view>

enum class SessionOutcome { Completed, Cancelled };

constexpr std::string_view to_string(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::Completed: return "completed";
        case SessionOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

struct DriverStats {
    uint64_t chunks_fed = 0;
    uint64_t chunks_dropped = 0;
    uint64_t samples_fed = 0;
};

// Pulls chunks from a source into an active transcriber until the source
// ends or `stop` is requested, forwarding every Update. The transcriber is
// always stopped (and its trailing Final emitted) before run() returns.
class DriverLoop {
public:
    using UpdateCallback = std::function<void(const Update&)>;
    using ErrorCallback = std::function<void(const Error&)>;

    DriverLoop(UpdateCallback on_update, ErrorCallback on_error);

    // Chunk-local errors are reported and skipped on live sources. On file
    // sources they abort the run and are returned, after the transcriber has
    // been stopped so committed text survives.
    std::expected<SessionOutcome, Error> run(AudioChunkSource& source,
                                             StreamingTranscriber& transcriber,
                                             std::stop_token stop);

    const DriverStats& stats() const { return stats_; }

private:
    std::expected<void, Error> finish(AudioChunkSource& source, StreamingTranscriber& transcriber);

    UpdateCallback on_update_;
    ErrorCallback on_error_;
    DriverStats stats_;
};
