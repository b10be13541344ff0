#include "driver.hpp"

#include <print>

DriverLoop::DriverLoop(UpdateCallback on_update, ErrorCallback on_error)
    : on_update_(std::move(on_update)), on_error_(std::move(on_error)) {}

std::expected<SessionOutcome, Error> DriverLoop::run(AudioChunkSource& source,
                                                     StreamingTranscriber& transcriber,
                                                     std::stop_token stop) {
    stats_ = {};

    while (true) {
        if (stop.stop_requested()) {
            if (auto r = finish(source, transcriber); !r) return std::unexpected(r.error());
            return SessionOutcome::Cancelled;
        }

        auto chunk = source.next();
        if (!chunk) {
            if (auto r = finish(source, transcriber); !r) return std::unexpected(r.error());
            return stop.stop_requested() ? SessionOutcome::Cancelled : SessionOutcome::Completed;
        }

        // A stop that arrived while waiting wins over the chunk.
        if (stop.stop_requested()) continue;

        auto update = transcriber.feed(*chunk);
        if (update) {
            ++stats_.chunks_fed;
            stats_.samples_fed += chunk->samples.size();
            if (on_update_) on_update_(*update);
            continue;
        }

        const Error& err = update.error();
        if (!is_chunk_local(err.code)) {
            // Contract violation: the transcriber was not active.
            source.close();
            return std::unexpected(err);
        }

        ++stats_.chunks_dropped;
        if (on_error_) on_error_(err);

        if (!source.is_live()) {
            std::println(stderr, "driver: aborting file session: {}", err.message);
            if (auto r = finish(source, transcriber); !r) return std::unexpected(r.error());
            return std::unexpected(err);
        }
        std::println(stderr, "driver: dropped chunk: {}", err.message);
    }
}

std::expected<void, Error> DriverLoop::finish(AudioChunkSource& source,
                                              StreamingTranscriber& transcriber) {
    source.close();
    auto last = transcriber.stop();
    if (!last) return std::unexpected(last.error());
    if (on_update_) on_update_(*last);
    return {};
}
