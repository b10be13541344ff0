#include <catch2/catch_test_macros.hpp>

#include "driver.hpp"
#include "fakes.hpp"
#include "streaming_transcriber.hpp"
#include "transcript_buffer.hpp"

#include <stop_token>
#include <vector>

namespace {

struct Recorder {
    std::vector<Update> updates;
    std::vector<Error> errors;

    DriverLoop driver() {
        return DriverLoop([this](const Update& u) { updates.push_back(u); },
                          [this](const Error& e) { errors.push_back(e); });
    }
};

AudioChunk wrong_rate_chunk() {
    AudioChunk c;
    c.samples = speech(4, 1600);
    c.sample_rate = 44100;
    return c;
}

} // namespace

TEST_CASE("DriverLoop", "[driver]") {
    FakeRecognizerFactory factory;
    TranscriptBuffer buffer;
    StreamingTranscriber transcriber(factory, buffer, 16000);
    REQUIRE(transcriber.start().has_value());
    Recorder rec;
    auto driver = rec.driver();
    std::stop_source stop;

    auto utterance = concat({speech(0, 1600), speech(1, 1600), silence(1600), speech(2, 1600)});

    SECTION("FileRunsToCompletion") {
        VectorSource source(chunked(utterance, 1600), false);
        auto outcome = driver.run(source, transcriber, stop.get_token());

        REQUIRE(outcome.has_value());
        REQUIRE(*outcome == SessionOutcome::Completed);
        REQUIRE(source.closed());
        REQUIRE(transcriber.state() == TranscriberState::Stopped);
        REQUIRE(driver.stats().chunks_fed == 4);
        REQUIRE(driver.stats().samples_fed == 6400);
        REQUIRE(buffer.finalized_text() == "hello world streaming");

        // The trailing Final from stop() is always the last update.
        REQUIRE_FALSE(rec.updates.empty());
        REQUIRE(rec.updates.back() == Update::make_final("streaming"));
    }

    SECTION("EmptySourceStillStops") {
        VectorSource source({}, false);
        auto outcome = driver.run(source, transcriber, stop.get_token());
        REQUIRE(*outcome == SessionOutcome::Completed);
        REQUIRE(rec.updates.size() == 1);
        REQUIRE(rec.updates[0] == Update::make_final(""));
    }

    SECTION("CancelBeforeFirstChunk") {
        VectorSource source(chunked(utterance, 1600), true);
        stop.request_stop();
        auto outcome = driver.run(source, transcriber, stop.get_token());

        REQUIRE(*outcome == SessionOutcome::Cancelled);
        REQUIRE(source.closed());
        REQUIRE(driver.stats().chunks_fed == 0);
        REQUIRE(transcriber.state() == TranscriberState::Stopped);
    }

    SECTION("LiveSkipsBadChunks") {
        auto chunks = chunked(speech(0, 1600), 1600);
        chunks.push_back(wrong_rate_chunk());
        auto tail = chunked(concat({speech(1, 1600), silence(1600)}), 1600);
        chunks.insert(chunks.end(), tail.begin(), tail.end());

        VectorSource source(std::move(chunks), true);
        auto outcome = driver.run(source, transcriber, stop.get_token());

        REQUIRE(outcome.has_value());
        REQUIRE(driver.stats().chunks_dropped == 1);
        REQUIRE(driver.stats().chunks_fed == 3);
        REQUIRE(rec.errors.size() == 1);
        REQUIRE(rec.errors[0].code == ErrorCode::InvalidChunk);
        REQUIRE(buffer.finalized_text() == "hello world");
    }

    SECTION("FileAbortsOnBadChunkKeepingCommittedText") {
        auto chunks = chunked(concat({speech(0, 1600), silence(1600)}), 1600);
        chunks.push_back(wrong_rate_chunk());
        auto tail = chunked(speech(1, 1600), 1600);
        chunks.insert(chunks.end(), tail.begin(), tail.end());

        VectorSource source(std::move(chunks), false);
        auto outcome = driver.run(source, transcriber, stop.get_token());

        REQUIRE_FALSE(outcome.has_value());
        REQUIRE(outcome.error().code == ErrorCode::InvalidChunk);
        REQUIRE(rec.errors.size() == 1);
        REQUIRE(source.closed());
        REQUIRE(transcriber.state() == TranscriberState::Stopped);
        REQUIRE(buffer.finalized_text() == "hello");
    }

    SECTION("InactiveTranscriberIsReturned") {
        REQUIRE(transcriber.stop().has_value());
        VectorSource source(chunked(utterance, 1600), false);
        auto outcome = driver.run(source, transcriber, stop.get_token());

        REQUIRE_FALSE(outcome.has_value());
        REQUIRE(outcome.error().code == ErrorCode::NotActive);
        REQUIRE(source.closed());
        REQUIRE(rec.errors.empty());
    }
}
