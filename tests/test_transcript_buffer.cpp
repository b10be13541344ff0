#include <catch2/catch_test_macros.hpp>

#include "transcript_buffer.hpp"
#include "update.hpp"

TEST_CASE("TranscriptBuffer", "[transcript]") {
    TranscriptBuffer buf;

    SECTION("StartsEmpty") {
        REQUIRE(buf.empty());
        REQUIRE(buf.finalized_text().empty());
        REQUIRE(buf.displayed_text().empty());
    }

    SECTION("PartialIsReplacedNotAppended") {
        buf.set_partial("hel");
        buf.set_partial("hello");
        REQUIRE(buf.partial() == "hello");
        REQUIRE(buf.displayed_text() == "hello");
        REQUIRE(buf.finalized_text().empty());
        REQUIRE(buf.segment_count() == 0);
    }

    SECTION("CommitAppendsAndDropsPartial") {
        buf.set_partial("hello wor");
        REQUIRE(buf.commit("hello world"));
        REQUIRE(buf.partial().empty());
        REQUIRE(buf.finalized_text() == "hello world");

        buf.set_partial("again");
        REQUIRE(buf.displayed_text() == "hello world again");
        REQUIRE(buf.finalized_text() == "hello world");
    }

    SECTION("BlankCommitKeepsSegments") {
        buf.commit("one");
        buf.set_partial("noise");
        REQUIRE_FALSE(buf.commit("  "));
        REQUIRE_FALSE(buf.commit(""));
        REQUIRE(buf.segment_count() == 1);
        REQUIRE(buf.partial().empty());
    }

    SECTION("ApplyUpdates") {
        buf.apply(Update::make_partial("a"));
        REQUIRE(buf.partial() == "a");
        buf.apply(Update::make_empty());
        REQUIRE(buf.partial() == "a");
        buf.apply(Update::make_final("a b"));
        buf.apply(Update::make_final("c"));
        REQUIRE(buf.finalized_text() == "a b c");
    }

    SECTION("ClearIsIdempotent") {
        buf.commit("one");
        buf.set_partial("two");
        buf.clear();
        REQUIRE(buf.empty());
        buf.clear();
        REQUIRE(buf.empty());
        REQUIRE(buf.displayed_text().empty());
    }

    SECTION("Snapshot") {
        buf.commit("first");
        buf.commit("second");
        buf.set_partial("thi");

        auto snap = buf.snapshot();
        REQUIRE(snap.segments == std::vector<std::string>{"first", "second"});
        REQUIRE(snap.partial == "thi");
        REQUIRE(snap.finalized_text == "first second");
        REQUIRE(snap.displayed_text == "first second thi");
    }
}

TEST_CASE("TranscriptBuffer custom separator", "[transcript]") {
    TranscriptBuffer buf("\n");
    buf.commit("line one");
    buf.commit("line two");
    buf.set_partial("three");
    REQUIRE(buf.finalized_text() == "line one\nline two");
    REQUIRE(buf.displayed_text() == "line one\nline two\nthree");
}
