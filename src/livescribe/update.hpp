#pragma once

#include <string>
#include <string_view>
#include <utility>

// One incremental transcription result. Partial text replaces the previous
// partial; Final text is committed to the transcript for good.
struct Update {
    enum class Kind { Empty, Partial, Final };

    Kind kind = Kind::Empty;
    std::string text;

    static Update make_empty() { return {}; }
    static Update make_partial(std::string text) { return {Kind::Partial, std::move(text)}; }
    static Update make_final(std::string text) { return {Kind::Final, std::move(text)}; }

    bool is_final() const { return kind == Kind::Final; }
    bool is_partial() const { return kind == Kind::Partial; }
    bool is_empty() const { return kind == Kind::Empty; }

    bool operator==(const Update&) const = default;
};

constexpr std::string_view to_string(Update::Kind kind) {
    switch (kind) {
        case Update::Kind::Empty: return "empty";
        case Update::Kind::Partial: return "partial";
        case Update::Kind::Final: return "final";
    }
    return "unknown";
}
