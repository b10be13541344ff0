#pragma once

#include "update.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

struct TranscriptSnapshot {
    std::vector<std::string> segments;
    std::string partial;
    std::string finalized_text;
    std::string displayed_text;
};

// Finalized segments plus at most one partial. Segments are append-only;
// the partial is replaced wholesale and dropped on commit.
// Mutated by the session worker only; any thread may read.
class TranscriptBuffer {
public:
    explicit TranscriptBuffer(std::string separator = " ");

    void set_partial(std::string text);

    // Clears the partial. Appends `text` unless it is blank.
    // Returns true when a segment was appended.
    bool commit(std::string text);

    // Partial -> set_partial, Final -> commit, Empty -> nothing.
    void apply(const Update& update);

    void clear();

    std::string finalized_text() const;
    std::string displayed_text() const;
    std::string partial() const;
    size_t segment_count() const;
    bool empty() const;

    TranscriptSnapshot snapshot() const;

private:
    std::string join_locked() const;

    mutable std::mutex mu_;
    std::string separator_;
    std::vector<std::string> segments_;
    std::string partial_;
};
