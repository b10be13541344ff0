#include "transcript_buffer.hpp"

#include <algorithm>
#include <cctype>

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

} // namespace

TranscriptBuffer::TranscriptBuffer(std::string separator)
    : separator_(std::move(separator)) {}

void TranscriptBuffer::set_partial(std::string text) {
    std::lock_guard lock(mu_);
    partial_ = std::move(text);
}

bool TranscriptBuffer::commit(std::string text) {
    std::lock_guard lock(mu_);
    partial_.clear();
    if (is_blank(text)) return false;
    segments_.push_back(std::move(text));
    return true;
}

void TranscriptBuffer::apply(const Update& update) {
    switch (update.kind) {
        case Update::Kind::Partial:
            set_partial(update.text);
            break;
        case Update::Kind::Final:
            commit(update.text);
            break;
        case Update::Kind::Empty:
            break;
    }
}

void TranscriptBuffer::clear() {
    std::lock_guard lock(mu_);
    segments_.clear();
    partial_.clear();
}

std::string TranscriptBuffer::finalized_text() const {
    std::lock_guard lock(mu_);
    return join_locked();
}

std::string TranscriptBuffer::displayed_text() const {
    return snapshot().displayed_text;
}

std::string TranscriptBuffer::partial() const {
    std::lock_guard lock(mu_);
    return partial_;
}

size_t TranscriptBuffer::segment_count() const {
    std::lock_guard lock(mu_);
    return segments_.size();
}

bool TranscriptBuffer::empty() const {
    std::lock_guard lock(mu_);
    return segments_.empty() && partial_.empty();
}

TranscriptSnapshot TranscriptBuffer::snapshot() const {
    std::lock_guard lock(mu_);
    TranscriptSnapshot snap;
    snap.segments = segments_;
    snap.partial = partial_;
    snap.finalized_text = join_locked();
    snap.displayed_text = snap.finalized_text;
    if (!partial_.empty()) {
        if (!snap.displayed_text.empty()) snap.displayed_text += separator_;
        snap.displayed_text += partial_;
    }
    return snap;
}

std::string TranscriptBuffer::join_locked() const {
    std::string out;
    for (size_t i = 0; i < segments_.size(); ++i) {
        if (i > 0) out += separator_;
        out += segments_[i];
    }
    return out;
}
