#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>

// Incremental recognizer state for one session. Texts are plain, already
// extracted from whatever result format the engine uses.
class Recognizer {
public:
    virtual ~Recognizer() = default;

    // Advances by one contiguous block of mono samples. true when an
    // endpoint was detected; result() then holds the committed text.
    virtual std::expected<bool, std::string> accept(std::span<const int16_t> samples) = 0;

    virtual std::string result() = 0;
    virtual std::string partial_result() = 0;

    // Flushes everything not yet returned by result(), endpoint or not.
    virtual std::string final_result() = 0;
};

class RecognizerFactory {
public:
    virtual ~RecognizerFactory() = default;
    virtual std::expected<std::unique_ptr<Recognizer>, Error> create(uint32_t sample_rate) = 0;
};
