#pragma once

#include <expected>
#include <string>

// Capture device producing raw S16_LE mono frames into a RingBuffer from its
// own thread. start() must give up within a bounded time.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual std::expected<void, std::string> start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
};
