#pragma once

#include "errors.hpp"
#include "session.hpp"
#include "update.hpp"

#include <functional>
#include <mutex>
#include <string>

// Draws updates on the terminal. Partials are redrawn in place on a tty;
// finals are printed as lines. Safe to call from the session worker and the
// main loop at the same time.
class ConsoleRenderer {
public:
    explicit ConsoleRenderer(bool interactive);

    void render(const Update& update);
    void report(const Error& error);
    void message(const std::string& text);

    // Observer that renders everything and calls `finished` at session end.
    SessionObserver observer(std::function<void()> finished);

private:
    void clear_partial_locked();

    std::mutex mu_;
    bool interactive_;
    bool partial_shown_ = false;
};
