#include "renderer.hpp"

#include <cstdio>
#include <print>

ConsoleRenderer::ConsoleRenderer(bool interactive) : interactive_(interactive) {}

void ConsoleRenderer::render(const Update& update) {
    std::lock_guard lock(mu_);
    switch (update.kind) {
        case Update::Kind::Empty:
            break;
        case Update::Kind::Partial:
            if (!interactive_) break;
            std::print("\r\033[K... {}", update.text);
            std::fflush(stdout);
            partial_shown_ = !update.text.empty();
            break;
        case Update::Kind::Final:
            clear_partial_locked();
            if (!update.text.empty()) std::println("{}", update.text);
            std::fflush(stdout);
            break;
    }
}

void ConsoleRenderer::report(const Error& error) {
    std::lock_guard lock(mu_);
    clear_partial_locked();
    std::println(stderr, "error: {}: {}", to_string(error.code), error.message);
}

void ConsoleRenderer::message(const std::string& text) {
    std::lock_guard lock(mu_);
    clear_partial_locked();
    std::println("{}", text);
    std::fflush(stdout);
}

SessionObserver ConsoleRenderer::observer(std::function<void()> finished) {
    return SessionObserver{
        .on_update = [this](const Update& u) { render(u); },
        .on_error = [this](const Error& e) { report(e); },
        .on_finished = [finished = std::move(finished)](const SessionSummary&) {
            if (finished) finished();
        },
    };
}

void ConsoleRenderer::clear_partial_locked() {
    if (partial_shown_) {
        std::print("\r\033[K");
        partial_shown_ = false;
    }
}
