#include "console_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

ConsoleLoop::ConsoleLoop(Config config, RecognizerFactory& factory, Options options, bool verbose)
    : config_(std::move(config)), verbose_(verbose), options_(std::move(options)),
      ring_buf_(config_.audio.ring_buffer_bytes()),
      capture_(ring_buf_, config_.audio.sample_rate, config_.audio.device_timeout()),
      renderer_(isatty(STDOUT_FILENO) != 0),
      session_(config_, factory, capture_, ring_buf_, verbose_) {}

ConsoleLoop::~ConsoleLoop() {
    // The worker signals session_event_fd_ when it finishes.
    session_.shutdown();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (session_event_fd_ >= 0) ::close(session_event_fd_);
}

bool ConsoleLoop::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Worker -> main loop notification
    session_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (session_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(session_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }
    if (options_.mode == Mode::Live && !add_fd(STDIN_FILENO, EPOLLIN)) {
        // stdin redirected from a regular file cannot be polled
        log("stdin not pollable, commands disabled");
    }

    session_.subscribe(renderer_.observer([this]() {
        uint64_t val = 1;
        if (::write(session_event_fd_, &val, sizeof(val)) != static_cast<ssize_t>(sizeof(val))) {
            std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
        }
    }));

    if (options_.mode == Mode::File) {
        auto started = session_.start_file(options_.file_path);
        if (!started) {
            renderer_.report(started.error());
            return false;
        }
    } else {
        renderer_.message("Commands: start, stop, clear, status, save, quit");
    }

    running_.store(true, std::memory_order_release);
    return true;
}

int ConsoleLoop::run() {
    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            exit_code_ = 1;
            break;
        }

        for (int i = 0; i < n && running_.load(std::memory_order_relaxed); i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) != static_cast<ssize_t>(sizeof(info))) continue;
                log(std::format("Received signal {}, stopping", info.ssi_signo));
                if (session_.state() == SessionState::Running) {
                    if (auto stopped = session_.stop(); !stopped) renderer_.report(stopped.error());
                    // File mode: on_session_finished() prints the result and ends the loop
                    if (options_.mode == Mode::File) continue;
                }
                request_stop();
                continue;
            }

            if (fd == session_event_fd_) {
                uint64_t val;
                if (::read(session_event_fd_, &val, sizeof(val)) != static_cast<ssize_t>(sizeof(val))) continue;
                on_session_finished();
                continue;
            }

            if (fd == STDIN_FILENO) {
                handle_stdin();
            }
        }
    }

    if (session_.state() == SessionState::Running) {
        if (auto stopped = session_.stop(); !stopped) renderer_.report(stopped.error());
    }
    return exit_code_;
}

void ConsoleLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void ConsoleLoop::handle_stdin() {
    char buf[512];
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
        if (n < 0 && errno == EINTR) return;
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, STDIN_FILENO, nullptr);
        log("stdin closed");
        request_stop();
        return;
    }

    stdin_buf_.append(buf, static_cast<size_t>(n));
    size_t pos;
    while ((pos = stdin_buf_.find('\n')) != std::string::npos) {
        auto line = stdin_buf_.substr(0, pos);
        stdin_buf_.erase(0, pos + 1);
        handle_command(line);
    }
}

void ConsoleLoop::handle_command(const std::string& raw) {
    auto first = raw.find_first_not_of(" \t\r");
    if (first == std::string::npos) return;
    auto last = raw.find_last_not_of(" \t\r");
    auto cmd = raw.substr(first, last - first + 1);

    if (cmd == "start") {
        auto started = session_.start_live();
        if (!started) {
            renderer_.report(started.error());
            return;
        }
        renderer_.message("Listening... type 'stop' to finish.");
    } else if (cmd == "stop") {
        auto summary = session_.stop();
        if (!summary) renderer_.report(summary.error());
    } else if (cmd == "clear") {
        session_.clear();
        renderer_.message("Transcript cleared.");
    } else if (cmd == "status") {
        auto snap = session_.snapshot();
        renderer_.message(std::format("State: {} ({:.1f}s), {} segments",
                                      to_string(session_.state()), session_.elapsed(),
                                      snap.segments.size()));
        if (!snap.displayed_text.empty()) renderer_.message(snap.displayed_text);
    } else if (cmd == "save") {
        save_transcript();
    } else if (cmd == "quit" || cmd == "exit") {
        request_stop();
    } else if (cmd == "help") {
        renderer_.message("Commands: start, stop, clear, status, save, quit");
    } else {
        renderer_.message(std::format("Unknown command: {}", cmd));
    }
}

void ConsoleLoop::on_session_finished() {
    auto summary = session_.wait();
    if (!summary) return;

    if (summary->error) {
        exit_code_ = 1;
    } else {
        renderer_.message(std::format("Session {}: {:.1f}s audio in {:.1f}s, {} chunks ({} dropped)",
                                      to_string(*summary->outcome), summary->audio_s,
                                      summary->elapsed_s, summary->stats.chunks_fed,
                                      summary->stats.chunks_dropped));
    }

    if (options_.mode == Mode::File) {
        renderer_.message("");
        renderer_.message(summary->transcript);
        if (options_.export_on_finish && !summary->error) save_transcript();
        request_stop();
    }
}

void ConsoleLoop::save_transcript() {
    auto path = session_.export_transcript(export_dir());
    if (!path) {
        renderer_.report(path.error());
        return;
    }
    renderer_.message("Saved " + path->string());
}

std::string ConsoleLoop::export_dir() const {
    if (!options_.export_dir.empty()) return options_.export_dir;
    if (!config_.transcript.export_dir.empty()) return config_.transcript.export_dir;
    auto dir = platform::data_dir();
    return dir.empty() ? "." : dir;
}

void ConsoleLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[livescribe] {}", msg);
    }
}
