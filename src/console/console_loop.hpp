#pragma once

#include "config.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "recognizer/recognizer.hpp"
#include "renderer.hpp"
#include "ring_buffer.hpp"
#include "session.hpp"

#include <atomic>
#include <string>

// Interactive front end: one epoll loop over signals, stdin commands and
// session-finished notifications from the worker thread.
class ConsoleLoop {
public:
    enum class Mode { Live, File };

    struct Options {
        Mode mode = Mode::Live;
        std::string file_path;
        std::string export_dir;   // empty: config / platform default
        bool export_on_finish = false;
    };

    ConsoleLoop(Config config, RecognizerFactory& factory, Options options, bool verbose = false);
    ~ConsoleLoop();

    ConsoleLoop(const ConsoleLoop&) = delete;
    ConsoleLoop& operator=(const ConsoleLoop&) = delete;

    bool init();
    int run();
    void request_stop();

private:
    void handle_stdin();
    void handle_command(const std::string& line);
    void on_session_finished();
    void save_transcript();
    std::string export_dir() const;

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    Options options_;

    RingBuffer ring_buf_;
    PipeWireCapture capture_;
    ConsoleRenderer renderer_;
    SessionController session_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int session_event_fd_ = -1;
    std::string stdin_buf_;

    std::atomic<bool> running_{false};
    int exit_code_ = 0;
};
