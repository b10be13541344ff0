#include "relay_mode.hpp"

#include "relay.hpp"
#include "renderer.hpp"
#include "transcript_buffer.hpp"
#include "transcript_export.hpp"

#include <iostream>
#include <print>
#include <unistd.h>

int run_relay(const Config& config, const std::string& export_dir, bool verbose) {
    TranscriptBuffer buffer(config.transcript.separator);
    ExternalTranscriptRelay relay(buffer);
    ConsoleRenderer renderer(isatty(STDOUT_FILENO) != 0);

    std::string line;
    size_t line_no = 0;
    while (std::getline(std::cin, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        auto state = ExternalState::parse(line);
        if (!state) {
            std::println(stderr, "relay: line {}: {}", line_no, state.error().message);
            continue;
        }

        auto update = relay.apply(*state);
        if (!update) {
            renderer.report(update.error());
            continue;
        }
        renderer.render(*update);
    }

    if (verbose) {
        std::println(stderr, "[livescribe] relay input ended after {} lines", line_no);
    }

    // The stream may end mid-utterance.
    renderer.render(relay.finish());

    auto text = buffer.finalized_text();
    if (!export_dir.empty() && !text.empty()) {
        auto path = transcript_export::write(export_dir, "web", text);
        if (!path) {
            renderer.report(path.error());
            return 1;
        }
        renderer.message("Saved " + path->string());
    }
    return 0;
}
