#include "config.hpp"
#include "console_loop.hpp"
#include "recognizer/vosk_recognizer.hpp"
#include "relay_mode.hpp"

#include <print>
#include <string>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <mode>", prog);
    std::println(stderr, "Modes:");
    std::println(stderr, "  live                 Interactive microphone transcription");
    std::println(stderr, "  file PATH            Transcribe a WAV file");
    std::println(stderr, "  relay                Render external recognizer states read from stdin");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH    Config file path");
    std::println(stderr, "  -m, --model DIR      Vosk model directory (overrides config)");
    std::println(stderr, "  -o, --out DIR        Export the transcript to DIR when done");
    std::println(stderr, "      --no-resample    Only accept files already in the session format");
    std::println(stderr, "  -v, --verbose        Enable verbose logging");
    std::println(stderr, "  -h, --help           Show this help");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool no_resample = false;
    std::string config_path;
    std::string model_dir;
    std::string out_dir;
    std::string mode;
    std::string file_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--model" || arg == "-m") {
            if (i + 1 < argc) model_dir = argv[++i];
        } else if (arg == "--out" || arg == "-o") {
            if (i + 1 < argc) out_dir = argv[++i];
        } else if (arg == "--no-resample") {
            no_resample = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (mode.empty()) {
            mode = arg;
        } else if (mode == "file" && file_path.empty()) {
            file_path = arg;
        } else {
            std::println(stderr, "Unexpected argument: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    if (mode != "live" && mode != "file" && mode != "relay") {
        usage(argv[0]);
        return 1;
    }
    if (mode == "file" && file_path.empty()) {
        std::println(stderr, "file mode needs a PATH");
        return 1;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!model_dir.empty()) config.model.path = model_dir;
    if (no_resample) config.file.resample = false;

    if (mode == "relay") {
        return run_relay(config, out_dir, verbose);
    }

    if (verbose) {
        std::println(stderr, "[livescribe] Loading model {}", config.model.path);
    }
    auto engine = VoskEngine::load(config.model.path, config.model.log_level);
    if (!engine) {
        std::println(stderr, "Error: {}", engine.error().message);
        std::println(stderr, "Download a model from https://alphacephei.com/vosk/models and pass it with --model");
        return 1;
    }

    ConsoleLoop::Options options;
    options.mode = mode == "file" ? ConsoleLoop::Mode::File : ConsoleLoop::Mode::Live;
    options.file_path = file_path;
    options.export_dir = out_dir;
    options.export_on_finish = !out_dir.empty();

    ConsoleLoop loop(std::move(config), **engine, std::move(options), verbose);
    if (!loop.init()) {
        return 1;
    }

    return loop.run();
}
