#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Out-of-range values keep the default instead of wrapping.
void read_u32(const json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key)) return;
    auto v = obj[key].get<int64_t>();
    if (v < 0 || v > std::numeric_limits<uint32_t>::max()) {
        std::println(stderr, "config: {} = {} is out of range, using default", key, v);
        return;
    }
    out = static_cast<uint32_t>(v);
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("path")) cfg.model.path = m["path"].get<std::string>();
            if (m.contains("log_level")) cfg.model.log_level = m["log_level"].get<int>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_u32(a, "sample_rate", cfg.audio.sample_rate);
            read_u32(a, "chunk_samples", cfg.audio.chunk_samples);
            read_u32(a, "max_seconds", cfg.audio.max_seconds);
            read_u32(a, "device_timeout_ms", cfg.audio.device_timeout_ms);
            read_u32(a, "poll_interval_ms", cfg.audio.poll_interval_ms);
        }

        if (j.contains("file")) {
            auto& fl = j["file"];
            if (fl.contains("resample")) cfg.file.resample = fl["resample"].get<bool>();
        }

        if (j.contains("transcript")) {
            auto& t = j["transcript"];
            if (t.contains("separator")) cfg.transcript.separator = t["separator"].get<std::string>();
            if (t.contains("export_dir")) cfg.transcript.export_dir = t["export_dir"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.audio.sample_rate == 0 || cfg.audio.chunk_samples == 0) {
        std::println(stderr, "config: sample_rate and chunk_samples must be positive, using defaults");
        cfg.audio.sample_rate = Config::Audio{}.sample_rate;
        cfg.audio.chunk_samples = Config::Audio{}.chunk_samples;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
