#include "vosk_recognizer.hpp"

#include <climits>
#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

// Vosk returns {"text": "..."} for results and {"partial": "..."} for partials.
static std::string extract_text(const char* raw, const char* key) {
    if (!raw) return {};
    try {
        auto j = json::parse(raw);
        return j.value(key, "");
    } catch (const json::exception& e) {
        std::println(stderr, "vosk: unreadable result: {}", e.what());
        return {};
    }
}

VoskEngine::VoskEngine(std::string model_dir, VoskModel* model)
    : model_dir_(std::move(model_dir)), model_(model) {}

std::expected<std::unique_ptr<VoskEngine>, Error>
VoskEngine::load(const std::string& model_dir, int log_level) {
    std::error_code ec;
    if (!fs::is_directory(model_dir, ec)) {
        return fail(ErrorCode::ModelNotFound,
                    std::format("model directory {} does not exist", model_dir));
    }

    vosk_set_log_level(log_level);

    VoskModel* model = vosk_model_new(model_dir.c_str());
    if (!model) {
        return fail(ErrorCode::ModelNotFound,
                    std::format("failed to load Vosk model from {}", model_dir));
    }

    return std::unique_ptr<VoskEngine>(new VoskEngine(model_dir, model));
}

std::expected<std::unique_ptr<Recognizer>, Error> VoskEngine::create(uint32_t sample_rate) {
    VoskRecognizer* rec = vosk_recognizer_new(model_.get(), static_cast<float>(sample_rate));
    if (!rec) {
        return fail(ErrorCode::ModelNotFound,
                    std::format("model {} cannot run at {} Hz", model_dir_, sample_rate));
    }
    return std::make_unique<VoskStream>(rec);
}

VoskStream::VoskStream(VoskRecognizer* rec) : rec_(rec) {}

std::expected<bool, std::string> VoskStream::accept(std::span<const int16_t> samples) {
    if (samples.size() > static_cast<size_t>(INT_MAX)) {
        return std::unexpected("chunk too large");
    }

    int rc = vosk_recognizer_accept_waveform_s(rec_.get(), samples.data(),
                                               static_cast<int>(samples.size()));
    if (rc < 0) {
        return std::unexpected("recognizer failed to decode chunk");
    }
    return rc == 1;
}

std::string VoskStream::result() {
    return extract_text(vosk_recognizer_result(rec_.get()), "text");
}

std::string VoskStream::partial_result() {
    return extract_text(vosk_recognizer_partial_result(rec_.get()), "partial");
}

std::string VoskStream::final_result() {
    return extract_text(vosk_recognizer_final_result(rec_.get()), "text");
}
