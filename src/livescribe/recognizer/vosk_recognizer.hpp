#pragma once

#include "recognizer.hpp"

#include <memory>
#include <string>
#include <vosk_api.h>

// Loaded Vosk model. Every create() yields an independent recognizer.
class VoskEngine : public RecognizerFactory {
public:
    // log_level follows vosk_set_log_level: -1 silences Kaldi output.
    static std::expected<std::unique_ptr<VoskEngine>, Error>
        load(const std::string& model_dir, int log_level = -1);

    std::expected<std::unique_ptr<Recognizer>, Error> create(uint32_t sample_rate) override;

    const std::string& model_dir() const { return model_dir_; }

private:
    struct ModelDeleter {
        void operator()(VoskModel* m) const { if (m) vosk_model_free(m); }
    };

    VoskEngine(std::string model_dir, VoskModel* model);

    std::string model_dir_;
    std::unique_ptr<VoskModel, ModelDeleter> model_;
};

class VoskStream : public Recognizer {
public:
    explicit VoskStream(VoskRecognizer* rec);

    std::expected<bool, std::string> accept(std::span<const int16_t> samples) override;
    std::string result() override;
    std::string partial_result() override;
    std::string final_result() override;

private:
    struct RecognizerDeleter {
        void operator()(VoskRecognizer* r) const { if (r) vosk_recognizer_free(r); }
    };

    std::unique_ptr<VoskRecognizer, RecognizerDeleter> rec_;
};
