#include <catch2/catch_test_macros.hpp>

#include "wav.hpp"
#include "wav_fixtures.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace {

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("Header") {
        auto out = wav::encode(samples, sample_rate);
        REQUIRE(out.size() == 44 + samples.size() * 2);
        REQUIRE(read_tag(out.data()) == "RIFF");
        REQUIRE(read_tag(out.data() + 8) == "WAVE");
        REQUIRE(read_tag(out.data() + 36) == "data");
        REQUIRE(read_u16(out.data() + 20) == wav::FORMAT_PCM);
        REQUIRE(read_u16(out.data() + 22) == 1);
        REQUIRE(read_u32(out.data() + 24) == sample_rate);
        REQUIRE(read_u16(out.data() + 34) == 16);
        REQUIRE(read_u32(out.data() + 4) == 36 + samples.size() * 2);
    }

    SECTION("Empty") {
        std::vector<int16_t> none;
        auto out = wav::encode(none, sample_rate);
        REQUIRE(out.size() == 44);
        REQUIRE(read_u32(out.data() + 40) == 0);
    }
}

TEST_CASE("wav::decode", "[wav]") {

    SECTION("ReadsEncodedFile") {
        std::vector<int16_t> samples = {1, -2, 3, -4};
        auto pcm = wav::decode(wav::encode(samples, 22050));
        REQUIRE(pcm.has_value());
        REQUIRE(pcm->format == wav::FORMAT_PCM);
        REQUIRE(pcm->channels == 1);
        REQUIRE(pcm->sample_rate == 22050);
        REQUIRE(pcm->bits_per_sample == 16);
        REQUIRE(pcm->frame_count() == 4);
        REQUIRE(pcm->data == raw_bytes(samples));
    }

    SECTION("SkipsUnknownChunksWithPadding") {
        std::vector<int16_t> samples = {7, 8, 9};
        auto bytes = build_wav({.extra_chunk = "odd"}, raw_bytes(samples));

        auto pcm = wav::decode(bytes);
        REQUIRE(pcm.has_value());
        REQUIRE(pcm->data == raw_bytes(samples));
    }

    SECTION("ExtensibleUsesSubFormat") {
        std::vector<float> samples = {0.5f, -0.5f};
        auto bytes = build_wav({.format = wav::FORMAT_FLOAT, .bits_per_sample = 32, .extensible = true},
                               raw_bytes(samples));

        auto pcm = wav::decode(bytes);
        REQUIRE(pcm.has_value());
        REQUIRE(pcm->format == wav::FORMAT_FLOAT);
        REQUIRE(pcm->bits_per_sample == 32);
        REQUIRE(pcm->frame_count() == 2);
    }

    SECTION("DropsTrailingPartialFrame") {
        std::vector<uint8_t> data = {1, 0, 2, 0, 3, 0, 4, 0, 5};
        auto pcm = wav::decode(build_wav({.channels = 2}, data));
        REQUIRE(pcm.has_value());
        REQUIRE(pcm->frame_count() == 2);
        REQUIRE(pcm->data.size() == 8);
    }

    SECTION("RejectsNonWave") {
        std::vector<uint8_t> junk(64, 0x20);
        auto pcm = wav::decode(junk);
        REQUIRE_FALSE(pcm.has_value());
        REQUIRE(pcm.error() == "not a RIFF/WAVE file");
    }

    SECTION("RejectsCompressed") {
        std::vector<uint8_t> data(16, 0);
        auto pcm = wav::decode(build_wav({.format = 0x0055, .bits_per_sample = 16}, data));
        REQUIRE_FALSE(pcm.has_value());
        REQUIRE(pcm.error().find("compressed") != std::string::npos);
    }

    SECTION("RejectsUnreadableSampleWidths") {
        // 16-bit float: one sample, shorter than any float the reader handles.
        auto half_float = wav::decode(build_wav({.format = wav::FORMAT_FLOAT, .bits_per_sample = 16},
                                                std::vector<uint8_t>{0x00, 0x3C}));
        REQUIRE_FALSE(half_float.has_value());
        REQUIRE(half_float.error().find("16-bit float") != std::string::npos);

        auto wide_int = wav::decode(build_wav({.bits_per_sample = 64}, std::vector<uint8_t>(16, 0x01)));
        REQUIRE_FALSE(wide_int.has_value());
        REQUIRE(wide_int.error().find("64-bit integer") != std::string::npos);

        auto float24 = wav::decode(build_wav({.format = wav::FORMAT_FLOAT, .bits_per_sample = 24},
                                             std::vector<uint8_t>(6, 0)));
        REQUIRE_FALSE(float24.has_value());
    }

    SECTION("AcceptsSupportedSampleWidths") {
        for (uint16_t bits : {8, 16, 24, 32}) {
            INFO("integer bits " << bits);
            REQUIRE(wav::decode(build_wav({.bits_per_sample = bits},
                                          std::vector<uint8_t>(bits / 8 * 2, 0))).has_value());
        }
        for (uint16_t bits : {32, 64}) {
            INFO("float bits " << bits);
            REQUIRE(wav::decode(build_wav({.format = wav::FORMAT_FLOAT, .bits_per_sample = bits},
                                          std::vector<uint8_t>(bits / 8 * 2, 0))).has_value());
        }
    }

    SECTION("RejectsMissingData") {
        auto full = wav::encode(std::vector<int16_t>{1, 2}, 16000);
        // Cut right after the fmt chunk and patch the RIFF size.
        std::vector<uint8_t> head(full.begin(), full.begin() + 36);
        uint32_t riff = 28;
        std::memcpy(head.data() + 4, &riff, 4);

        auto pcm = wav::decode(head);
        REQUIRE_FALSE(pcm.has_value());
        REQUIRE(pcm.error() == "missing data chunk");
    }
}
