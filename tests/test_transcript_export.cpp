#include <catch2/catch_test_macros.hpp>

#include "transcript_export.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

std::chrono::system_clock::time_point local_time(int year, int mon, int day, int h, int m, int s) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = h;
    tm.tm_min = m;
    tm.tm_sec = s;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::string slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("transcript_export", "[export]") {
    auto when = local_time(2024, 3, 9, 7, 5, 42);
    auto dir = fs::temp_directory_path() / "ls_test_export" / "nested";
    fs::remove_all(dir.parent_path());

    SECTION("FileName") {
        REQUIRE(transcript_export::file_name("vosk", when) == "vosk_transcript_20240309_070542.txt");
        REQUIRE(transcript_export::file_name("web", when) == "web_transcript_20240309_070542.txt");
    }

    SECTION("WritesWithTrailingNewline") {
        auto path = transcript_export::write(dir, "vosk", "hello world", when);
        REQUIRE(path.has_value());
        REQUIRE(*path == dir / "vosk_transcript_20240309_070542.txt");
        REQUIRE(slurp(*path) == "hello world\n");
    }

    SECTION("KeepsExistingNewline") {
        auto path = transcript_export::write(dir, "web", "line\n", when);
        REQUIRE(path.has_value());
        REQUIRE(slurp(*path) == "line\n");
    }

    SECTION("UnwritableDirIsIoError") {
        fs::create_directories(dir.parent_path());
        auto blocker = dir.parent_path() / "file";
        std::ofstream(blocker) << "x";

        auto path = transcript_export::write(blocker / "sub", "vosk", "text", when);
        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().code == ErrorCode::IoError);
    }

    fs::remove_all(dir.parent_path());
}
