#pragma once

#include "errors.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace transcript_export {

// "<prefix>_transcript_YYYYmmdd_HHMMSS.txt", local time.
std::string file_name(std::string_view prefix, std::chrono::system_clock::time_point when);

// Writes `text` as a plain-text file in `dir`, creating it if needed.
std::expected<std::filesystem::path, Error>
    write(const std::filesystem::path& dir, std::string_view prefix, std::string_view text,
          std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

} // namespace transcript_export
