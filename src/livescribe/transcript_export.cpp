#include "transcript_export.hpp"

#include <ctime>
#include <format>
#include <fstream>

namespace transcript_export {

std::string file_name(std::string_view prefix, std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
    return std::format("{}_transcript_{}.txt", prefix, stamp);
}

std::expected<std::filesystem::path, Error>
write(const std::filesystem::path& dir, std::string_view prefix, std::string_view text,
      std::chrono::system_clock::time_point when) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return fail(ErrorCode::IoError,
                    std::format("cannot create {}: {}", dir.string(), ec.message()));
    }

    auto path = dir / file_name(prefix, when);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return fail(ErrorCode::IoError, std::format("cannot write {}", path.string()));
    }

    out << text;
    if (!text.empty() && text.back() != '\n') out << '\n';
    out.close();
    if (!out) {
        return fail(ErrorCode::IoError, std::format("write to {} failed", path.string()));
    }
    return path;
}

} // namespace transcript_export
