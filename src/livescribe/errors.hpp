#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

enum class ErrorCode {
    DeviceUnavailable,
    ModelNotFound,
    UnsupportedFormat,
    InvalidChunk,
    AlreadyActive,
    NotActive,
    DecodeFailed,  // recognizer rejected a single chunk
    ExternalError, // reported by an external recognizer through the relay
    IoError,
};

struct Error {
    ErrorCode code;
    std::string message;
};

constexpr std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorCode::ModelNotFound: return "ModelNotFound";
        case ErrorCode::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorCode::InvalidChunk: return "InvalidChunk";
        case ErrorCode::AlreadyActive: return "AlreadyActive";
        case ErrorCode::NotActive: return "NotActive";
        case ErrorCode::DecodeFailed: return "DecodeFailed";
        case ErrorCode::ExternalError: return "ExternalError";
        case ErrorCode::IoError: return "IoError";
    }
    return "Unknown";
}

// Errors that only affect the chunk they were raised for.
constexpr bool is_chunk_local(ErrorCode code) {
    return code == ErrorCode::InvalidChunk || code == ErrorCode::DecodeFailed;
}

inline std::unexpected<Error> fail(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}
