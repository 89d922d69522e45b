#pragma once
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace caravel {
template <typename T> using Result = std::expected<T, std::string>;

enum class ErrorKind : uint8_t {
    TriggerMismatch,
    StepExecution,
    ArtifactNotFound,
    ArtifactConflict,
    TagConflict,
    Io,
    Parse,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

// Used where callers need to tell failure kinds apart.
template <typename T> using Outcome = std::expected<T, Error>;

inline std::unexpected<Error> fail(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TriggerMismatch:
        return "TriggerMismatch";
    case ErrorKind::StepExecution:
        return "StepExecutionError";
    case ErrorKind::ArtifactNotFound:
        return "ArtifactNotFound";
    case ErrorKind::ArtifactConflict:
        return "ArtifactConflict";
    case ErrorKind::TagConflict:
        return "TagConflict";
    case ErrorKind::Io:
        return "IoError";
    case ErrorKind::Parse:
        return "ParseError";
    }
    return "Unknown";
}
} // namespace caravel
