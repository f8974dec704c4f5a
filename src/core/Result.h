#pragma once

#include <string>

namespace YtMerge {

enum class ErrorKind {
    None,
    Cancelled,
    FetchFailed,
    MissingOutput,
    SourceMissing,
    ProcessFailed,
    Timeout,
    CrossfadeFailed,
    OverlayFailed,
    NothingSucceeded,
    EmptyBatch,
    IoError,
    InvalidConfig
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "none";
        case ErrorKind::Cancelled:        return "cancelled";
        case ErrorKind::FetchFailed:      return "fetch-failed";
        case ErrorKind::MissingOutput:    return "missing-output";
        case ErrorKind::SourceMissing:    return "source-missing";
        case ErrorKind::ProcessFailed:    return "process-failed";
        case ErrorKind::Timeout:          return "timeout";
        case ErrorKind::CrossfadeFailed:  return "crossfade-failed";
        case ErrorKind::OverlayFailed:    return "overlay-failed";
        case ErrorKind::NothingSucceeded: return "nothing-succeeded";
        case ErrorKind::EmptyBatch:       return "empty-batch";
        case ErrorKind::IoError:          return "io-error";
        case ErrorKind::InvalidConfig:    return "invalid-config";
    }
    return "unknown";
}

struct OpError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

/**
 * @brief Outcome of a fallible pipeline operation
 *
 * artifact holds the produced file path (if any) on success.
 */
struct OpResult {
    bool success = false;
    std::string artifact;
    OpError error;

    static OpResult ok(const std::string& artifactPath = "") {
        OpResult r;
        r.success = true;
        r.artifact = artifactPath;
        return r;
    }

    static OpResult fail(ErrorKind kind, const std::string& message) {
        OpResult r;
        r.success = false;
        r.error.kind = kind;
        r.error.message = message;
        return r;
    }

    explicit operator bool() const noexcept { return success; }
};

} // namespace YtMerge
