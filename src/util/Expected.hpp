#pragma once

#include <string>
#include <utility>

namespace gitsync {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    ConfigurationError,   // fatal before the loop starts
    NetworkError,         // remote unreachable, retried next cycle
    RejectedError,        // push refused by remote
    DivergedHistoryError, // fast-forward impossible
    RestoreConflictError, // stash could not be re-applied cleanly
    LockTimeout,
    Cancelled,            // shutdown requested while waiting
    VcsFailure,           // any other non-zero git exit
    IoError,
    InternalError
};

/// Stable name used in log lines
inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidArgs: return "InvalidArgs";
        case ErrorCode::ConfigurationError: return "ConfigurationError";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::RejectedError: return "RejectedError";
        case ErrorCode::DivergedHistoryError: return "DivergedHistoryError";
        case ErrorCode::RestoreConflictError: return "RestoreConflictError";
        case ErrorCode::LockTimeout: return "LockTimeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::VcsFailure: return "VcsFailure";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::InternalError: return "InternalError";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;

    std::string describe() const { return std::string(errorCodeName(code)) + ": " + message; }
};

template <typename T>
class Expected {
public:
    Expected(const T& value) : hasValue(true), value_(value) {}
    Expected(T&& value) : hasValue(true), value_(std::move(value)) {}
    Expected(const Error& err) : hasValue(false), error_(err) {}
    Expected(Error&& err) : hasValue(false), error_(std::move(err)) {}

    bool has_value() const { return hasValue; }
    explicit operator bool() const { return hasValue; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

private:
    bool hasValue{false};
    T value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

}
