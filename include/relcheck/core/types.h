#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace relcheck {

// Type aliases
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using Embedding = std::vector<float>;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidData,
    NotFound,
    FileNotFound,
    PermissionDenied,
    WriteError,
    NetworkError,
    ConnectionFailed,
    Timeout,
    OperationCancelled,
    InvalidState,
    InternalError,
    NotSupported,
    // Fatal classes: any of these aborts a run before or while it executes.
    ConfigurationError,
    DuplicateTestCase,
    BackendUnavailable,
    Unauthorized,
    DimensionMismatch,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::WriteError: return "Write error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::ConfigurationError: return "Configuration error";
        case ErrorCode::DuplicateTestCase: return "Duplicate test case";
        case ErrorCode::BackendUnavailable: return "Backend unavailable";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::DimensionMismatch: return "Dimension mismatch";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Fatal errors abort the whole run; everything else is recorded against a single case.
constexpr bool isFatal(ErrorCode error) {
    switch (error) {
        case ErrorCode::ConfigurationError:
        case ErrorCode::DuplicateTestCase:
        case ErrorCode::BackendUnavailable:
        case ErrorCode::Unauthorized:
        case ErrorCode::DimensionMismatch:
            return true;
        default:
            return false;
    }
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace relcheck

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<relcheck::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(relcheck::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", relcheck::errorToString(error));
    }
};
