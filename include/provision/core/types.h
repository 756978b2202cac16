#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace provision {

// Type aliases
using TimePoint = std::chrono::system_clock::time_point;
using MonotonicTimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    PlatformUnsupported,
    PackageManagerUnavailable,
    UnknownManager,
    CommandFailed,
    Timeout,
    SkippedCiPrivilege,
    VerificationFailed,
    Cancelled,
    UnexpectedException,
    ExecutionError,
    InvalidArgument,
    NotFound,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::PlatformUnsupported:
            return "Platform not supported";
        case ErrorCode::PackageManagerUnavailable:
            return "Package manager unavailable";
        case ErrorCode::UnknownManager:
            return "Unknown package manager";
        case ErrorCode::CommandFailed:
            return "Command failed";
        case ErrorCode::Timeout:
            return "Operation timed out";
        case ErrorCode::SkippedCiPrivilege:
            return "Privileged install skipped in CI";
        case ErrorCode::VerificationFailed:
            return "Verification failed";
        case ErrorCode::Cancelled:
            return "Installation cancelled";
        case ErrorCode::UnexpectedException:
            return "Unexpected exception";
        case ErrorCode::ExecutionError:
            return "Execution error";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::NotFound:
            return "Not found";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
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
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const T* operator->() const { return &value(); }
    const T& operator*() const& { return value(); }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

} // namespace provision

// fmt library support for ErrorCode (for spdlog)
template <> struct fmt::formatter<provision::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(provision::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", provision::errorToString(error));
    }
};
