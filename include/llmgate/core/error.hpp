#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace llmgate {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    NotFound,
    Unauthorized,
    Forbidden,
    Timeout,
    ConnectionFailed,
    ConnectionClosed,
    ServiceUnavailable,
    RateLimited,
    SerializationError,
    ProviderError,
    ProviderNotConfigured,
    Cancelled,
    Exhausted,
    InternalError,
};

/// Coarse classification used by the retry and fallback layers.
enum class ErrorClass {
    Configuration,
    Transient,
    Permanent,
    Exhaustion,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::Unauthorized: return "UNAUTHORIZED";
        case ErrorCode::Forbidden: return "FORBIDDEN";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::ConnectionFailed: return "CONNECTION_FAILED";
        case ErrorCode::ConnectionClosed: return "CONNECTION_CLOSED";
        case ErrorCode::ServiceUnavailable: return "SERVICE_UNAVAILABLE";
        case ErrorCode::RateLimited: return "RATE_LIMITED";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::ProviderError: return "PROVIDER_ERROR";
        case ErrorCode::ProviderNotConfigured: return "PROVIDER_NOT_CONFIGURED";
        case ErrorCode::Cancelled: return "CANCELLED";
        case ErrorCode::Exhausted: return "EXHAUSTED";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/// Retriable causes: rate limiting, upstream 5xx, timeouts and dropped
/// connections. Everything else fails the candidate on the first attempt.
inline auto is_transient(ErrorCode code) noexcept -> bool {
    switch (code) {
        case ErrorCode::RateLimited:
        case ErrorCode::ServiceUnavailable:
        case ErrorCode::Timeout:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionClosed:
            return true;
        default:
            return false;
    }
}

inline auto classify(ErrorCode code) noexcept -> ErrorClass {
    switch (code) {
        case ErrorCode::InvalidConfig:
        case ErrorCode::ProviderNotConfigured:
            return ErrorClass::Configuration;
        case ErrorCode::Exhausted:
            return ErrorClass::Exhaustion;
        default:
            return is_transient(code) ? ErrorClass::Transient : ErrorClass::Permanent;
    }
}

// GCC 14 ICE workaround for co_return std::unexpected(...) in coroutines.
// The conversion to std::expected happens in a user-defined conversion
// operator outside the coroutine frame.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

/// Use co_return make_fail(err) instead of co_return std::unexpected(err).
inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

} // namespace llmgate
