#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace steenbok {

enum class ErrorCode {
    InvalidConfig = 1,
    InvalidUrl,
    IoError,
    SchemeRejected,
    AllowlistRejected,
    HostResolutionFailed,
    HostBlockedIP,
    TooManyRedirects,
    ContentTypeRejected,
    ResponseTooLarge,
    NetworkTimeout,
    NetworkError,
    UpstreamHttpError,
    ExtractionFailed,
    InternalError,
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

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Stable snake_case name used as the `reason` field of audit records.
inline auto error_code_to_reason(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidConfig: return "invalid_config";
        case ErrorCode::InvalidUrl: return "invalid_url";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::SchemeRejected: return "scheme_rejected";
        case ErrorCode::AllowlistRejected: return "allowlist_rejected";
        case ErrorCode::HostResolutionFailed: return "host_resolution_failed";
        case ErrorCode::HostBlockedIP: return "host_blocked_ip";
        case ErrorCode::TooManyRedirects: return "too_many_redirects";
        case ErrorCode::ContentTypeRejected: return "content_type_rejected";
        case ErrorCode::ResponseTooLarge: return "response_too_large";
        case ErrorCode::NetworkTimeout: return "network_timeout";
        case ErrorCode::NetworkError: return "network_error";
        case ErrorCode::UpstreamHttpError: return "upstream_http_error";
        case ErrorCode::ExtractionFailed: return "extraction_failed";
        case ErrorCode::InternalError: return "internal_error";
        default: return "unknown";
    }
}

// GCC ICE workaround for co_return std::unexpected(...) in coroutines.
// The conversion to std::expected is deferred to a user-defined conversion
// operator evaluated outside the coroutine frame.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

/// Use co_return make_fail(err) instead of co_return std::unexpected(err).
inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

/// Use co_return ok_result() instead of co_return Result<void>{}.
inline auto ok_result() -> Result<void> { return {}; }

} // namespace steenbok
