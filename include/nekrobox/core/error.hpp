#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace nekrobox {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    NotFound,
    SessionError,
    SessionConstructionFailed,
    ExecutionTimeout,
    RuntimeExecutionFailed,
    InternalError,
};

/// Closed classification of failures raised inside a sandbox.
/// Unknown is the default arm for anything not recognised.
enum class ErrorKind {
    Syntax,
    Timeout,
    Memory,
    MissingDependency,
    InvalidInput,
    Unknown,
};

struct ErrorInfo {
    ErrorKind kind = ErrorKind::Unknown;
    std::string type_name;
    std::string message;
    std::string recovery_suggestion;
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    Error(ErrorCode code, std::string message, std::string detail, ErrorInfo info)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)),
          info_(std::move(info)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    /// Classified failure, present for timeout and runtime execution errors.
    [[nodiscard]] auto info() const noexcept -> const std::optional<ErrorInfo>& { return info_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
    std::optional<ErrorInfo> info_;
};

template <typename T>
using Result = std::expected<T, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail,
                       ErrorInfo info) -> Error {
    return Error(code, std::move(message), std::move(detail), std::move(info));
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::SessionError: return "SESSION_ERROR";
        case ErrorCode::SessionConstructionFailed: return "SESSION_CONSTRUCTION_FAILED";
        case ErrorCode::ExecutionTimeout: return "EXECUTION_TIMEOUT";
        case ErrorCode::RuntimeExecutionFailed: return "RUNTIME_EXECUTION_FAILED";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

inline auto error_kind_to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::Syntax: return "syntax";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Memory: return "memory";
        case ErrorKind::MissingDependency: return "missing_dependency";
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

// GCC 14 ICE workaround for co_return std::unexpected(...) in coroutines.
// GCC 14 crashes (internal compiler error) when a coroutine uses
// co_return std::unexpected(...) due to bugs in special member call
// resolution within coroutine frames. This wrapper defers the
// std::unexpected -> std::expected conversion to a user-defined
// conversion operator outside the coroutine frame.
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

} // namespace nekrobox
