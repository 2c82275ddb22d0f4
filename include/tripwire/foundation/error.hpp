#pragma once

/// @file error.hpp
/// @brief Error type used with Result<T, Error> throughout tripwire.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "tripwire/foundation/error_code.hpp"

namespace tripwire::foundation {

/// HTTP status attached as context to errors raised by HTTP clients.
///
/// Circuit breaker presets inspect it to tell client-caused responses
/// (4xx, 429) from dependency failures.
struct HttpStatus {
    int code = 0;

    [[nodiscard]] constexpr bool isClientError() const noexcept {
        return code >= 400 && code < 500;
    }
};

/// Error carrying a categorized code, a human-readable message and optional
/// type-erased context (an HTTP status, a stats snapshot, ...).
class Error {
public:
    Error() = default;

    explicit Error(ErrorCode code)
        : code_(code) {}

    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Typed context data, or nullptr on type mismatch or when empty.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

/// Build an ErrorCode::HttpError carrying @p status as HttpStatus context.
[[nodiscard]] inline Error httpError(int status, std::string message) {
    return Error(ErrorCode::HttpError, std::move(message), HttpStatus{status});
}

/// HTTP status carried by @p error, or 0 when it has none.
[[nodiscard]] inline int httpStatusOf(const Error& error) noexcept {
    const auto* status = error.context<HttpStatus>();
    return status ? status->code : 0;
}

}  // namespace tripwire::foundation
