#pragma once

/// @file guard_error.hpp
/// @brief Error type used with Result<T, GuardError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "callguard/foundation/error_code.hpp"

namespace callguard::foundation {

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data.
///
/// Policies that wrap a failure (RetryExhausted) store the underlying
/// GuardError as context; cause() retrieves it.
class GuardError {
public:
    GuardError() = default;

    explicit GuardError(ErrorCode code)
        : code_(code) {}

    GuardError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GuardError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    /// Check whether this error carries context data.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// The wrapped error, if this error was produced on behalf of another.
    [[nodiscard]] const GuardError* cause() const noexcept {
        return context<GuardError>();
    }

    /// Follow cause() links to the innermost error.
    [[nodiscard]] const GuardError& rootCause() const noexcept {
        const GuardError* current = this;
        while (const GuardError* next = current->cause()) {
            current = next;
        }
        return *current;
    }

    /// Check if this represents a success (no error).
    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace callguard::foundation
