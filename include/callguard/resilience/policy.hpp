#pragma once

/// @file policy.hpp
/// @brief The execution contract shared by every resilience policy.
///
/// A policy runs an operation and either returns what the operation
/// produced or fails with a typed GuardError (CircuitOpen, BulkheadRejected,
/// RetryExhausted, DeadlineExceeded). Errors a policy does not handle pass
/// through unchanged to the next outer layer.

#include <any>
#include <exception>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "callguard/foundation/guard_result.hpp"

namespace callguard::resilience {

using foundation::ErrorCode;
using foundation::GuardError;
using foundation::GuardResult;

/// Outcome of an operation once its value type has been erased.
using ErasedResult = GuardResult<std::any>;

/// An operation with its value type erased; the unit policies wrap.
using Operation = std::function<ErasedResult()>;

namespace detail {

template <typename R>
struct ResultTraits {
    static constexpr bool kIsResult = false;
    using ValueType = R;
};

template <typename T>
struct ResultTraits<GuardResult<T>> {
    static constexpr bool kIsResult = true;
    using ValueType = T;
};

/// Value type produced by execute() for a callable of type F.
template <typename F>
using ExecuteValue = typename ResultTraits<std::decay_t<std::invoke_result_t<F&>>>::ValueType;

/// Invoke @p fn and erase its value type.
///
/// std::exception is converted into an OperationFailed error carrying
/// what(); anything else thrown propagates unchanged.
template <typename F>
ErasedResult invokeErased(F& fn) {
    using R = std::decay_t<std::invoke_result_t<F&>>;
    using T = typename ResultTraits<R>::ValueType;
    try {
        if constexpr (ResultTraits<R>::kIsResult) {
            auto result = fn();
            if (result.hasError()) {
                return ErasedResult::err(std::move(result).error());
            }
            if constexpr (std::is_void_v<T>) {
                return ErasedResult::ok(std::any{});
            } else {
                return ErasedResult::ok(std::any(std::move(result).value()));
            }
        } else if constexpr (std::is_void_v<R>) {
            fn();
            return ErasedResult::ok(std::any{});
        } else {
            return ErasedResult::ok(std::any(fn()));
        }
    } catch (const std::exception& e) {
        return ErasedResult::err(GuardError(ErrorCode::OperationFailed, e.what()));
    }
}

/// Wrap a callable as a copyable Operation.
///
/// The callable is held by shared_ptr: copies of the Operation (for example
/// the one handed to a timeout worker) keep it alive after the caller
/// returned.
template <typename F>
Operation eraseOperation(F fn) {
    auto shared = std::make_shared<F>(std::move(fn));
    return [shared]() { return invokeErased(*shared); };
}

/// Recover a typed result from an erased one.
template <typename T>
GuardResult<T> restoreResult(ErasedResult erased) {
    if (erased.hasError()) {
        return GuardResult<T>::err(std::move(erased).error());
    }
    if constexpr (std::is_void_v<T>) {
        return GuardResult<void>::ok();
    } else {
        auto* value = std::any_cast<T>(&erased.value());
        if (value == nullptr) {
            return GuardResult<T>::err(
                GuardError(ErrorCode::ResultTypeMismatch,
                           "policy produced a value of an unexpected type"));
        }
        return GuardResult<T>::ok(std::move(*value));
    }
}

} // namespace detail

/// Abstract base class of every policy.
///
/// Subclasses implement run() over a type-erased Operation; callers use the
/// typed execute() front end.
///
/// The callable passed to execute() may return GuardResult<T>, a plain T,
/// or void. T must be copy-constructible. A callable may outlive the call
/// that submitted it (TimeoutPolicy abandons late workers), so it should
/// own what it captures rather than refer to the caller's stack.
///
/// Example:
/// @code
///   RetryPolicy retry(RetryConfig{.maxAttempts = 3});
///   GuardResult<int> r = retry.execute([] { return fetchCount(); });
/// @endcode
class Policy {
public:
    virtual ~Policy() = default;

    /// Run @p op under this policy.
    [[nodiscard]] virtual ErasedResult run(const Operation& op) = 0;

    /// Short human-readable description, e.g. "Retry(max=3)".
    [[nodiscard]] virtual std::string describe() const = 0;

    /// Run @p fn under this policy and return its typed outcome.
    template <typename F>
    [[nodiscard]] GuardResult<detail::ExecuteValue<F>> execute(F fn) {
        using T = detail::ExecuteValue<F>;
        static_assert(std::is_void_v<T> || std::is_copy_constructible_v<T>,
                      "policy results must be copy-constructible");
        return detail::restoreResult<T>(run(detail::eraseOperation(std::move(fn))));
    }
};

/// Predicate over errors, used by retry, fallback and breaker filters.
using ErrorPredicate = std::function<bool(const GuardError&)>;

/// Predicate matching any of the given codes.
[[nodiscard]] ErrorPredicate matchesAnyOf(std::initializer_list<ErrorCode> codes);

} // namespace callguard::resilience
