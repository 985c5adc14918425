#pragma once

/// @file fallback_policy.hpp
/// @brief Substitute result for a failed operation.

#include <any>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "callguard/resilience/policy.hpp"

namespace callguard::resilience {

/// Replaces a failure with a substitute value or the result of a handler.
///
/// Sits outermost, or right around a single unreliable call, and ends error
/// propagation for that branch. Never retries. Only failures accepted by
/// the appliesTo filter (default: all) are replaced; others pass through.
/// A policy built with neither a value nor a handler passes every failure
/// through unchanged.
///
/// The substitute must have the value type the caller executes with;
/// otherwise execute() reports ResultTypeMismatch.
///
/// Example:
/// @code
///   auto fallback = FallbackPolicy::withValue(0);
///   auto r = fallback->execute([]() -> GuardResult<int> { return loadCount(); });
///   // r.value() == 0 when loadCount() failed
/// @endcode
class FallbackPolicy final : public Policy {
public:
    /// Produces the substitute for a given failure.
    using Handler = std::function<ErasedResult(const GuardError&)>;

    /// A fallback with no substitute; every failure passes through.
    FallbackPolicy() = default;

    /// Construct from an already-erased substitute. Prefer the factories.
    FallbackPolicy(std::any value, Handler handler, ErrorPredicate appliesTo,
                   bool logFailures);

    /// Substitute @p value for matching failures.
    template <typename T>
    static std::shared_ptr<FallbackPolicy> withValue(T value, ErrorPredicate appliesTo = {},
                                                     bool logFailures = true) {
        static_assert(std::is_copy_constructible_v<T>,
                      "fallback values must be copy-constructible");
        return std::make_shared<FallbackPolicy>(std::any(std::move(value)), Handler{},
                                                std::move(appliesTo), logFailures);
    }

    /// Substitute the outcome of @p fn(error) for matching failures.
    ///
    /// @p fn may return T or GuardResult<T>; a failing handler's error is
    /// what the caller sees. Concurrent callers share one @p fn, which is
    /// invoked through a const reference and must be safe to call from
    /// several threads at once.
    template <typename F>
    static std::shared_ptr<FallbackPolicy> withHandler(F fn, ErrorPredicate appliesTo = {},
                                                       bool logFailures = true) {
        static_assert(std::is_invocable_v<const F&, const GuardError&>,
                      "fallback handlers must be callable as const");
        Handler handler = [fn = std::move(fn)](const GuardError& error) {
            auto bound = [&fn, &error]() { return fn(error); };
            return detail::invokeErased(bound);
        };
        return std::make_shared<FallbackPolicy>(std::any{}, std::move(handler),
                                                std::move(appliesTo), logFailures);
    }

    [[nodiscard]] ErasedResult run(const Operation& op) override;
    [[nodiscard]] std::string describe() const override;

    /// Whether a substitute (value or handler) is configured.
    [[nodiscard]] bool hasSubstitute() const noexcept {
        return static_cast<bool>(handler_) || value_.has_value();
    }

    /// Failures replaced since construction.
    [[nodiscard]] uint64_t substitutedCount() const noexcept {
        return substituted_.load(std::memory_order_relaxed);
    }

private:
    std::any value_;
    Handler handler_;
    ErrorPredicate appliesTo_;
    bool logFailures_ = true;
    std::atomic<uint64_t> substituted_{0};
};

} // namespace callguard::resilience
