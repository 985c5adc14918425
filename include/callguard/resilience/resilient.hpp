#pragma once

/// @file resilient.hpp
/// @brief Call-site wrapper applying a pipeline to an ordinary function.

#include <any>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include "callguard/foundation/guard_logger.hpp"
#include "callguard/foundation/task_executor.hpp"
#include "callguard/resilience/circuit_registry.hpp"
#include "callguard/resilience/pipeline.hpp"

namespace callguard::resilience {

/// What withResilience() wraps a function in.
struct ResilienceOptions {
    /// Total attempts; 0 disables retry. Backoff starts at 1 s with jitter.
    uint32_t retry = 0;

    std::optional<std::chrono::milliseconds> timeout;

    /// Value returned when the call finally fails. Empty propagates the
    /// error. Must hold the wrapped function's value type.
    std::any fallback;

    /// Breaker name in the registry; unset means no breaker.
    std::optional<std::string> circuit;

    /// Used only when the registry has no breaker of that name yet.
    CircuitBreakerConfig circuitConfig;

    /// Level at which the final failure is logged.
    foundation::LogLevel logLevel = foundation::LogLevel::Error;

    /// Name shown in log messages.
    std::string name = "operation";

    /// Pool for the timeout worker. Null means TaskExecutor::shared().
    std::shared_ptr<foundation::TaskExecutor> executor;

    /// Sleeper for retry backoff. Empty sleeps the calling thread.
    std::function<void(std::chrono::milliseconds)> retrySleeper;
};

/// Pipeline for @p options: Fallback -> Timeout -> Retry -> CircuitBreaker,
/// each present only when configured.
[[nodiscard]] std::shared_ptr<Pipeline> buildResiliencePipeline(const ResilienceOptions& options,
                                                                CircuitRegistry& registry);

namespace detail {

void logFinalFailure(foundation::LogLevel level, std::string_view name, const GuardError& error);

} // namespace detail

/// Wrap @p fn so every call runs through the pipeline built from @p options.
///
/// The pipeline is built once, here. The returned callable takes the same
/// arguments as @p fn and returns GuardResult<T>. Arguments are copied into
/// the operation, so a worker abandoned by the timeout never reads the
/// caller's stack; pass std::ref explicitly to share state on purpose.
///
/// Example:
/// @code
///   auto fetchQuote = withResilience(
///       {.retry = 2, .timeout = std::chrono::seconds(30),
///        .fallback = std::string("n/a"), .circuit = "external_api"},
///       registry,
///       [](std::string symbol) { return quotes.fetch(symbol); });
///   GuardResult<std::string> q = fetchQuote("ACME");
/// @endcode
template <typename F>
[[nodiscard]] auto withResilience(ResilienceOptions options, CircuitRegistry& registry, F fn) {
    auto pipeline = buildResiliencePipeline(options, registry);
    // No fallback means the caller sees the failure, so it is logged here.
    // A fallback logs the failures it replaces itself.
    bool logFailures = !options.fallback.has_value();
    return [pipeline = std::move(pipeline), fn = std::move(fn), level = options.logLevel,
            name = std::move(options.name), logFailures](auto&&... args) {
        auto call = [fn, bound = std::make_tuple(std::decay_t<decltype(args)>(
                                 std::forward<decltype(args)>(args))...)]() mutable {
            return std::apply(fn, bound);
        };
        auto result = pipeline->execute(std::move(call));
        if (logFailures && result.hasError()) {
            detail::logFinalFailure(level, name, result.error());
        }
        return result;
    };
}

} // namespace callguard::resilience
