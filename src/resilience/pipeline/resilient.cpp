/// @file resilient.cpp
/// @brief Pipeline construction for the withResilience() wrapper.

#include "callguard/resilience/resilient.hpp"

namespace callguard::resilience {

using foundation::GuardLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

std::shared_ptr<Pipeline> buildResiliencePipeline(const ResilienceOptions& options,
                                                  CircuitRegistry& registry) {
    Pipeline::Builder builder;

    if (options.fallback.has_value()) {
        FallbackPolicy::Handler handler =
            [value = options.fallback, level = options.logLevel,
             name = options.name](const GuardError& error) {
                detail::logFinalFailure(level, name, error);
                return ErasedResult::ok(value);
            };
        builder.fallback(std::make_shared<FallbackPolicy>(std::any{}, std::move(handler),
                                                          ErrorPredicate{}, false));
    }

    if (options.timeout) {
        builder.timeout(TimeoutConfig{*options.timeout, options.executor});
    }

    if (options.retry > 0) {
        RetryConfig retry;
        retry.maxAttempts = options.retry;
        retry.baseDelay = std::chrono::milliseconds(1000);
        retry.jitter = true;
        retry.sleeper = options.retrySleeper;
        builder.retry(std::move(retry));
    }

    if (options.circuit) {
        builder.circuit(registry.getOrCreate(*options.circuit, options.circuitConfig));
    }

    auto pipeline = builder.buildShared();
    CALLGUARD_LOG_DEBUG(LogCategory::Core,
        "Resilient call '" + options.name + "' uses " + pipeline->describe());
    return pipeline;
}

namespace detail {

void logFinalFailure(LogLevel level, std::string_view name, const GuardError& error) {
    auto& logger = GuardLogger::instance();
    if (!logger.isEnabled(level, LogCategory::Core)) {
        return;
    }
    LogContext ctx;
    ctx.target = std::string(name);
    ctx.extra["code"] = std::string(foundation::errorCodeName(error.code()));
    const auto& root = error.rootCause();
    if (&root != &error) {
        ctx.extra["cause"] = std::string(root.message());
    }
    logger.logWithContext(level, LogCategory::Core,
                          "Call '" + std::string(name) + "' failed: " +
                          std::string(error.message()),
                          ctx);
}

} // namespace detail

} // namespace callguard::resilience
