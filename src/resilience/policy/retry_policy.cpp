/// @file retry_policy.cpp
/// @brief RetryPolicy implementation.

#include "callguard/resilience/retry_policy.hpp"
#include "callguard/foundation/guard_logger.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace callguard::resilience {

using foundation::GuardLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

RetryPolicy::RetryPolicy(RetryConfig config)
    : config_(std::move(config)) {
    if (config_.maxAttempts < 1) {
        config_.maxAttempts = 1;
    }
    if (config_.backoffFactor < 1.0) {
        config_.backoffFactor = 1.0;
    }
    rng_.seed(config_.jitterSeed ? *config_.jitterSeed
                                 : static_cast<uint64_t>(std::random_device{}()));
}

ErasedResult RetryPolicy::run(const Operation& op) {
    GuardError lastError;

    for (uint32_t attempt = 1; attempt <= config_.maxAttempts; ++attempt) {
        auto result = op();
        if (result.hasValue()) {
            return result;
        }
        if (!isRetryable(result.error())) {
            return result;
        }
        lastError = std::move(result).error();

        if (attempt == config_.maxAttempts) {
            break;
        }

        auto delay = nextDelay(attempt);
        if (GuardLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Retry)) {
            LogContext ctx;
            ctx.policy = "retry";
            ctx.attempt = attempt;
            ctx.extra["delay_ms"] = std::to_string(delay.count());
            ctx.extra["error"] = std::string(lastError.message());
            GuardLogger::instance().logWithContext(
                LogLevel::Debug, LogCategory::Retry, "Attempt failed, backing off", ctx);
        }

        if (config_.sleeper) {
            config_.sleeper(delay);
        } else {
            std::this_thread::sleep_for(delay);
        }
        retries_.fetch_add(1, std::memory_order_relaxed);
    }

    exhausted_.fetch_add(1, std::memory_order_relaxed);
    CALLGUARD_LOG_INFO(LogCategory::Retry,
        "Retries exhausted after " + std::to_string(config_.maxAttempts) +
        " attempts: " + std::string(lastError.message()));

    auto message = "all " + std::to_string(config_.maxAttempts) +
                   " attempts failed: " + std::string(lastError.message());
    return ErasedResult::err(
        GuardError(ErrorCode::RetryExhausted, std::move(message), std::move(lastError)));
}

std::string RetryPolicy::describe() const {
    return "Retry(max=" + std::to_string(config_.maxAttempts) +
           ", base=" + std::to_string(config_.baseDelay.count()) + "ms)";
}

std::chrono::milliseconds RetryPolicy::baseDelayFor(uint32_t attempt) const {
    if (attempt < 1) {
        attempt = 1;
    }
    auto base = static_cast<double>(config_.baseDelay.count());
    auto cap = static_cast<double>(config_.maxDelay.count());
    auto delay = base * std::pow(config_.backoffFactor, static_cast<double>(attempt - 1));
    delay = std::min(delay, cap);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

bool RetryPolicy::defaultRetryable(const GuardError& error) {
    switch (error.code()) {
        case ErrorCode::CircuitOpen:
        case ErrorCode::BulkheadRejected:
            return false;
        default:
            return true;
    }
}

std::chrono::milliseconds RetryPolicy::nextDelay(uint32_t attempt) {
    auto delay = baseDelayFor(attempt);
    if (!config_.jitter || delay.count() <= 0) {
        return delay;
    }

    std::uniform_int_distribution<int64_t> dist(0, delay.count() - 1);
    int64_t extra = 0;
    {
        std::lock_guard lock(rngMutex_);
        extra = dist(rng_);
    }
    return delay + std::chrono::milliseconds(extra);
}

bool RetryPolicy::isRetryable(const GuardError& error) const {
    return config_.retryOn ? config_.retryOn(error) : defaultRetryable(error);
}

} // namespace callguard::resilience
