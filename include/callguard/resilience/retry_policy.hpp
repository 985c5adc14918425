#pragma once

/// @file retry_policy.hpp
/// @brief Retry with exponential backoff and optional jitter.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "callguard/resilience/policy.hpp"

namespace callguard::resilience {

/// Configuration for a RetryPolicy.
struct RetryConfig {
    /// Total attempts, the first call included. Values below 1 act as 1.
    uint32_t maxAttempts = 3;

    /// Delay before the second attempt.
    std::chrono::milliseconds baseDelay{1000};

    /// Multiplier applied per further attempt.
    double backoffFactor = 2.0;

    /// Cap applied before jitter.
    std::chrono::milliseconds maxDelay{30000};

    /// Add a uniform random amount in [0, delay) to each delay.
    bool jitter = true;

    /// Seed for the jitter generator; unset draws from std::random_device.
    std::optional<uint64_t> jitterSeed;

    /// Errors worth another attempt. Empty means defaultRetryable().
    ErrorPredicate retryOn;

    /// Performs the backoff wait. Empty means std::this_thread::sleep_for.
    std::function<void(std::chrono::milliseconds)> sleeper;
};

/// Re-invokes a failing operation with exponential backoff.
///
/// After each retryable failure the calling thread sleeps for
/// min(maxDelay, baseDelay * backoffFactor^(attempt-1)) plus jitter, then
/// tries again. When every attempt failed the result is RetryExhausted,
/// with the last error available through GuardError::cause(). A failure
/// rejected by the retry predicate is returned unchanged at once.
///
/// The default predicate refuses CircuitOpen and BulkheadRejected: retrying
/// those only hammers a dependency that is already shedding load. A custom
/// predicate that accepts them turns a retry placed outside a breaker into
/// a loop of fast rejections.
///
/// Thread-safe; the attempt counter is local to each call and the jitter
/// generator is mutex-protected.
class RetryPolicy final : public Policy {
public:
    explicit RetryPolicy(RetryConfig config = {});

    [[nodiscard]] ErasedResult run(const Operation& op) override;
    [[nodiscard]] std::string describe() const override;

    /// Backoff before attempt @p attempt + 1, jitter excluded.
    [[nodiscard]] std::chrono::milliseconds baseDelayFor(uint32_t attempt) const;

    /// Predicate used when RetryConfig::retryOn is empty.
    [[nodiscard]] static bool defaultRetryable(const GuardError& error);

    [[nodiscard]] const RetryConfig& config() const noexcept { return config_; }

    /// Total retries performed (attempts beyond the first) over all calls.
    [[nodiscard]] uint64_t retryCount() const noexcept {
        return retries_.load(std::memory_order_relaxed);
    }

    /// Calls that ended in RetryExhausted.
    [[nodiscard]] uint64_t exhaustedCount() const noexcept {
        return exhausted_.load(std::memory_order_relaxed);
    }

private:
    std::chrono::milliseconds nextDelay(uint32_t attempt);
    [[nodiscard]] bool isRetryable(const GuardError& error) const;

    RetryConfig config_;
    std::mutex rngMutex_;
    std::mt19937_64 rng_;
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> exhausted_{0};
};

} // namespace callguard::resilience
