#pragma once

/// @file circuit_breaker.hpp
/// @brief Circuit breaker protecting a named dependency.
///
/// Implements the circuit breaker pattern (Closed -> Open -> HalfOpen)
/// to prevent cascading failures when a dependency is unhealthy. The
/// breaker is itself a Policy and can sit anywhere in a Pipeline.

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "callguard/resilience/policy.hpp"

namespace callguard::resilience {

/// How failures are counted while the circuit is closed.
enum class FailureWindow : uint8_t {
    Consecutive, ///< Failures in a row; any success resets the count.
    Sliding      ///< Failures within the last slidingWindow, successes ignored.
};

/// Configuration for a CircuitBreaker instance.
struct CircuitBreakerConfig {
    /// Number of failures before the circuit opens.
    uint32_t failureThreshold = 5;

    FailureWindow window = FailureWindow::Consecutive;

    /// Look-back period for FailureWindow::Sliding.
    std::chrono::milliseconds slidingWindow{60000};

    /// Duration the circuit stays open before transitioning to half-open.
    std::chrono::milliseconds resetTimeout{30000};

    /// Number of consecutive successes in half-open to close the circuit.
    uint32_t successThreshold = 2;

    /// Trial calls allowed in flight while half-open.
    uint32_t halfOpenMaxCalls = 1;

    /// Errors that count against the dependency. Empty counts every error.
    /// Errors it rejects are neutral: they change no counter.
    ErrorPredicate isFailure;

    /// Human-readable name for logging; the registry sets it to the key.
    std::string name = "default";
};

/// Point-in-time view of a breaker for observability collaborators.
struct CircuitBreakerStats;

/// Circuit breaker state machine for protecting calls to one dependency.
///
/// As a Policy:
/// @code
///   auto breaker = registry.getOrCreate("payments", {.failureThreshold = 3});
///   auto r = breaker->execute([] { return chargeCard(); });
///   if (r.hasError() && r.error().code() == ErrorCode::CircuitOpen) {
///       // Failed fast; chargeCard() was not called.
///   }
/// @endcode
///
/// Manual use:
/// @code
///   if (cb.allowRequest()) {
///       auto result = callPayments();
///       if (result.hasValue()) {
///           cb.recordSuccess();
///       } else {
///           cb.recordFailure();
///       }
///   }
/// @endcode
///
/// Thread-safe: every state read and transition takes the mutex, which is
/// never held while the protected operation runs. In HalfOpen at most
/// halfOpenMaxCalls trial calls are admitted; concurrent extras are
/// rejected like calls against an open circuit. Which concurrent caller
/// wins a trial slot is unspecified.
///
/// run() records each outcome against the state the call was admitted in.
/// A call that finishes after the breaker has transitioned (for example one
/// admitted while Closed that completes during a half-open trial) updates
/// the totals in stats() but neither frees a trial slot nor moves the
/// state. The manual protocol has no such ticket and records against the
/// current state.
class CircuitBreaker final : public Policy {
public:
    /// Circuit breaker states.
    enum class State : uint8_t {
        Closed,   ///< Normal operation; calls pass through.
        Open,     ///< Failure threshold reached; calls are rejected.
        HalfOpen  ///< Recovery probe; limited calls allowed.
    };

    using Clock = std::chrono::steady_clock;

    explicit CircuitBreaker(CircuitBreakerConfig config = {});

    // ── Policy ───────────────────────────────────────────────────────────

    /// Admit the call or fail with CircuitOpen without invoking @p op,
    /// then record the outcome.
    [[nodiscard]] ErasedResult run(const Operation& op) override;
    [[nodiscard]] std::string describe() const override;

    // ── Manual protocol ──────────────────────────────────────────────────

    /// Check whether a request is allowed through the circuit.
    ///
    /// If the circuit is Open, checks whether the reset timeout has
    /// elapsed and transitions to HalfOpen if so. In HalfOpen an admitted
    /// request holds a trial slot until its outcome is recorded.
    ///
    /// @return true if the call should proceed, false if rejected.
    [[nodiscard]] bool allowRequest();

    /// Record a successful call. Resets failure count; may close the circuit.
    void recordSuccess();

    /// Record a failed call. Increments failure count; may open the circuit.
    void recordFailure();

    /// Record an outcome that says nothing about the dependency's health.
    /// Frees a half-open trial slot and changes no counter.
    void recordIgnored();

    /// Force the circuit into a specific state (for testing or manual override).
    void forceState(State newState);

    /// Reset all counters and return to Closed state.
    void reset();

    // ── Queries ──────────────────────────────────────────────────────────

    /// Current circuit state.
    [[nodiscard]] State state() const;

    /// Failures counted toward the threshold in the current window.
    [[nodiscard]] uint32_t failureCount() const;

    /// Number of consecutive successes in HalfOpen state.
    [[nodiscard]] uint32_t halfOpenSuccessCount() const;

    /// Total number of requests rejected due to open circuit.
    [[nodiscard]] uint64_t rejectedCount() const;

    /// When the circuit last opened; epoch if it never did.
    [[nodiscard]] Clock::time_point openedAt() const;

    /// Snapshot of state and counters.
    [[nodiscard]] CircuitBreakerStats stats() const;

    /// Configuration name.
    [[nodiscard]] std::string_view name() const;

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    enum class Outcome : uint8_t { Success, Failure, Neutral };

    /// Admission check; returns the generation the call was admitted in.
    std::optional<uint64_t> admit();

    /// Record @p outcome. With @p admittedIn set, outcomes from an older
    /// generation only update the totals.
    void record(Outcome outcome, std::optional<uint64_t> admittedIn);

    void transitionTo(State newState);
    void countFailure(Clock::time_point now);
    void purgeExpired(Clock::time_point now);
    [[nodiscard]] bool countsAsFailure(const GuardError& error) const;

    CircuitBreakerConfig config_;
    mutable std::mutex mutex_;
    State state_{State::Closed};
    uint32_t consecutiveFailures_{0};
    std::deque<Clock::time_point> recentFailures_;
    uint32_t halfOpenSuccesses_{0};
    uint32_t halfOpenInFlight_{0};
    Clock::time_point openedAt_{};
    /// Bumped on every transition and reset.
    uint64_t generation_{0};

    uint64_t totalAdmitted_{0};
    uint64_t totalSuccesses_{0};
    uint64_t totalFailures_{0};
    uint64_t totalRejected_{0};
    uint64_t timesOpened_{0};
};

struct CircuitBreakerStats {
    std::string name;
    CircuitBreaker::State state{CircuitBreaker::State::Closed};
    uint32_t failureCount{0};
    uint32_t halfOpenSuccessCount{0};
    uint64_t admittedCount{0};
    uint64_t successCount{0};
    uint64_t failureTotal{0};
    uint64_t rejectedCount{0};
    uint64_t openCount{0};
    CircuitBreaker::Clock::time_point openedAt{};
};

/// Convert circuit breaker state to string.
[[nodiscard]] constexpr std::string_view toString(CircuitBreaker::State s) {
    switch (s) {
        case CircuitBreaker::State::Closed:
            return "closed";
        case CircuitBreaker::State::Open:
            return "open";
        case CircuitBreaker::State::HalfOpen:
            return "half_open";
    }
    return "unknown";
}

}  // namespace callguard::resilience
