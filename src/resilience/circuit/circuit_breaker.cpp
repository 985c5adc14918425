/// @file circuit_breaker.cpp
/// @brief CircuitBreaker state machine implementation.

#include "callguard/resilience/circuit_breaker.hpp"
#include "callguard/foundation/guard_logger.hpp"

namespace callguard::resilience {

using foundation::GuardLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

void logTransition(const std::string& name, CircuitBreaker::State from,
                   CircuitBreaker::State to, uint32_t failures) {
    auto level = to == CircuitBreaker::State::Open ? LogLevel::Warning : LogLevel::Info;
    auto& logger = GuardLogger::instance();
    if (!logger.isEnabled(level, LogCategory::Circuit)) {
        return;
    }
    LogContext ctx;
    ctx.policy = "circuit";
    ctx.target = name;
    ctx.extra["from"] = std::string(toString(from));
    ctx.extra["to"] = std::string(toString(to));
    ctx.extra["failures"] = std::to_string(failures);
    logger.logWithContext(level, LogCategory::Circuit, "Circuit state changed", ctx);
}

} // anonymous namespace

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(std::move(config)) {
    if (config_.failureThreshold < 1) {
        config_.failureThreshold = 1;
    }
    if (config_.successThreshold < 1) {
        config_.successThreshold = 1;
    }
    if (config_.halfOpenMaxCalls < 1) {
        config_.halfOpenMaxCalls = 1;
    }
}

ErasedResult CircuitBreaker::run(const Operation& op) {
    auto admitted = admit();
    if (!admitted) {
        return ErasedResult::err(
            GuardError(ErrorCode::CircuitOpen,
                       "circuit '" + config_.name + "' is open"));
    }

    try {
        auto result = op();
        if (result.hasValue()) {
            record(Outcome::Success, *admitted);
        } else if (countsAsFailure(result.error())) {
            record(Outcome::Failure, *admitted);
        } else {
            record(Outcome::Neutral, *admitted);
        }
        return result;
    } catch (...) {
        record(Outcome::Failure, *admitted);
        throw;
    }
}

std::string CircuitBreaker::describe() const {
    return "CircuitBreaker(" + config_.name + ")";
}

bool CircuitBreaker::allowRequest() {
    return admit().has_value();
}

void CircuitBreaker::recordSuccess() {
    record(Outcome::Success, std::nullopt);
}

void CircuitBreaker::recordFailure() {
    record(Outcome::Failure, std::nullopt);
}

void CircuitBreaker::recordIgnored() {
    record(Outcome::Neutral, std::nullopt);
}

std::optional<uint64_t> CircuitBreaker::admit() {
    std::unique_lock lock(mutex_);

    switch (state_) {
        case State::Closed:
            ++totalAdmitted_;
            return generation_;

        case State::Open: {
            auto elapsed = Clock::now() - openedAt_;
            if (elapsed >= config_.resetTimeout) {
                transitionTo(State::HalfOpen);
                ++halfOpenInFlight_;
                ++totalAdmitted_;
                auto generation = generation_;
                lock.unlock();
                logTransition(config_.name, State::Open, State::HalfOpen, 0);
                return generation;
            }
            ++totalRejected_;
            return std::nullopt;
        }

        case State::HalfOpen:
            if (halfOpenInFlight_ < config_.halfOpenMaxCalls) {
                ++halfOpenInFlight_;
                ++totalAdmitted_;
                return generation_;
            }
            ++totalRejected_;
            return std::nullopt;
    }
    return std::nullopt;
}

void CircuitBreaker::record(Outcome outcome, std::optional<uint64_t> admittedIn) {
    std::unique_lock lock(mutex_);
    if (outcome == Outcome::Success) {
        ++totalSuccesses_;
    } else if (outcome == Outcome::Failure) {
        ++totalFailures_;
    }

    // Admitted before the last transition: the outcome belongs to a state
    // the breaker has already left and must not touch the current one.
    if (admittedIn && *admittedIn != generation_) {
        return;
    }

    switch (state_) {
        case State::Closed:
            if (outcome == Outcome::Success) {
                consecutiveFailures_ = 0;
            } else if (outcome == Outcome::Failure) {
                countFailure(Clock::now());
                auto failures = config_.window == FailureWindow::Sliding
                    ? static_cast<uint32_t>(recentFailures_.size())
                    : consecutiveFailures_;
                if (failures >= config_.failureThreshold) {
                    transitionTo(State::Open);
                    lock.unlock();
                    logTransition(config_.name, State::Closed, State::Open, failures);
                }
            }
            break;

        case State::HalfOpen:
            if (halfOpenInFlight_ > 0) {
                --halfOpenInFlight_;
            }
            if (outcome == Outcome::Success) {
                ++halfOpenSuccesses_;
                if (halfOpenSuccesses_ >= config_.successThreshold) {
                    transitionTo(State::Closed);
                    lock.unlock();
                    logTransition(config_.name, State::HalfOpen, State::Closed, 0);
                }
            } else if (outcome == Outcome::Failure) {
                // Any failed trial immediately re-opens.
                transitionTo(State::Open);
                lock.unlock();
                logTransition(config_.name, State::HalfOpen, State::Open, 1);
            }
            break;

        case State::Open:
            // Late completion recorded through the manual protocol.
            break;
    }
}

void CircuitBreaker::forceState(State newState) {
    std::lock_guard lock(mutex_);
    transitionTo(newState);
}

void CircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    state_ = State::Closed;
    consecutiveFailures_ = 0;
    recentFailures_.clear();
    halfOpenSuccesses_ = 0;
    halfOpenInFlight_ = 0;
    openedAt_ = {};
    totalAdmitted_ = 0;
    totalSuccesses_ = 0;
    totalFailures_ = 0;
    totalRejected_ = 0;
    timesOpened_ = 0;
    ++generation_;
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint32_t CircuitBreaker::failureCount() const {
    std::lock_guard lock(mutex_);
    if (config_.window == FailureWindow::Sliding) {
        auto cutoff = Clock::now() - config_.slidingWindow;
        uint32_t count = 0;
        for (const auto& ts : recentFailures_) {
            if (ts > cutoff) {
                ++count;
            }
        }
        return count;
    }
    return consecutiveFailures_;
}

uint32_t CircuitBreaker::halfOpenSuccessCount() const {
    std::lock_guard lock(mutex_);
    return halfOpenSuccesses_;
}

uint64_t CircuitBreaker::rejectedCount() const {
    std::lock_guard lock(mutex_);
    return totalRejected_;
}

CircuitBreaker::Clock::time_point CircuitBreaker::openedAt() const {
    std::lock_guard lock(mutex_);
    return openedAt_;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    auto failures = failureCount();

    std::lock_guard lock(mutex_);
    CircuitBreakerStats s;
    s.name = config_.name;
    s.state = state_;
    s.failureCount = failures;
    s.halfOpenSuccessCount = halfOpenSuccesses_;
    s.admittedCount = totalAdmitted_;
    s.successCount = totalSuccesses_;
    s.failureTotal = totalFailures_;
    s.rejectedCount = totalRejected_;
    s.openCount = timesOpened_;
    s.openedAt = openedAt_;
    return s;
}

std::string_view CircuitBreaker::name() const {
    return config_.name;
}

void CircuitBreaker::transitionTo(State newState) {
    state_ = newState;
    ++generation_;
    if (newState == State::Closed) {
        consecutiveFailures_ = 0;
        recentFailures_.clear();
        halfOpenSuccesses_ = 0;
        halfOpenInFlight_ = 0;
    } else if (newState == State::Open) {
        // The reset timeout always runs from the latest opening.
        openedAt_ = Clock::now();
        halfOpenInFlight_ = 0;
        ++timesOpened_;
    } else if (newState == State::HalfOpen) {
        halfOpenSuccesses_ = 0;
        halfOpenInFlight_ = 0;
    }
}

void CircuitBreaker::countFailure(Clock::time_point now) {
    if (config_.window == FailureWindow::Sliding) {
        recentFailures_.push_back(now);
        purgeExpired(now);
    } else {
        ++consecutiveFailures_;
    }
}

void CircuitBreaker::purgeExpired(Clock::time_point now) {
    auto cutoff = now - config_.slidingWindow;
    while (!recentFailures_.empty() && recentFailures_.front() <= cutoff) {
        recentFailures_.pop_front();
    }
}

bool CircuitBreaker::countsAsFailure(const GuardError& error) const {
    return config_.isFailure ? config_.isFailure(error) : true;
}

} // namespace callguard::resilience
