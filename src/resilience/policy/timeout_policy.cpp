/// @file timeout_policy.cpp
/// @brief TimeoutPolicy implementation.

#include "callguard/resilience/timeout_policy.hpp"
#include "callguard/foundation/guard_logger.hpp"

#include <exception>
#include <future>

namespace callguard::resilience {

using foundation::LogCategory;
using foundation::TaskExecutor;

TimeoutPolicy::TimeoutPolicy(TimeoutConfig config)
    : config_(std::move(config)) {
    if (!config_.executor) {
        config_.executor = TaskExecutor::shared();
    }
}

ErasedResult TimeoutPolicy::run(const Operation& op) {
    auto promise = std::make_shared<std::promise<ErasedResult>>();
    auto future = promise->get_future();

    // The worker owns copies of everything it touches; the caller may be
    // gone by the time it finishes.
    auto submitted = config_.executor->submit([op, promise]() {
        try {
            promise->set_value(op());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    if (submitted.hasError()) {
        return ErasedResult::err(std::move(submitted).error());
    }

    if (future.wait_for(config_.duration) != std::future_status::ready) {
        abandoned_.fetch_add(1, std::memory_order_relaxed);
        CALLGUARD_LOG_DEBUG(LogCategory::Timeout,
            "Deadline of " + std::to_string(config_.duration.count()) +
            "ms exceeded; worker abandoned");
        return ErasedResult::err(
            GuardError(ErrorCode::DeadlineExceeded,
                       "timed out after " + std::to_string(config_.duration.count()) + "ms"));
    }

    try {
        // Rethrows anything the operation threw that was not a std::exception.
        return future.get();
    } catch (const std::future_error& e) {
        // The executor dropped the job without running it.
        return ErasedResult::err(
            GuardError(ErrorCode::ExecutorStopped,
                       std::string("operation was discarded by the executor: ") + e.what()));
    }
}

std::string TimeoutPolicy::describe() const {
    return "Timeout(" + std::to_string(config_.duration.count()) + "ms)";
}

} // namespace callguard::resilience
