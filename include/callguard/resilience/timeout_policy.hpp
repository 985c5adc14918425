#pragma once

/// @file timeout_policy.hpp
/// @brief Wall-clock deadline for a possibly blocking operation.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "callguard/foundation/task_executor.hpp"
#include "callguard/resilience/policy.hpp"

namespace callguard::resilience {

/// Configuration for a TimeoutPolicy.
struct TimeoutConfig {
    /// Longest time the caller waits for the operation.
    std::chrono::milliseconds duration{30000};

    /// Pool hosting the operation. Null means TaskExecutor::shared().
    std::shared_ptr<foundation::TaskExecutor> executor;
};

/// Bounds how long a caller waits for an operation.
///
/// The operation runs on a TaskExecutor worker while the caller waits on
/// its result. If the deadline passes first the caller gets
/// DeadlineExceeded immediately.
///
/// Contract: this is "stop waiting", not "stop executing". The abandoned
/// worker keeps running until the operation returns on its own, holding
/// whatever the operation holds (connections, memory, an executor worker)
/// and its result is discarded. Nothing is preempted. Operations that
/// must stop early need their own cancellation signal, e.g. an
/// std::atomic<bool> captured by the callable and set by the caller after
/// a DeadlineExceeded. abandonedCount() exposes how many workers were left
/// behind.
///
/// Time spent queued behind busy workers counts against the deadline.
///
/// Thread-safe.
class TimeoutPolicy final : public Policy {
public:
    explicit TimeoutPolicy(TimeoutConfig config = {});

    [[nodiscard]] ErasedResult run(const Operation& op) override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] std::chrono::milliseconds duration() const noexcept {
        return config_.duration;
    }

    /// Calls whose worker was left running after the deadline.
    [[nodiscard]] uint64_t abandonedCount() const noexcept {
        return abandoned_.load(std::memory_order_relaxed);
    }

private:
    TimeoutConfig config_;
    std::atomic<uint64_t> abandoned_{0};
};

} // namespace callguard::resilience
