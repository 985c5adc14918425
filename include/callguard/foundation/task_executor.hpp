#pragma once

/// @file task_executor.hpp
/// @brief TaskExecutor wrapping kcenon thread_system for timeout workers.

#include "callguard/foundation/guard_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace callguard::foundation {

/// Fixed-size worker pool that hosts operations run under a deadline.
///
/// Wraps kcenon's thread_system behind PIMPL. Jobs run to completion;
/// the executor has no way to interrupt one. A job whose caller stopped
/// waiting (see TimeoutPolicy) still occupies its worker until it returns,
/// so a pool saturated by abandoned jobs delays every job queued after them.
///
/// Example:
/// @code
///   auto executor = std::make_shared<TaskExecutor>(4, "io-timeouts");
///   auto submitted = executor->submit([] { slowCall(); });
///   if (submitted.hasError()) { ... }
/// @endcode
class TaskExecutor {
public:
    using Task = std::function<void()>;

    /// Default number of workers for shared().
    static constexpr std::size_t kDefaultWorkers = 16;

    /// Construct a pool with @p numThreads workers.
    explicit TaskExecutor(std::size_t numThreads = kDefaultWorkers,
                          std::string name = "callguard-executor");

    /// Stops the pool, letting running jobs finish.
    ~TaskExecutor();

    // Non-copyable, movable.
    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;
    TaskExecutor(TaskExecutor&&) noexcept;
    TaskExecutor& operator=(TaskExecutor&&) noexcept;

    /// Queue a task for execution.
    /// @return Success, ExecutorStopped after stop(), or JobScheduleFailed.
    GuardResult<void> submit(Task task);

    /// Stop accepting work and join the workers once running jobs finish.
    void stop();

    /// Number of worker threads.
    [[nodiscard]] std::size_t workerCount() const noexcept;

    /// Jobs submitted but not yet finished (queued or running).
    [[nodiscard]] uint64_t pendingCount() const noexcept;

    /// Executor shared by policies that were not given their own.
    static std::shared_ptr<TaskExecutor> shared();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace callguard::foundation
