/// @file task_executor.cpp
/// @brief TaskExecutor implementation wrapping kcenon thread_system.

#include "callguard/foundation/task_executor.hpp"
#include "callguard/foundation/guard_logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <exception>
#include <mutex>
#include <vector>

namespace callguard::foundation {

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct TaskExecutor::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string name;
    std::size_t workers{0};
    std::atomic<uint64_t> nextJobId{1};
    std::shared_ptr<std::atomic<uint64_t>> pending =
        std::make_shared<std::atomic<uint64_t>>(0);

    std::mutex mutex;
    bool stopped{false};
};

namespace {

/// Decrements the pending counter when a job leaves the worker.
class PendingGuard {
public:
    explicit PendingGuard(std::shared_ptr<std::atomic<uint64_t>> counter)
        : counter_(std::move(counter)) {}
    ~PendingGuard() { counter_->fetch_sub(1, std::memory_order_acq_rel); }

    PendingGuard(const PendingGuard&) = delete;
    PendingGuard& operator=(const PendingGuard&) = delete;

private:
    std::shared_ptr<std::atomic<uint64_t>> counter_;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
TaskExecutor::TaskExecutor(std::size_t numThreads, std::string name)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->name = std::move(name);
    impl_->workers = numThreads;
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(impl_->name);

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

TaskExecutor::~TaskExecutor() {
    if (impl_) {
        stop();
    }
}

TaskExecutor::TaskExecutor(TaskExecutor&&) noexcept = default;
TaskExecutor& TaskExecutor::operator=(TaskExecutor&&) noexcept = default;

// ---------------------------------------------------------------------------
// submit()
// ---------------------------------------------------------------------------
GuardResult<void> TaskExecutor::submit(Task task) {
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopped) {
            return GuardResult<void>::err(
                GuardError(ErrorCode::ExecutorStopped,
                           "executor '" + impl_->name + "' is stopped"));
        }
    }

    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    impl_->pending->fetch_add(1, std::memory_order_acq_rel);

    auto threadJob = kcenon::thread::job_builder()
        .name(impl_->name + "_job_" + std::to_string(id))
        .work([fn = std::move(task), pending = impl_->pending]()
              -> kcenon::common::VoidResult {
            PendingGuard guard(pending);
            try {
                fn();
            } catch (const std::exception& e) {
                CALLGUARD_LOG_ERROR(LogCategory::Executor,
                    std::string("task threw: ") + e.what());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        impl_->pending->fetch_sub(1, std::memory_order_acq_rel);
        return GuardResult<void>::err(
            GuardError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }
    return GuardResult<void>::ok();
}

// ---------------------------------------------------------------------------
// stop()
// ---------------------------------------------------------------------------
void TaskExecutor::stop() {
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopped) {
            return;
        }
        impl_->stopped = true;
    }
    if (impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

std::size_t TaskExecutor::workerCount() const noexcept {
    return impl_->workers;
}

uint64_t TaskExecutor::pendingCount() const noexcept {
    return impl_->pending->load(std::memory_order_acquire);
}

std::shared_ptr<TaskExecutor> TaskExecutor::shared() {
    static auto inst = std::make_shared<TaskExecutor>(kDefaultWorkers, "callguard-shared");
    return inst;
}

}  // namespace callguard::foundation
