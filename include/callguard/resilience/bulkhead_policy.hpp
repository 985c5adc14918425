#pragma once

/// @file bulkhead_policy.hpp
/// @brief Concurrency cap isolating one dependency's load.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "callguard/resilience/policy.hpp"

namespace callguard::resilience {

/// What a caller does when every slot is taken.
enum class QueuePolicy : uint8_t {
    Block,  ///< Wait for a slot.
    Reject  ///< Fail with BulkheadRejected at once.
};

/// Configuration for a BulkheadPolicy.
struct BulkheadConfig {
    /// Number of operations allowed to run at the same time.
    uint32_t maxConcurrent = 10;

    QueuePolicy queuePolicy = QueuePolicy::Block;

    /// Block only: give up with BulkheadRejected after waiting this long.
    /// Unset waits indefinitely.
    std::optional<std::chrono::milliseconds> maxWait;

    /// Block only: callers allowed to wait at once; 0 means unbounded.
    uint32_t maxQueued = 0;

    /// Name used in diagnostics.
    std::string name = "bulkhead";
};

/// Bounds the number of concurrent executions sharing this instance.
///
/// Acts as a counting semaphore of maxConcurrent slots. A slot is held for
/// the whole operation and released on every exit path, including a thrown
/// exception, so capacity never leaks.
///
/// Fairness: blocked callers are woken through a condition variable and
/// the order in which they get a freed slot is unspecified (not FIFO).
///
/// Thread-safe; the mutex is never held while the operation runs.
class BulkheadPolicy final : public Policy {
public:
    explicit BulkheadPolicy(BulkheadConfig config = {});

    [[nodiscard]] ErasedResult run(const Operation& op) override;
    [[nodiscard]] std::string describe() const override;

    // ── Queries ──────────────────────────────────────────────────────────

    [[nodiscard]] uint32_t capacity() const noexcept { return config_.maxConcurrent; }

    /// Operations currently holding a slot.
    [[nodiscard]] uint32_t active() const;

    /// Callers currently waiting for a slot.
    [[nodiscard]] uint32_t queued() const;

    /// Calls refused since construction.
    [[nodiscard]] uint64_t rejectedCount() const;

    [[nodiscard]] const BulkheadConfig& config() const noexcept { return config_; }

private:
    /// Holds one slot; releases it on destruction.
    class Slot {
    public:
        explicit Slot(BulkheadPolicy& owner) : owner_(owner) {}
        ~Slot() { owner_.release(); }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        BulkheadPolicy& owner_;
    };

    /// Take a slot or explain why not.
    [[nodiscard]] std::optional<GuardError> acquire();
    void release();

    GuardError rejection(std::string_view reason);

    BulkheadConfig config_;
    mutable std::mutex mutex_;
    std::condition_variable slotFreed_;
    uint32_t active_{0};
    uint32_t waiting_{0};
    uint64_t rejected_{0};
};

/// Convert a queue policy to string.
[[nodiscard]] constexpr std::string_view toString(QueuePolicy p) {
    switch (p) {
        case QueuePolicy::Block:
            return "block";
        case QueuePolicy::Reject:
            return "reject";
    }
    return "unknown";
}

} // namespace callguard::resilience
