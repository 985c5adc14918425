/// @file bulkhead_policy.cpp
/// @brief BulkheadPolicy implementation.

#include "callguard/resilience/bulkhead_policy.hpp"
#include "callguard/foundation/guard_logger.hpp"

namespace callguard::resilience {

using foundation::LogCategory;

BulkheadPolicy::BulkheadPolicy(BulkheadConfig config)
    : config_(std::move(config)) {
    if (config_.maxConcurrent < 1) {
        config_.maxConcurrent = 1;
    }
}

ErasedResult BulkheadPolicy::run(const Operation& op) {
    if (auto refused = acquire()) {
        return ErasedResult::err(std::move(*refused));
    }
    Slot slot(*this);
    return op();
}

std::string BulkheadPolicy::describe() const {
    return "Bulkhead(max=" + std::to_string(config_.maxConcurrent) +
           ", " + std::string(toString(config_.queuePolicy)) + ")";
}

uint32_t BulkheadPolicy::active() const {
    std::lock_guard lock(mutex_);
    return active_;
}

uint32_t BulkheadPolicy::queued() const {
    std::lock_guard lock(mutex_);
    return waiting_;
}

uint64_t BulkheadPolicy::rejectedCount() const {
    std::lock_guard lock(mutex_);
    return rejected_;
}

std::optional<GuardError> BulkheadPolicy::acquire() {
    std::unique_lock lock(mutex_);

    if (active_ < config_.maxConcurrent) {
        ++active_;
        return std::nullopt;
    }

    if (config_.queuePolicy == QueuePolicy::Reject) {
        return rejection("saturated");
    }

    if (config_.maxQueued > 0 && waiting_ >= config_.maxQueued) {
        return rejection("wait queue full");
    }

    ++waiting_;
    auto hasSlot = [this] { return active_ < config_.maxConcurrent; };
    bool acquired = true;
    if (config_.maxWait) {
        acquired = slotFreed_.wait_for(lock, *config_.maxWait, hasSlot);
    } else {
        slotFreed_.wait(lock, hasSlot);
    }
    --waiting_;

    if (!acquired) {
        return rejection("timed out waiting for a slot");
    }
    ++active_;
    return std::nullopt;
}

void BulkheadPolicy::release() {
    {
        std::lock_guard lock(mutex_);
        if (active_ > 0) {
            --active_;
        }
    }
    slotFreed_.notify_one();
}

GuardError BulkheadPolicy::rejection(std::string_view reason) {
    // Called with mutex_ held.
    ++rejected_;
    CALLGUARD_LOG_DEBUG(LogCategory::Bulkhead,
        "Bulkhead '" + config_.name + "' rejected call: " + std::string(reason));
    return GuardError(ErrorCode::BulkheadRejected,
                      "bulkhead '" + config_.name + "' " + std::string(reason) +
                      " (" + std::to_string(active_) + "/" +
                      std::to_string(config_.maxConcurrent) + " in use)");
}

} // namespace callguard::resilience
