/// @file pipeline.cpp
/// @brief Pipeline and Pipeline::Builder implementation.

#include "callguard/resilience/pipeline.hpp"

namespace callguard::resilience {

Pipeline::Pipeline(std::vector<std::shared_ptr<Policy>> policies) {
    policies_.reserve(policies.size());
    for (auto& policy : policies) {
        if (!policy) {
            continue;
        }
        if (auto nested = std::dynamic_pointer_cast<Pipeline>(policy)) {
            // Already flat: every Pipeline flattens on construction.
            policies_.insert(policies_.end(), nested->policies_.begin(),
                             nested->policies_.end());
        } else {
            policies_.push_back(std::move(policy));
        }
    }
}

ErasedResult Pipeline::run(const Operation& op) {
    // Each layer owns the next one and its policy, so a worker abandoned by
    // a timeout keeps the rest of the chain alive.
    Operation next = op;
    for (auto it = policies_.rbegin(); it != policies_.rend(); ++it) {
        next = [policy = *it, inner = std::move(next)]() { return policy->run(inner); };
    }
    return next();
}

std::string Pipeline::describe() const {
    std::string out = "Pipeline[";
    for (size_t i = 0; i < policies_.size(); ++i) {
        if (i > 0) {
            out += " -> ";
        }
        out += policies_[i]->describe();
    }
    out += "]";
    return out;
}

// ── Builder ─────────────────────────────────────────────────────────────

Pipeline::Builder& Pipeline::Builder::then(std::shared_ptr<Policy> policy) {
    policies_.push_back(std::move(policy));
    return *this;
}

Pipeline::Builder& Pipeline::Builder::retry(RetryConfig config) {
    return then(std::make_shared<RetryPolicy>(std::move(config)));
}

Pipeline::Builder& Pipeline::Builder::timeout(std::chrono::milliseconds duration) {
    TimeoutConfig config;
    config.duration = duration;
    return timeout(std::move(config));
}

Pipeline::Builder& Pipeline::Builder::timeout(TimeoutConfig config) {
    return then(std::make_shared<TimeoutPolicy>(std::move(config)));
}

Pipeline::Builder& Pipeline::Builder::bulkhead(BulkheadConfig config) {
    return then(std::make_shared<BulkheadPolicy>(std::move(config)));
}

Pipeline::Builder& Pipeline::Builder::circuit(std::shared_ptr<CircuitBreaker> breaker) {
    return then(std::move(breaker));
}

Pipeline::Builder& Pipeline::Builder::fallback(std::shared_ptr<FallbackPolicy> fallback) {
    return then(std::move(fallback));
}

Pipeline Pipeline::Builder::build() const {
    return Pipeline(policies_);
}

std::shared_ptr<Pipeline> Pipeline::Builder::buildShared() const {
    return std::make_shared<Pipeline>(policies_);
}

} // namespace callguard::resilience
