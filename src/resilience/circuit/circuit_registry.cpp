/// @file circuit_registry.cpp
/// @brief CircuitRegistry implementation.

#include "callguard/resilience/circuit_registry.hpp"
#include "callguard/foundation/guard_logger.hpp"

#include <algorithm>

namespace callguard::resilience {

using foundation::LogCategory;

std::shared_ptr<CircuitBreaker> CircuitRegistry::getOrCreate(const std::string& name,
                                                             CircuitBreakerConfig config) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = breakers_.try_emplace(name, nullptr);
    if (inserted) {
        config.name = name;
        it->second = std::make_shared<CircuitBreaker>(std::move(config));
        CALLGUARD_LOG_DEBUG(LogCategory::Circuit, "Registered circuit breaker '" + name + "'");
    }
    return it->second;
}

std::shared_ptr<CircuitBreaker> CircuitRegistry::getOrCreate(
    const std::string& name, uint32_t failureThreshold,
    std::chrono::milliseconds resetTimeout, uint32_t successThreshold) {
    CircuitBreakerConfig config;
    config.failureThreshold = failureThreshold;
    config.resetTimeout = resetTimeout;
    config.successThreshold = successThreshold;
    return getOrCreate(name, std::move(config));
}

std::shared_ptr<CircuitBreaker> CircuitRegistry::find(std::string_view name) const {
    std::lock_guard lock(mutex_);
    auto it = breakers_.find(std::string(name));
    return it != breakers_.end() ? it->second : nullptr;
}

bool CircuitRegistry::contains(std::string_view name) const {
    return find(name) != nullptr;
}

size_t CircuitRegistry::size() const {
    std::lock_guard lock(mutex_);
    return breakers_.size();
}

std::vector<std::string> CircuitRegistry::names() const {
    std::vector<std::string> result;
    {
        std::lock_guard lock(mutex_);
        result.reserve(breakers_.size());
        for (const auto& [name, breaker] : breakers_) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<CircuitBreakerStats> CircuitRegistry::snapshot() const {
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        std::lock_guard lock(mutex_);
        breakers.reserve(breakers_.size());
        for (const auto& [name, breaker] : breakers_) {
            breakers.push_back(breaker);
        }
    }

    // Breaker locks are taken outside the registry lock.
    std::vector<CircuitBreakerStats> result;
    result.reserve(breakers.size());
    for (const auto& breaker : breakers) {
        result.push_back(breaker->stats());
    }
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.name < b.name; });
    return result;
}

void CircuitRegistry::resetAll() {
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [name, breaker] : breakers_) {
            breakers.push_back(breaker);
        }
    }
    for (const auto& breaker : breakers) {
        breaker->reset();
    }
}

} // namespace callguard::resilience
