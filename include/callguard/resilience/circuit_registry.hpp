#pragma once

/// @file circuit_registry.hpp
/// @brief Thread-safe store of named circuit breakers.

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "callguard/resilience/circuit_breaker.hpp"

namespace callguard::resilience {

/// Owns one CircuitBreaker per dependency name.
///
/// A registry is an ordinary value: the host creates one at startup and
/// passes it by reference to whoever builds pipelines. Tests create their
/// own isolated registries.
///
/// getOrCreate() is race-free; the first caller for a name decides its
/// configuration and later callers receive that same breaker regardless of
/// the configuration they pass.
///
/// Example:
/// @code
///   CircuitRegistry registry;
///   auto payments = registry.getOrCreate("payments", 5, std::chrono::seconds(30), 2);
///   auto again = registry.getOrCreate("payments", {.failureThreshold = 1});
///   // again == payments; failureThreshold stays 5
/// @endcode
class CircuitRegistry {
public:
    CircuitRegistry() = default;

    CircuitRegistry(const CircuitRegistry&) = delete;
    CircuitRegistry& operator=(const CircuitRegistry&) = delete;

    /// Existing breaker for @p name, or a new one built from @p config.
    /// The breaker's name is always @p name.
    [[nodiscard]] std::shared_ptr<CircuitBreaker> getOrCreate(const std::string& name,
                                                              CircuitBreakerConfig config = {});

    /// Shorthand for the common consecutive-failure configuration.
    [[nodiscard]] std::shared_ptr<CircuitBreaker> getOrCreate(
        const std::string& name, uint32_t failureThreshold,
        std::chrono::milliseconds resetTimeout, uint32_t successThreshold = 2);

    /// Breaker for @p name, or null if none was created.
    [[nodiscard]] std::shared_ptr<CircuitBreaker> find(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] size_t size() const;

    /// Registered names, sorted.
    [[nodiscard]] std::vector<std::string> names() const;

    /// Stats of every breaker, sorted by name.
    [[nodiscard]] std::vector<CircuitBreakerStats> snapshot() const;

    /// Reset every breaker to Closed with zeroed counters.
    void resetAll();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace callguard::resilience
