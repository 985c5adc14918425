#pragma once

/// @file pipeline.hpp
/// @brief Ordered composition of policies.

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "callguard/resilience/bulkhead_policy.hpp"
#include "callguard/resilience/circuit_breaker.hpp"
#include "callguard/resilience/fallback_policy.hpp"
#include "callguard/resilience/policy.hpp"
#include "callguard/resilience/retry_policy.hpp"
#include "callguard/resilience/timeout_policy.hpp"

namespace callguard::resilience {

/// Runs an operation through a fixed list of policies, outermost first.
///
/// Pipeline{a, b, c}.execute(fn) behaves as a(b(c(fn))). Nested pipelines
/// are flattened on construction, so composition is associative:
/// compose(compose(a, b), c) and compose(a, compose(b, c)) hold the same
/// list. An empty pipeline runs the operation directly.
///
/// Policies are shared, not copied: a bulkhead or breaker placed in two
/// pipelines enforces one limit across both.
///
/// Example:
/// @code
///   auto pipeline = Pipeline::Builder()
///                       .timeout(std::chrono::seconds(10))
///                       .retry({.maxAttempts = 2, .baseDelay = std::chrono::milliseconds(500)})
///                       .circuit(registry.getOrCreate("database"))
///                       .build();
///   auto rows = pipeline.execute([] { return db.query("SELECT 1"); });
/// @endcode
class Pipeline final : public Policy {
public:
    class Builder;

    Pipeline() = default;

    /// Null entries are dropped; nested pipelines are spliced in.
    explicit Pipeline(std::vector<std::shared_ptr<Policy>> policies);

    [[nodiscard]] ErasedResult run(const Operation& op) override;

    /// "Pipeline[Timeout(30000ms) -> Retry(max=3, base=1000ms)]".
    [[nodiscard]] std::string describe() const override;

    /// Flattened policies, outermost first.
    [[nodiscard]] const std::vector<std::shared_ptr<Policy>>& policies() const noexcept {
        return policies_;
    }

    [[nodiscard]] size_t size() const noexcept { return policies_.size(); }
    [[nodiscard]] bool empty() const noexcept { return policies_.empty(); }

private:
    std::vector<std::shared_ptr<Policy>> policies_;
};

/// Fluent construction of a Pipeline, outermost policy first.
class Pipeline::Builder {
public:
    Builder& then(std::shared_ptr<Policy> policy);

    Builder& retry(RetryConfig config = {});
    Builder& timeout(std::chrono::milliseconds duration);
    Builder& timeout(TimeoutConfig config);
    Builder& bulkhead(BulkheadConfig config = {});
    Builder& circuit(std::shared_ptr<CircuitBreaker> breaker);
    Builder& fallback(std::shared_ptr<FallbackPolicy> fallback);

    /// Fallback substituting @p value for every failure.
    template <typename T>
    Builder& fallbackTo(T value) {
        return fallback(FallbackPolicy::withValue(std::move(value)));
    }

    [[nodiscard]] Pipeline build() const;
    [[nodiscard]] std::shared_ptr<Pipeline> buildShared() const;

private:
    std::vector<std::shared_ptr<Policy>> policies_;
};

/// Compose policies (or pipelines) into one flattened pipeline.
template <typename... Policies>
[[nodiscard]] std::shared_ptr<Pipeline> compose(Policies&&... policies) {
    static_assert((std::is_convertible_v<Policies, std::shared_ptr<Policy>> && ...),
                  "compose() takes shared pointers to policies");
    std::vector<std::shared_ptr<Policy>> list{
        std::shared_ptr<Policy>(std::forward<Policies>(policies))...};
    return std::make_shared<Pipeline>(std::move(list));
}

} // namespace callguard::resilience
