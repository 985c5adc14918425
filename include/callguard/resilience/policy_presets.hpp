#pragma once

/// @file policy_presets.hpp
/// @brief Ready-made pipelines for common kinds of dependency.

#include <chrono>
#include <memory>
#include <utility>

#include "callguard/foundation/task_executor.hpp"
#include "callguard/resilience/pipeline.hpp"

namespace callguard::resilience::presets {

/// Timeout 30 s -> Retry (3 attempts, 1 s, x2) -> Bulkhead 5.
[[nodiscard]] std::shared_ptr<Pipeline> externalApi(
    std::shared_ptr<foundation::TaskExecutor> executor = nullptr);

/// Timeout 10 s -> Retry (2 attempts, 500 ms).
[[nodiscard]] std::shared_ptr<Pipeline> database(
    std::shared_ptr<foundation::TaskExecutor> executor = nullptr);

/// Timeout 60 s -> Retry (3 attempts, 2 s, x3) -> Bulkhead 3.
[[nodiscard]] std::shared_ptr<Pipeline> ai(
    std::shared_ptr<foundation::TaskExecutor> executor = nullptr);

/// Fallback to @p miss -> Timeout 1 s.
///
/// For cache lookups: a slow or failing cache reads as a miss.
template <typename T>
[[nodiscard]] std::shared_ptr<Pipeline> cache(
    T miss, std::shared_ptr<foundation::TaskExecutor> executor = nullptr) {
    TimeoutConfig timeout;
    timeout.duration = std::chrono::seconds(1);
    timeout.executor = std::move(executor);
    return Pipeline::Builder()
        .fallback(FallbackPolicy::withValue(std::move(miss), {}, false))
        .timeout(std::move(timeout))
        .buildShared();
}

} // namespace callguard::resilience::presets
