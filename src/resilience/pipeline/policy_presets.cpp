/// @file policy_presets.cpp
/// @brief Preset pipeline definitions.

#include "callguard/resilience/policy_presets.hpp"

namespace callguard::resilience::presets {

namespace {

TimeoutConfig timeoutOf(std::chrono::milliseconds duration,
                        std::shared_ptr<foundation::TaskExecutor> executor) {
    TimeoutConfig config;
    config.duration = duration;
    config.executor = std::move(executor);
    return config;
}

} // anonymous namespace

std::shared_ptr<Pipeline> externalApi(std::shared_ptr<foundation::TaskExecutor> executor) {
    return Pipeline::Builder()
        .timeout(timeoutOf(std::chrono::seconds(30), std::move(executor)))
        .retry({.maxAttempts = 3,
                .baseDelay = std::chrono::milliseconds(1000),
                .backoffFactor = 2.0})
        .bulkhead({.maxConcurrent = 5, .name = "external_api"})
        .buildShared();
}

std::shared_ptr<Pipeline> database(std::shared_ptr<foundation::TaskExecutor> executor) {
    return Pipeline::Builder()
        .timeout(timeoutOf(std::chrono::seconds(10), std::move(executor)))
        .retry({.maxAttempts = 2, .baseDelay = std::chrono::milliseconds(500)})
        .buildShared();
}

std::shared_ptr<Pipeline> ai(std::shared_ptr<foundation::TaskExecutor> executor) {
    return Pipeline::Builder()
        .timeout(timeoutOf(std::chrono::seconds(60), std::move(executor)))
        .retry({.maxAttempts = 3,
                .baseDelay = std::chrono::milliseconds(2000),
                .backoffFactor = 3.0})
        .bulkhead({.maxConcurrent = 3, .name = "ai"})
        .buildShared();
}

} // namespace callguard::resilience::presets
