#pragma once

/// @file policy_catalog.hpp
/// @brief Named pipelines built from presets or YAML configuration.

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "callguard/foundation/config_manager.hpp"
#include "callguard/foundation/task_executor.hpp"
#include "callguard/resilience/circuit_registry.hpp"
#include "callguard/resilience/pipeline.hpp"

namespace callguard::resilience {

/// Maps profile names ("external_api", "database", ...) to pipelines.
///
/// Filled once at startup, then read. Mutation is not synchronized; share
/// a catalog between threads only after it has been populated.
///
/// YAML layout read by loadFromConfig(), under the given prefix:
/// @code
///   resilience:
///     policies:
///       payments:
///         timeout_ms: 5000
///         retry:
///           max_attempts: 3
///           base_delay_ms: 200
///         circuit:
///           failure_threshold: 5
///           reset_timeout_ms: 30000
///         bulkhead:
///           max_concurrent: 8
///           queue: reject
///         order: [timeout, retry, circuit, bulkhead]
/// @endcode
class PolicyCatalog {
public:
    /// Prefix used when loadFromConfig() is given none.
    static constexpr std::string_view kDefaultPrefix = "resilience.policies";

    PolicyCatalog() = default;

    /// Catalog holding the external_api, database and ai presets.
    [[nodiscard]] static PolicyCatalog withDefaults(
        std::shared_ptr<foundation::TaskExecutor> executor = nullptr);

    /// Register @p pipeline under @p name, replacing any previous entry.
    void add(std::string name, std::shared_ptr<Pipeline> pipeline);

    /// Pipeline registered under @p name, or NotFound.
    [[nodiscard]] GuardResult<std::shared_ptr<Pipeline>> get(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] size_t size() const noexcept { return pipelines_.size(); }

    /// Registered names, sorted.
    [[nodiscard]] std::vector<std::string> names() const;

    /// Build one pipeline per profile found under @p prefix.
    ///
    /// Breakers are taken from @p registry (named by circuit.name, default
    /// the profile name). Every profile is validated before anything is
    /// registered: on error the catalog is left unchanged.
    ///
    /// @return Success, or ConfigTypeMismatch/InvalidArgument naming the key.
    GuardResult<void> loadFromConfig(const foundation::ConfigManager& config,
                                     CircuitRegistry& registry,
                                     std::string_view prefix = kDefaultPrefix,
                                     std::shared_ptr<foundation::TaskExecutor> executor = nullptr);

private:
    std::map<std::string, std::shared_ptr<Pipeline>, std::less<>> pipelines_;
};

} // namespace callguard::resilience
