/// @file policy_catalog.cpp
/// @brief PolicyCatalog implementation and YAML profile parsing.

#include "callguard/resilience/policy_catalog.hpp"
#include "callguard/foundation/guard_logger.hpp"
#include "callguard/resilience/policy_presets.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <set>

namespace callguard::resilience {

using foundation::ConfigManager;
using foundation::LogCategory;

namespace {

enum class Layer : uint8_t { Timeout, Retry, Circuit, Bulkhead };

/// One profile's settings, validated but not yet turned into policies.
struct ProfileSpec {
    std::string name;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<RetryConfig> retry;
    std::optional<BulkheadConfig> bulkhead;
    std::optional<CircuitBreakerConfig> circuit;
    std::vector<Layer> order;
};

GuardError invalid(const std::string& key, const std::string& why) {
    return GuardError(ErrorCode::InvalidArgument, "invalid value for " + key + ": " + why);
}

bool hasSection(const ConfigManager& config, const std::string& key) {
    return config.hasKey(key) || !config.keysWithPrefix(key).empty();
}

constexpr int64_t kMaxCount = std::numeric_limits<uint32_t>::max();
constexpr int64_t kMaxMillis = std::numeric_limits<int64_t>::max();

/// Read an integer setting in [1, @p maximum]; absent keys yield @p fallback.
GuardResult<int64_t> readPositive(const ConfigManager& config, const std::string& key,
                                  int64_t fallback, int64_t maximum = kMaxCount) {
    auto value = config.getOr<int64_t>(key, fallback);
    if (value.hasError()) {
        return value;
    }
    if (value.value() < 1) {
        return GuardResult<int64_t>::err(invalid(key, "must be at least 1"));
    }
    if (value.value() > maximum) {
        return GuardResult<int64_t>::err(
            invalid(key, "must be at most " + std::to_string(maximum)));
    }
    return value;
}

GuardResult<Layer> parseLayer(const std::string& key, const std::string& name) {
    if (name == "timeout") {
        return GuardResult<Layer>::ok(Layer::Timeout);
    }
    if (name == "retry") {
        return GuardResult<Layer>::ok(Layer::Retry);
    }
    if (name == "circuit") {
        return GuardResult<Layer>::ok(Layer::Circuit);
    }
    if (name == "bulkhead") {
        return GuardResult<Layer>::ok(Layer::Bulkhead);
    }
    return GuardResult<Layer>::err(invalid(key, "unknown policy '" + name + "'"));
}

GuardResult<void> parseRetry(const ConfigManager& config, const std::string& base,
                             ProfileSpec& spec) {
    if (!hasSection(config, base + "retry")) {
        return GuardResult<void>::ok();
    }
    RetryConfig retry;

    auto attempts = readPositive(config, base + "retry.max_attempts", retry.maxAttempts);
    if (attempts.hasError()) {
        return GuardResult<void>::err(std::move(attempts).error());
    }
    retry.maxAttempts = static_cast<uint32_t>(attempts.value());

    auto baseDelay = config.getOr<int64_t>(base + "retry.base_delay_ms", retry.baseDelay.count());
    if (baseDelay.hasError()) {
        return GuardResult<void>::err(std::move(baseDelay).error());
    }
    if (baseDelay.value() < 0) {
        return GuardResult<void>::err(invalid(base + "retry.base_delay_ms", "must not be negative"));
    }
    retry.baseDelay = std::chrono::milliseconds(baseDelay.value());

    auto factor = config.getOr<double>(base + "retry.backoff_factor", retry.backoffFactor);
    if (factor.hasError()) {
        return GuardResult<void>::err(std::move(factor).error());
    }
    if (factor.value() < 1.0) {
        return GuardResult<void>::err(invalid(base + "retry.backoff_factor", "must be at least 1.0"));
    }
    retry.backoffFactor = factor.value();

    auto maxDelay = readPositive(config, base + "retry.max_delay_ms", retry.maxDelay.count(),
                                 kMaxMillis);
    if (maxDelay.hasError()) {
        return GuardResult<void>::err(std::move(maxDelay).error());
    }
    retry.maxDelay = std::chrono::milliseconds(maxDelay.value());

    auto jitter = config.getOr<bool>(base + "retry.jitter", retry.jitter);
    if (jitter.hasError()) {
        return GuardResult<void>::err(std::move(jitter).error());
    }
    retry.jitter = jitter.value();

    spec.retry = std::move(retry);
    return GuardResult<void>::ok();
}

GuardResult<void> parseBulkhead(const ConfigManager& config, const std::string& base,
                                ProfileSpec& spec) {
    if (!hasSection(config, base + "bulkhead")) {
        return GuardResult<void>::ok();
    }
    BulkheadConfig bulkhead;
    bulkhead.name = spec.name;

    auto maxConcurrent = readPositive(config, base + "bulkhead.max_concurrent",
                                      bulkhead.maxConcurrent);
    if (maxConcurrent.hasError()) {
        return GuardResult<void>::err(std::move(maxConcurrent).error());
    }
    bulkhead.maxConcurrent = static_cast<uint32_t>(maxConcurrent.value());

    auto queue = config.getOr<std::string>(base + "bulkhead.queue", "block");
    if (queue.hasError()) {
        return GuardResult<void>::err(std::move(queue).error());
    }
    if (queue.value() == "block") {
        bulkhead.queuePolicy = QueuePolicy::Block;
    } else if (queue.value() == "reject") {
        bulkhead.queuePolicy = QueuePolicy::Reject;
    } else {
        return GuardResult<void>::err(
            invalid(base + "bulkhead.queue", "expected 'block' or 'reject'"));
    }

    if (config.hasKey(base + "bulkhead.max_wait_ms")) {
        auto maxWait = readPositive(config, base + "bulkhead.max_wait_ms", 1, kMaxMillis);
        if (maxWait.hasError()) {
            return GuardResult<void>::err(std::move(maxWait).error());
        }
        bulkhead.maxWait = std::chrono::milliseconds(maxWait.value());
    }

    spec.bulkhead = std::move(bulkhead);
    return GuardResult<void>::ok();
}

GuardResult<void> parseCircuit(const ConfigManager& config, const std::string& base,
                               ProfileSpec& spec) {
    if (!hasSection(config, base + "circuit")) {
        return GuardResult<void>::ok();
    }
    CircuitBreakerConfig circuit;

    auto name = config.getOr<std::string>(base + "circuit.name", spec.name);
    if (name.hasError()) {
        return GuardResult<void>::err(std::move(name).error());
    }
    circuit.name = name.value();

    auto failures = readPositive(config, base + "circuit.failure_threshold",
                                 circuit.failureThreshold);
    if (failures.hasError()) {
        return GuardResult<void>::err(std::move(failures).error());
    }
    circuit.failureThreshold = static_cast<uint32_t>(failures.value());

    auto resetTimeout = readPositive(config, base + "circuit.reset_timeout_ms",
                                     circuit.resetTimeout.count(), kMaxMillis);
    if (resetTimeout.hasError()) {
        return GuardResult<void>::err(std::move(resetTimeout).error());
    }
    circuit.resetTimeout = std::chrono::milliseconds(resetTimeout.value());

    auto successes = readPositive(config, base + "circuit.success_threshold",
                                  circuit.successThreshold);
    if (successes.hasError()) {
        return GuardResult<void>::err(std::move(successes).error());
    }
    circuit.successThreshold = static_cast<uint32_t>(successes.value());

    spec.circuit = std::move(circuit);
    return GuardResult<void>::ok();
}

GuardResult<void> parseOrder(const ConfigManager& config, const std::string& base,
                             ProfileSpec& spec) {
    const std::string key = base + "order";
    if (!config.hasKey(key)) {
        spec.order = {Layer::Timeout, Layer::Retry, Layer::Circuit, Layer::Bulkhead};
        return GuardResult<void>::ok();
    }

    auto names = config.get<std::vector<std::string>>(key);
    if (names.hasError()) {
        return GuardResult<void>::err(std::move(names).error());
    }
    std::set<Layer> seen;
    for (const auto& name : names.value()) {
        auto layer = parseLayer(key, name);
        if (layer.hasError()) {
            return GuardResult<void>::err(std::move(layer).error());
        }
        if (!seen.insert(layer.value()).second) {
            return GuardResult<void>::err(invalid(key, "'" + name + "' listed twice"));
        }
        spec.order.push_back(layer.value());
    }

    // A configured section left out of the order is almost always a typo.
    auto configured = [&spec](Layer layer) {
        switch (layer) {
            case Layer::Timeout:  return spec.timeout.has_value();
            case Layer::Retry:    return spec.retry.has_value();
            case Layer::Circuit:  return spec.circuit.has_value();
            case Layer::Bulkhead: return spec.bulkhead.has_value();
        }
        return false;
    };
    for (auto layer : {Layer::Timeout, Layer::Retry, Layer::Circuit, Layer::Bulkhead}) {
        if (configured(layer) && seen.count(layer) == 0) {
            return GuardResult<void>::err(invalid(key, "a configured policy is missing"));
        }
    }
    return GuardResult<void>::ok();
}

GuardResult<ProfileSpec> parseProfile(const ConfigManager& config, const std::string& prefix,
                                      const std::string& name) {
    ProfileSpec spec;
    spec.name = name;
    const std::string base = prefix + "." + name + ".";

    if (config.hasKey(base + "timeout_ms")) {
        auto timeout = readPositive(config, base + "timeout_ms", 1, kMaxMillis);
        if (timeout.hasError()) {
            return GuardResult<ProfileSpec>::err(std::move(timeout).error());
        }
        spec.timeout = std::chrono::milliseconds(timeout.value());
    }

    for (auto* parse : {&parseRetry, &parseBulkhead, &parseCircuit, &parseOrder}) {
        auto parsed = parse(config, base, spec);
        if (parsed.hasError()) {
            return GuardResult<ProfileSpec>::err(std::move(parsed).error());
        }
    }
    return GuardResult<ProfileSpec>::ok(std::move(spec));
}

std::shared_ptr<Pipeline> buildProfile(const ProfileSpec& spec, CircuitRegistry& registry,
                                       const std::shared_ptr<foundation::TaskExecutor>& executor) {
    Pipeline::Builder builder;
    for (auto layer : spec.order) {
        switch (layer) {
            case Layer::Timeout:
                if (spec.timeout) {
                    builder.timeout(TimeoutConfig{*spec.timeout, executor});
                }
                break;
            case Layer::Retry:
                if (spec.retry) {
                    builder.retry(*spec.retry);
                }
                break;
            case Layer::Circuit:
                if (spec.circuit) {
                    builder.circuit(registry.getOrCreate(spec.circuit->name, *spec.circuit));
                }
                break;
            case Layer::Bulkhead:
                if (spec.bulkhead) {
                    builder.bulkhead(*spec.bulkhead);
                }
                break;
        }
    }
    return builder.buildShared();
}

} // anonymous namespace

PolicyCatalog PolicyCatalog::withDefaults(std::shared_ptr<foundation::TaskExecutor> executor) {
    PolicyCatalog catalog;
    catalog.add("external_api", presets::externalApi(executor));
    catalog.add("database", presets::database(executor));
    catalog.add("ai", presets::ai(executor));
    return catalog;
}

void PolicyCatalog::add(std::string name, std::shared_ptr<Pipeline> pipeline) {
    pipelines_.insert_or_assign(std::move(name), std::move(pipeline));
}

GuardResult<std::shared_ptr<Pipeline>> PolicyCatalog::get(std::string_view name) const {
    auto it = pipelines_.find(name);
    if (it == pipelines_.end()) {
        return GuardResult<std::shared_ptr<Pipeline>>::err(
            GuardError(ErrorCode::NotFound,
                       "no resilience profile named '" + std::string(name) + "'"));
    }
    return GuardResult<std::shared_ptr<Pipeline>>::ok(it->second);
}

bool PolicyCatalog::contains(std::string_view name) const {
    return pipelines_.find(name) != pipelines_.end();
}

std::vector<std::string> PolicyCatalog::names() const {
    std::vector<std::string> result;
    result.reserve(pipelines_.size());
    for (const auto& [name, pipeline] : pipelines_) {
        result.push_back(name);
    }
    return result;
}

GuardResult<void> PolicyCatalog::loadFromConfig(const ConfigManager& config,
                                                CircuitRegistry& registry,
                                                std::string_view prefix,
                                                std::shared_ptr<foundation::TaskExecutor> executor) {
    const std::string root(prefix);

    // "<prefix>.<profile>.<setting...>" -> profile
    std::set<std::string> profiles;
    for (const auto& key : config.keysWithPrefix(root)) {
        auto rest = key.substr(root.size() + 1);
        auto dot = rest.find('.');
        if (dot == std::string::npos) {
            return GuardResult<void>::err(invalid(key, "expected a profile mapping"));
        }
        profiles.insert(rest.substr(0, dot));
    }

    std::vector<ProfileSpec> specs;
    specs.reserve(profiles.size());
    for (const auto& name : profiles) {
        auto spec = parseProfile(config, root, name);
        if (spec.hasError()) {
            CALLGUARD_LOG_ERROR(LogCategory::Config,
                "Rejected resilience profile '" + name + "': " +
                std::string(spec.error().message()));
            return GuardResult<void>::err(std::move(spec).error());
        }
        specs.push_back(std::move(spec).value());
    }

    for (const auto& spec : specs) {
        add(spec.name, buildProfile(spec, registry, executor));
    }

    CALLGUARD_LOG_INFO(LogCategory::Config,
        "Loaded " + std::to_string(specs.size()) + " resilience profile(s) from '" + root + "'");
    return GuardResult<void>::ok();
}

} // namespace callguard::resilience
