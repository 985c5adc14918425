#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "callguard/foundation/guard_result.hpp"

namespace callguard::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key access
/// (e.g., "resilience.policies.ai.timeout_ms") and setting values at runtime.
/// Configuration is read once at startup; there is no change notification.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls. Sequences are stored as leaves.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file.
    /// @return Success or ConfigLoadFailed error.
    GuardResult<void> load(const std::filesystem::path& path);

    /// Load configuration from a YAML document held in memory.
    /// @return Success or ConfigLoadFailed error.
    GuardResult<void> loadString(std::string_view document);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    GuardResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when the key is absent.
    /// A present key with the wrong type is still an error.
    template <typename T>
    GuardResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Check if a key exists in the current configuration.
    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All keys starting with "<prefix>." (sorted).
    [[nodiscard]] std::vector<std::string> keysWithPrefix(std::string_view prefix) const;

private:
    GuardResult<void> replaceWith(const YAML::Node& root);

    /// Flatten a YAML node recursively into the entries_ map.
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
GuardResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GuardResult<T>::err(
            GuardError(ErrorCode::ConfigKeyNotFound,
                       std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GuardResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GuardResult<T>::err(
            GuardError(ErrorCode::ConfigTypeMismatch,
                       std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
GuardResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return GuardResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace callguard::foundation
