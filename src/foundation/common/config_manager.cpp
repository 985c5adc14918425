#include "callguard/foundation/config_manager.hpp"

#include <algorithm>

namespace callguard::foundation {

GuardResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return replaceWith(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return GuardResult<void>::err(
            GuardError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GuardResult<void>::err(
            GuardError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GuardResult<void> ConfigManager::loadString(std::string_view document) {
    try {
        return replaceWith(YAML::Load(std::string(document)));
    } catch (const YAML::ParserException& e) {
        return GuardResult<void>::err(
            GuardError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keysWithPrefix(std::string_view prefix) const {
    std::string wanted(prefix);
    if (!wanted.empty()) {
        wanted += '.';
    }

    std::vector<std::string> keys;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [key, node] : entries_) {
            if (key.compare(0, wanted.size(), wanted) == 0) {
                keys.push_back(key);
            }
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

GuardResult<void> ConfigManager::replaceWith(const YAML::Node& root) {
    if (root.IsDefined() && !root.IsNull() && !root.IsMap()) {
        return GuardResult<void>::err(
            GuardError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }

    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root.IsMap()) {
        flatten("", root);
    }
    return GuardResult<void>::ok();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null): store with its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace callguard::foundation
