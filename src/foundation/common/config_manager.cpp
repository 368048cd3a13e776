/// @file config_manager.cpp
/// @brief YAML-backed configuration store.

#include "tcc/foundation/config_manager.hpp"

#include <algorithm>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::foundation {

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        TCC_LOG_ERROR(LogCategory::Core, "cannot open config file " + path.string());
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed,
                      "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        TCC_LOG_ERROR(LogCategory::Core, "malformed config file " + path.string());
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed,
                      std::string("YAML parse error: ") + e.what()));
    }

    std::lock_guard lock(mutex_);
    entries_.clear();
    flatten("", root);
    TCC_LOG_INFO(LogCategory::Core, "loaded config " + path.string());
    return GameResult<void>::ok();
}

GameResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed,
                      std::string("YAML parse error: ") + e.what()));
    }

    std::lock_guard lock(mutex_);
    entries_.clear();
    flatten("", root);
    return GameResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.find(std::string(key)) != entries_.end();
}

std::vector<std::string> ConfigManager::keysUnder(std::string_view prefix) const {
    std::string head(prefix);
    head += '.';

    std::vector<std::string> keys;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [key, node] : entries_) {
            if (key.compare(0, head.size(), head) == 0) {
                keys.push_back(key);
            }
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto child = it->first.as<std::string>();
            flatten(prefix.empty() ? child : prefix + "." + child, it->second);
        }
        return;
    }
    if (!prefix.empty()) {
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    // Copy out so a callback may call back into get() without deadlocking.
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

} // namespace tcc::foundation
