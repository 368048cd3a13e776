#pragma once

/// @file config_manager.hpp
/// @brief YAML configuration with dotted-key typed lookup and change watchers.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "tcc/foundation/game_result.hpp"

namespace tcc::foundation {

/// Fired after set() changes the watched key.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// Typed access to the combat core's YAML configuration.
///
/// The document is flattened on load, so nested maps are addressed with
/// dotted keys such as "grid.diagonal_policy" or "rules.preset".
/// Sequences and scalars are leaves.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Replace the current entries with the contents of a YAML file.
    GameResult<void> load(const std::filesystem::path& path);

    /// Replace the current entries with an in-memory YAML document.
    GameResult<void> loadFromString(std::string_view yaml);

    /// @return the value, or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Value of @p key, or @p fallback when absent or of the wrong type.
    template <typename T>
    [[nodiscard]] T getOr(std::string_view key, T fallback) const {
        auto result = get<T>(key);
        return result ? std::move(result).value() : std::move(fallback);
    }

    /// Overwrite @p out only when @p key exists. Absence is not an error,
    /// a value of the wrong type is.
    template <typename T>
    GameResult<void> readIfPresent(std::string_view key, T& out) const;

    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Every key, sorted, that starts with "@p prefix.".
    [[nodiscard]] std::vector<std::string> keysUnder(std::string_view prefix) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// ── Template implementations ───────────────────────────────────────────

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      "config key not found: " + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      "type mismatch for key: " + std::string(key)));
    }
}

template <typename T>
GameResult<void> ConfigManager::readIfPresent(std::string_view key, T& out) const {
    if (!hasKey(key)) {
        return GameResult<void>::ok();
    }
    auto value = get<T>(key);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    out = std::move(value).value();
    return GameResult<void>::ok();
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace tcc::foundation
