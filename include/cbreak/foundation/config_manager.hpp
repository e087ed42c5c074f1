#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed access, durations and watchers.

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "cbreak/foundation/breaker_result.hpp"

namespace cbreak::foundation {

/// Receives the key passed to set().
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// Settings store fed from a YAML file or string.
///
/// Nested mappings are addressed with dotted keys such as
/// "breaker.redis.port". Loading flattens the document into scalar nodes,
/// so later edits through set() never alias the parsed tree.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Replaces all entries. Fails with ConfigLoadFailed.
    BreakerResult<void> load(const std::filesystem::path& path);

    BreakerResult<void> loadFromString(std::string_view yaml);

    /// Fails with ConfigKeyNotFound or ConfigTypeMismatch.
    template <typename T>
    BreakerResult<T> get(std::string_view key) const;

    /// Like get(), but an absent key yields @p fallback.
    template <typename T>
    BreakerResult<T> getOr(std::string_view key, T fallback) const;

    /// Retrieve a duration. Accepts "250ms", "15s", "2m" or a bare number
    /// of seconds (fractions allowed: 0.5 -> 500ms).
    BreakerResult<std::chrono::milliseconds> getDuration(std::string_view key) const;

    template <typename T>
    void set(std::string_view key, const T& value);

    /// @p callback runs after set(@p key, ...), outside the lock.
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Parse a duration literal (see getDuration()).
    static BreakerResult<std::chrono::milliseconds> parseDuration(std::string_view text);

private:
    BreakerResult<void> loadNode(const YAML::Node& root);

    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

template <typename T>
BreakerResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return BreakerResult<T>::err(
            BreakerError(ErrorCode::ConfigKeyNotFound,
                         std::string("missing config key ") + std::string(key)));
    }
    try {
        return BreakerResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return BreakerResult<T>::err(
            BreakerError(ErrorCode::ConfigTypeMismatch,
                         std::string("config key has wrong type: ") + std::string(key)));
    }
}

template <typename T>
BreakerResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return BreakerResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace cbreak::foundation
