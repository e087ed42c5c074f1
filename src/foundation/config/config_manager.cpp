#include "cbreak/foundation/config_manager.hpp"

#include <charconv>
#include <cmath>
#include <string>

namespace cbreak::foundation {

BreakerResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return loadNode(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return BreakerResult<void>::err(
            BreakerError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return BreakerResult<void>::err(
            BreakerError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

BreakerResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        return loadNode(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return BreakerResult<void>::err(
            BreakerError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

BreakerResult<void> ConfigManager::loadNode(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return BreakerResult<void>::err(
            BreakerError(ErrorCode::ConfigLoadFailed, "top-level YAML node must be a map"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root && root.IsMap()) {
        flatten("", root);
    }
    return BreakerResult<void>::ok();
}

BreakerResult<std::chrono::milliseconds> ConfigManager::getDuration(std::string_view key) const {
    auto raw = get<std::string>(key);
    if (raw.hasError()) {
        return BreakerResult<std::chrono::milliseconds>::err(std::move(raw).error());
    }
    auto parsed = parseDuration(raw.value());
    if (parsed.hasError()) {
        return BreakerResult<std::chrono::milliseconds>::err(
            BreakerError(ErrorCode::ConfigInvalidValue,
                         "invalid duration for key " + std::string(key) + ": " + raw.value()));
    }
    return parsed;
}

BreakerResult<std::chrono::milliseconds> ConfigManager::parseDuration(std::string_view text) {
    using Ms = std::chrono::milliseconds;
    auto invalid = [&] {
        return BreakerResult<Ms>::err(
            BreakerError(ErrorCode::ConfigInvalidValue,
                         "invalid duration: " + std::string(text)));
    };

    while (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }
    while (!text.empty() && text.back() == ' ') {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return invalid();
    }

    double scale = 1000.0;  // bare numbers are seconds
    if (text.ends_with("ms")) {
        scale = 1.0;
        text.remove_suffix(2);
    } else if (text.ends_with('s')) {
        text.remove_suffix(1);
    } else if (text.ends_with('m')) {
        scale = 60'000.0;
        text.remove_suffix(1);
    }

    double amount = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), amount);
    if (ec != std::errc{} || ptr != text.data() + text.size() || amount < 0.0) {
        return invalid();
    }
    return BreakerResult<Ms>::ok(Ms(static_cast<Ms::rep>(std::llround(amount * scale))));
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    // Invoked without the lock so a watcher may read the new value.
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace cbreak::foundation
