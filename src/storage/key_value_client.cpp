/// @file key_value_client.cpp
/// @brief InMemoryKeyValueClient implementation.

#include "cbreak/storage/key_value_client.hpp"

#include <algorithm>
#include <charconv>

namespace cbreak::storage {

using foundation::BreakerError;
using foundation::ErrorCode;

namespace {

std::optional<int64_t> parseInteger(std::string_view text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

BreakerError notAnInteger(std::string_view key) {
    return BreakerError(ErrorCode::StorageCommandFailed,
                        "value is not an integer: " + std::string(key));
}

}  // namespace

BreakerResult<std::optional<std::string>> InMemoryKeyValueClient::get(std::string_view key) {
    std::lock_guard lock(mutex_);
    auto it = data_.find(std::string(key));
    if (it == data_.end()) {
        return BreakerResult<std::optional<std::string>>::ok(std::nullopt);
    }
    return BreakerResult<std::optional<std::string>>::ok(it->second);
}

BreakerResult<void> InMemoryKeyValueClient::set(std::string_view key, std::string_view value) {
    std::lock_guard lock(mutex_);
    data_[std::string(key)] = std::string(value);
    return BreakerResult<void>::ok();
}

BreakerResult<bool> InMemoryKeyValueClient::setIfAbsent(std::string_view key,
                                                        std::string_view value) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = data_.try_emplace(std::string(key), std::string(value));
    return BreakerResult<bool>::ok(inserted);
}

BreakerResult<int64_t> InMemoryKeyValueClient::increment(std::string_view key) {
    std::lock_guard lock(mutex_);
    auto& slot = data_[std::string(key)];
    int64_t current = 0;
    if (!slot.empty()) {
        auto parsed = parseInteger(slot);
        if (!parsed) {
            return BreakerResult<int64_t>::err(notAnInteger(key));
        }
        current = *parsed;
    }
    ++current;
    slot = std::to_string(current);
    return BreakerResult<int64_t>::ok(current);
}

BreakerResult<bool> InMemoryKeyValueClient::setIfGreater(std::string_view key, int64_t value) {
    std::lock_guard lock(mutex_);
    auto it = data_.find(std::string(key));
    if (it != data_.end()) {
        auto parsed = parseInteger(it->second);
        if (!parsed) {
            return BreakerResult<bool>::err(notAnInteger(key));
        }
        if (value <= *parsed) {
            return BreakerResult<bool>::ok(false);
        }
        it->second = std::to_string(value);
        return BreakerResult<bool>::ok(true);
    }
    data_.emplace(std::string(key), std::to_string(value));
    return BreakerResult<bool>::ok(true);
}

BreakerResult<bool> InMemoryKeyValueClient::remove(std::string_view key) {
    std::lock_guard lock(mutex_);
    return BreakerResult<bool>::ok(data_.erase(std::string(key)) > 0);
}

BreakerResult<std::vector<std::string>> InMemoryKeyValueClient::keys(std::string_view prefix) {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [key, value] : data_) {
        if (key.starts_with(prefix)) {
            out.push_back(key);
        }
    }
    std::sort(out.begin(), out.end());
    return BreakerResult<std::vector<std::string>>::ok(std::move(out));
}

std::size_t InMemoryKeyValueClient::size() const {
    std::lock_guard lock(mutex_);
    return data_.size();
}

}  // namespace cbreak::storage
