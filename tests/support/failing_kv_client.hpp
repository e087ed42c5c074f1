#pragma once

/// @file failing_kv_client.hpp
/// @brief InMemoryKeyValueClient whose reads and writes can be made to fail.

#include <atomic>
#include <string>

#include "cbreak/storage/key_value_client.hpp"

namespace cbreak::test {

using foundation::BreakerError;
using foundation::BreakerResult;
using foundation::ErrorCode;

class FailingKeyValueClient : public storage::InMemoryKeyValueClient {
public:
    std::atomic<bool> failReads{false};
    std::atomic<bool> failWrites{false};

    BreakerResult<std::optional<std::string>> get(std::string_view key) override {
        if (failReads) {
            return BreakerResult<std::optional<std::string>>::err(unavailable());
        }
        return InMemoryKeyValueClient::get(key);
    }

    BreakerResult<void> set(std::string_view key, std::string_view value) override {
        if (failWrites) {
            return BreakerResult<void>::err(unavailable());
        }
        return InMemoryKeyValueClient::set(key, value);
    }

    BreakerResult<bool> setIfAbsent(std::string_view key, std::string_view value) override {
        if (failWrites) {
            return BreakerResult<bool>::err(unavailable());
        }
        return InMemoryKeyValueClient::setIfAbsent(key, value);
    }

    BreakerResult<int64_t> increment(std::string_view key) override {
        if (failWrites) {
            return BreakerResult<int64_t>::err(unavailable());
        }
        return InMemoryKeyValueClient::increment(key);
    }

    BreakerResult<bool> setIfGreater(std::string_view key, int64_t value) override {
        if (failWrites) {
            return BreakerResult<bool>::err(unavailable());
        }
        return InMemoryKeyValueClient::setIfGreater(key, value);
    }

private:
    static BreakerError unavailable() {
        return BreakerError(ErrorCode::StorageUnavailable, "backend unreachable");
    }
};

}  // namespace cbreak::test
