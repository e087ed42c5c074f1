#pragma once

/// @file key_value_client.hpp
/// @brief Shared key-value store client interface and in-process implementation.
///
/// SharedCircuitStorage talks to its backend only through this interface,
/// and only through single-key atomic operations, so one client can be
/// shared by any number of breakers.

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cbreak/foundation/breaker_result.hpp"

namespace cbreak::storage {

using foundation::BreakerResult;

/// Abstract client for a shared key-value store.
///
/// Every operation can fail (the store is remote); failures are reported
/// as BreakerResult errors and never thrown. Implementations must be
/// thread-safe.
class IKeyValueClient {
public:
    virtual ~IKeyValueClient() = default;

    /// Read a key. An absent key yields an empty optional.
    [[nodiscard]] virtual BreakerResult<std::optional<std::string>> get(std::string_view key) = 0;

    /// Unconditionally write a key.
    virtual BreakerResult<void> set(std::string_view key, std::string_view value) = 0;

    /// Write a key only if it does not exist yet. Returns true if written.
    virtual BreakerResult<bool> setIfAbsent(std::string_view key, std::string_view value) = 0;

    /// Atomically increment an integer key (absent counts as 0).
    /// Returns the value after the increment.
    virtual BreakerResult<int64_t> increment(std::string_view key) = 0;

    /// Atomically replace an integer key with @p value only if the key is
    /// absent or holds a smaller integer. Returns true if written.
    virtual BreakerResult<bool> setIfGreater(std::string_view key, int64_t value) = 0;

    /// Delete a key. Returns true if it existed.
    virtual BreakerResult<bool> remove(std::string_view key) = 0;

    /// List keys starting with @p prefix.
    [[nodiscard]] virtual BreakerResult<std::vector<std::string>> keys(std::string_view prefix) = 0;
};

/// Thread-safe process-local key-value store.
///
/// Lets several breakers in one process share canonical state exactly the
/// way separate processes would through a remote store; used for tests,
/// development and single-host deployments.
class InMemoryKeyValueClient : public IKeyValueClient {
public:
    [[nodiscard]] BreakerResult<std::optional<std::string>> get(std::string_view key) override;
    BreakerResult<void> set(std::string_view key, std::string_view value) override;
    BreakerResult<bool> setIfAbsent(std::string_view key, std::string_view value) override;
    BreakerResult<int64_t> increment(std::string_view key) override;
    BreakerResult<bool> setIfGreater(std::string_view key, int64_t value) override;
    BreakerResult<bool> remove(std::string_view key) override;
    [[nodiscard]] BreakerResult<std::vector<std::string>> keys(std::string_view prefix) override;

    /// Number of stored keys.
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> data_;
};

}  // namespace cbreak::storage
