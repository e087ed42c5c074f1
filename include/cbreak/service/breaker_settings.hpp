#pragma once

/// @file breaker_settings.hpp
/// @brief Typed breaker settings loaded from ConfigManager.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "cbreak/breaker/circuit_breaker.hpp"
#include "cbreak/foundation/config_manager.hpp"
#include "cbreak/storage/redis_client.hpp"

namespace cbreak::service {

using foundation::BreakerResult;

/// Where registry-created breakers keep their canonical state.
enum class StorageBackend : uint8_t {
    Memory, ///< One MemoryCircuitStorage per breaker (single process).
    Shared, ///< SharedCircuitStorage over a caller-supplied client.
    Redis   ///< SharedCircuitStorage over a RedisKeyValueClient.
};

constexpr std::string_view storageBackendName(StorageBackend backend) {
    switch (backend) {
        case StorageBackend::Memory: return "memory";
        case StorageBackend::Shared: return "shared";
        case StorageBackend::Redis:  return "redis";
    }
    return "unknown";
}

/// Parse "memory", "shared" or "redis".
[[nodiscard]] std::optional<StorageBackend> parseStorageBackend(std::string_view text);

/// Parse a subsystem name such as "Storage" or "network" (case-insensitive).
[[nodiscard]] std::optional<foundation::ErrorSubsystem> parseErrorSubsystem(std::string_view text);

/// Settings shared by every breaker of a BreakerRegistry.
///
/// YAML layout (all keys optional):
/// @code
///   breaker:
///     fail_max: 5
///     reset_timeout: 15s
///     count_rejected_calls: false
///     environment: production
///     excluded_codes: ["0x0003"]
///     excluded_subsystems: [General]
///     storage:
///       backend: redis
///       base_namespace: cbreak
///       fallback_state: closed
///     redis:
///       host: 127.0.0.1
///       port: 6379
///       database: 3
///       timeout: 500ms
/// @endcode
struct BreakerSettings {
    uint32_t failMax = 5;
    std::chrono::milliseconds resetTimeout{15000};
    bool countRejectedCalls = false;

    /// First half of every dependency namespace ("{environment}:{dependency}").
    std::string environment = "development";

    breaker::ExclusionSet excluded;

    StorageBackend backend = StorageBackend::Memory;
    std::string baseNamespace = "cbreak";
    breaker::CircuitState fallbackState = breaker::CircuitState::Closed;

    storage::RedisOptions redis;

    /// Read the "breaker.*" keys. Absent keys keep their defaults.
    /// @return ConfigTypeMismatch or ConfigInvalidValue on a bad value.
    static BreakerResult<BreakerSettings> fromConfig(const foundation::ConfigManager& config);

    /// Breaker configuration for one dependency.
    [[nodiscard]] breaker::BreakerConfig toBreakerConfig(std::string name) const;
};

}  // namespace cbreak::service
