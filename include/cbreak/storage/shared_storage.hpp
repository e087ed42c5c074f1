#pragma once

/// @file shared_storage.hpp
/// @brief Circuit storage kept in a shared key-value store.
///
/// Several processes (or several breakers in one process) that build a
/// SharedCircuitStorage with the same client backend and namespace observe
/// one canonical breaker state.

#include <memory>
#include <string>

#include "cbreak/storage/circuit_storage.hpp"
#include "cbreak/storage/key_value_client.hpp"

namespace cbreak::storage {

/// Options for a SharedCircuitStorage.
struct SharedStorageOptions {
    /// First key segment shared by every breaker of the deployment.
    std::string baseNamespace = "cbreak";

    /// Second key segment identifying this breaker (e.g. "prod:payments").
    /// Empty collapses the key to "{base}:{field}".
    std::string instanceNamespace;

    /// State reported when the backend cannot be read.
    breaker::CircuitState fallbackState = breaker::CircuitState::Closed;

    /// State seeded by initialize() when the backend holds none yet.
    breaker::CircuitState initialState = breaker::CircuitState::Closed;
};

/// ICircuitStorage over an IKeyValueClient.
///
/// Key layout: `{base}:{instance}:state`, `...:fail_counter`,
/// `...:opened_at`. opened_at is stored as integer epoch seconds, so its
/// precision is one second: a reset timeout may elapse up to one second
/// early, and timeouts below one second are only meaningful on
/// MemoryCircuitStorage.
///
/// Backend failures never escape: reads return the fallback state (0 for
/// the counter, no opened-at), writes are logged at Error and dropped.
class SharedCircuitStorage : public ICircuitStorage {
public:
    SharedCircuitStorage(std::shared_ptr<IKeyValueClient> client,
                         SharedStorageOptions options);

    /// Seed state and counter keys that do not exist yet. Existing values,
    /// possibly written by another process, are left untouched.
    void initialize();

    [[nodiscard]] breaker::CircuitState state() override;
    void setState(breaker::CircuitState state) override;

    [[nodiscard]] uint32_t counter() override;
    uint32_t incrementCounter() override;
    void resetCounter() override;

    [[nodiscard]] std::optional<TimePoint> openedAt() override;
    void setOpenedAt(TimePoint when) override;

    [[nodiscard]] std::string_view name() const override { return "shared"; }

    /// Full key for a field, e.g. key("state") -> "cbreak:prod:payments:state".
    [[nodiscard]] std::string key(std::string_view field) const;

    [[nodiscard]] const SharedStorageOptions& options() const noexcept { return options_; }

private:
    void logFailure(std::string_view operation, const foundation::BreakerError& error) const;

    std::shared_ptr<IKeyValueClient> client_;
    SharedStorageOptions options_;
    std::string stateKey_;
    std::string counterKey_;
    std::string openedAtKey_;
};

}  // namespace cbreak::storage
