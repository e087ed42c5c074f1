#pragma once

/// @file memory_storage.hpp
/// @brief In-process circuit storage.

#include <mutex>

#include "cbreak/storage/circuit_storage.hpp"

namespace cbreak::storage {

/// Thread-safe in-memory storage for breakers that live in a single process.
///
/// Always consistent, never fails, and keeps opened-at at full
/// system_clock precision, so sub-second reset timeouts are honored.
class MemoryCircuitStorage : public ICircuitStorage {
public:
    explicit MemoryCircuitStorage(breaker::CircuitState initial = breaker::CircuitState::Closed);

    [[nodiscard]] breaker::CircuitState state() override;
    void setState(breaker::CircuitState state) override;

    [[nodiscard]] uint32_t counter() override;
    uint32_t incrementCounter() override;
    void resetCounter() override;

    [[nodiscard]] std::optional<TimePoint> openedAt() override;
    void setOpenedAt(TimePoint when) override;

    [[nodiscard]] std::string_view name() const override { return "memory"; }

private:
    mutable std::mutex mutex_;
    breaker::CircuitState state_;
    uint32_t failCounter_{0};
    std::optional<TimePoint> openedAt_;
};

}  // namespace cbreak::storage
