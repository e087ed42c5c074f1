#pragma once

/// @file circuit_storage.hpp
/// @brief Canonical circuit state storage interface.
///
/// A storage holds the {state, failure counter, opened-at} triple of one
/// breaker identity. Breakers never cache these values across calls; they
/// read the storage on every access so that several breakers (possibly in
/// different processes) sharing one storage converge on a single state.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

#include "cbreak/breaker/circuit_state.hpp"

namespace cbreak::storage {

/// Wall-clock time point used for opened-at timestamps (UTC epoch based).
using TimePoint = std::chrono::system_clock::time_point;

/// Abstract canonical-state storage for one breaker.
///
/// No operation reports an error: a backend that can fail must contain
/// the failure itself (fall back on reads, log and drop on writes).
/// Implementations must be thread-safe.
class ICircuitStorage {
public:
    virtual ~ICircuitStorage() = default;

    /// Canonical state; Closed when nothing has been stored yet.
    [[nodiscard]] virtual breaker::CircuitState state() = 0;

    /// Overwrite the canonical state.
    virtual void setState(breaker::CircuitState state) = 0;

    /// Current number of consecutive failures.
    [[nodiscard]] virtual uint32_t counter() = 0;

    /// Atomically add one failure and return the new count.
    virtual uint32_t incrementCounter() = 0;

    /// Set the failure counter to zero.
    virtual void resetCounter() = 0;

    /// Time of the most recent Open entry, if any.
    [[nodiscard]] virtual std::optional<TimePoint> openedAt() = 0;

    /// Record an Open entry. The stored value is only replaced when
    /// @p when is strictly newer, so a late writer never regresses it.
    virtual void setOpenedAt(TimePoint when) = 0;

    /// Backend kind, for logging ("memory", "shared").
    [[nodiscard]] virtual std::string_view name() const = 0;
};

}  // namespace cbreak::storage
