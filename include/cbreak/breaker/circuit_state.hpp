#pragma once

/// @file circuit_state.hpp
/// @brief The three circuit states and their canonical string forms.

#include <cstdint>
#include <optional>
#include <string_view>

namespace cbreak::breaker {

/// Circuit breaker states.
enum class CircuitState : uint8_t {
    Closed,   ///< Normal operation; calls pass through and failures are counted.
    Open,     ///< Failure threshold reached; calls are rejected.
    HalfOpen  ///< Probation; exactly one trial call is allowed.
};

/// Convert a circuit state to its canonical string ("closed", "open", "half-open").
///
/// These strings are what the shared storage backend persists, so they
/// must stay stable across releases.
[[nodiscard]] constexpr std::string_view toString(CircuitState s) {
    switch (s) {
        case CircuitState::Closed:
            return "closed";
        case CircuitState::Open:
            return "open";
        case CircuitState::HalfOpen:
            return "half-open";
    }
    return "unknown";
}

/// Parse a canonical state string. Returns nullopt for anything else.
[[nodiscard]] constexpr std::optional<CircuitState> parseCircuitState(std::string_view text) {
    if (text == "closed") {
        return CircuitState::Closed;
    }
    if (text == "open") {
        return CircuitState::Open;
    }
    if (text == "half-open") {
        return CircuitState::HalfOpen;
    }
    return std::nullopt;
}

}  // namespace cbreak::breaker
