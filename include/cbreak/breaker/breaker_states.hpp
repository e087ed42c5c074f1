#pragma once

/// @file breaker_states.hpp
/// @brief Per-state gating and transition behavior of a circuit breaker.
///
/// State objects are owned by a CircuitBreaker and rebuilt whenever the
/// canonical state in storage changes. They hold no canonical data of
/// their own; everything they decide on is read from the breaker's
/// storage. The one exception is the HalfOpen trial slot, which is local
/// to the breaker instance.

#include <memory>
#include <optional>
#include <string>

#include "cbreak/breaker/circuit_state.hpp"
#include "cbreak/foundation/breaker_error.hpp"

namespace cbreak::breaker {

class CircuitBreaker;

/// Context attached to every CircuitOpen error.
struct CircuitOpenContext {
    std::string breakerName;

    /// State the breaker was in when it refused (or replaced) the call.
    CircuitState state = CircuitState::Open;

    std::string reason;

    /// The operation's own error when a failing call tripped the circuit.
    std::optional<foundation::BreakerError> underlying;
};

/// Base class for the three state objects.
///
/// Every hook runs with the breaker's lock held.
class CircuitBreakerState {
public:
    explicit CircuitBreakerState(CircuitBreaker& breaker) : breaker_(breaker) {}
    virtual ~CircuitBreakerState() = default;

    CircuitBreakerState(const CircuitBreakerState&) = delete;
    CircuitBreakerState& operator=(const CircuitBreakerState&) = delete;

    [[nodiscard]] virtual CircuitState kind() const = 0;

    /// Side effects of entering this state (storage writes).
    virtual void onEntry() {}

    /// Gate a call. Returns the rejection error, or nullopt to admit.
    virtual std::optional<foundation::BreakerError> beforeCall() { return std::nullopt; }

    /// Admitted call succeeded.
    virtual void onSuccess() {}

    /// Admitted call failed with a qualifying error; the counter has
    /// already been incremented to @p failCount. Returns a CircuitOpen
    /// error that replaces the operation's error, or nullopt to pass the
    /// operation's error through.
    virtual std::optional<foundation::BreakerError> onFailure(
        const foundation::BreakerError& /*error*/, uint32_t /*failCount*/) {
        return std::nullopt;
    }

    /// Admitted call ended without a verdict (excluded error, or a
    /// non-standard exception escaping the operation).
    virtual void onNeutral() {}

protected:
    CircuitBreaker& breaker_;
};

/// Normal operation: calls pass, qualifying failures are counted and the
/// failMax-th opens the circuit.
class ClosedState final : public CircuitBreakerState {
public:
    using CircuitBreakerState::CircuitBreakerState;

    [[nodiscard]] CircuitState kind() const override { return CircuitState::Closed; }

    void onEntry() override;
    std::optional<foundation::BreakerError> onFailure(const foundation::BreakerError& error,
                                                      uint32_t failCount) override;
};

/// Tripped: calls fail fast until the reset timeout elapses, then the
/// next call moves the breaker to HalfOpen and becomes the trial.
class OpenState final : public CircuitBreakerState {
public:
    using CircuitBreakerState::CircuitBreakerState;

    [[nodiscard]] CircuitState kind() const override { return CircuitState::Open; }

    void onEntry() override;
    std::optional<foundation::BreakerError> beforeCall() override;
};

/// Probation: exactly one trial call runs; its outcome decides the exit.
class HalfOpenState final : public CircuitBreakerState {
public:
    using CircuitBreakerState::CircuitBreakerState;

    [[nodiscard]] CircuitState kind() const override { return CircuitState::HalfOpen; }

    std::optional<foundation::BreakerError> beforeCall() override;
    void onSuccess() override;
    std::optional<foundation::BreakerError> onFailure(const foundation::BreakerError& error,
                                                      uint32_t failCount) override;
    void onNeutral() override;

    [[nodiscard]] bool trialInFlight() const noexcept { return trialInFlight_; }

private:
    bool trialInFlight_{false};
};

/// Build the state object for @p state. Entry effects are not run.
[[nodiscard]] std::shared_ptr<CircuitBreakerState> makeState(CircuitBreaker& breaker,
                                                             CircuitState state);

}  // namespace cbreak::breaker
