#pragma once

/// @file breaker_listener.hpp
/// @brief Observer hooks invoked synchronously by a CircuitBreaker.

#include "cbreak/breaker/circuit_state.hpp"
#include "cbreak/foundation/breaker_error.hpp"

namespace cbreak::breaker {

class CircuitBreaker;

/// Listener notified of breaker activity.
///
/// Every hook has an empty default, so a listener overrides only what it
/// needs. Hooks run on the calling thread while the breaker's lock is
/// held; they may query the breaker but should return quickly.
///
/// Per admitted call: beforeCall, then exactly one of onSuccess or
/// onFailure. Calls rejected by an open circuit notify nothing.
/// onStateChange fires once per transition, after the new state is in
/// effect. Listeners are invoked in registration order.
class IBreakerListener {
public:
    virtual ~IBreakerListener() = default;

    /// An admitted call is about to run the guarded operation.
    virtual void beforeCall(CircuitBreaker& /*breaker*/) {}

    /// The guarded operation succeeded (or failed with an excluded error).
    virtual void onSuccess(CircuitBreaker& /*breaker*/) {}

    /// The guarded operation failed with a qualifying error.
    virtual void onFailure(CircuitBreaker& /*breaker*/,
                           const foundation::BreakerError& /*error*/) {}

    /// The breaker moved from @p oldState to @p newState.
    virtual void onStateChange(CircuitBreaker& /*breaker*/,
                               CircuitState /*oldState*/,
                               CircuitState /*newState*/) {}
};

/// Listener that reports transitions and failures through BreakerLogger.
///
/// Transitions are logged at Info, except a transition to Open, which is
/// logged at Warning. Individual failures are logged at Debug.
class LoggingListener : public IBreakerListener {
public:
    void onFailure(CircuitBreaker& breaker, const foundation::BreakerError& error) override;
    void onStateChange(CircuitBreaker& breaker, CircuitState oldState,
                       CircuitState newState) override;
};

}  // namespace cbreak::breaker
