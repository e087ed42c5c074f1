/// @file breaker_states.cpp
/// @brief Closed / Open / HalfOpen state behavior.

#include "cbreak/breaker/breaker_states.hpp"

#include "cbreak/breaker/circuit_breaker.hpp"

#include <chrono>

namespace cbreak::breaker {

// ---------------------------------------------------------------------------
// ClosedState
// ---------------------------------------------------------------------------
void ClosedState::onEntry() {
    breaker_.storage()->resetCounter();
}

std::optional<BreakerError> ClosedState::onFailure(const BreakerError& error,
                                                   uint32_t failCount) {
    if (failCount < breaker_.failMax()) {
        return std::nullopt;
    }
    // open() replaces this object; only locals are touched afterwards.
    CircuitBreaker& breaker = breaker_;
    breaker.open();
    return breaker.makeCircuitOpenError(
        "Failures threshold reached, circuit breaker opened", error);
}

// ---------------------------------------------------------------------------
// OpenState
// ---------------------------------------------------------------------------
void OpenState::onEntry() {
    breaker_.storage()->setOpenedAt(std::chrono::system_clock::now());
}

std::optional<BreakerError> OpenState::beforeCall() {
    auto openedAt = breaker_.storage()->openedAt();
    if (openedAt && std::chrono::system_clock::now() < *openedAt + breaker_.resetTimeout()) {
        return breaker_.makeCircuitOpenError(
            "Timeout not elapsed yet, circuit breaker still open", std::nullopt);
    }

    // The triggering call becomes the HalfOpen trial.
    CircuitBreaker& breaker = breaker_;
    breaker.halfOpen();
    auto next = breaker.state_;
    return next->beforeCall();
}

// ---------------------------------------------------------------------------
// HalfOpenState
// ---------------------------------------------------------------------------
std::optional<BreakerError> HalfOpenState::beforeCall() {
    if (trialInFlight_) {
        return breaker_.makeCircuitOpenError(
            "Trial call in progress, circuit breaker half-open", std::nullopt);
    }
    trialInFlight_ = true;
    return std::nullopt;
}

void HalfOpenState::onSuccess() {
    trialInFlight_ = false;
    breaker_.close();
}

std::optional<BreakerError> HalfOpenState::onFailure(const BreakerError& error,
                                                     uint32_t /*failCount*/) {
    trialInFlight_ = false;
    CircuitBreaker& breaker = breaker_;
    breaker.open();
    return breaker.makeCircuitOpenError("Trial call failed, circuit breaker opened", error);
}

void HalfOpenState::onNeutral() {
    trialInFlight_ = false;
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------
std::shared_ptr<CircuitBreakerState> makeState(CircuitBreaker& breaker, CircuitState state) {
    switch (state) {
        case CircuitState::Closed:
            return std::make_shared<ClosedState>(breaker);
        case CircuitState::Open:
            return std::make_shared<OpenState>(breaker);
        case CircuitState::HalfOpen:
            return std::make_shared<HalfOpenState>(breaker);
    }
    return std::make_shared<ClosedState>(breaker);
}

}  // namespace cbreak::breaker
