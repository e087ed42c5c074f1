/// @file circuit_breaker.cpp
/// @brief CircuitBreaker engine, transitions and reconciliation.

#include "cbreak/breaker/circuit_breaker.hpp"

#include "cbreak/foundation/breaker_logger.hpp"
#include "cbreak/storage/memory_storage.hpp"

#include <algorithm>
#include <string>

namespace cbreak::breaker {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

BreakerResult<void> BreakerConfig::validate() const {
    if (failMax == 0) {
        return BreakerResult<void>::err(
            BreakerError(ErrorCode::InvalidArgument, "failMax must be positive"));
    }
    if (resetTimeout.count() <= 0) {
        return BreakerResult<void>::err(
            BreakerError(ErrorCode::InvalidArgument, "resetTimeout must be positive"));
    }
    return BreakerResult<void>::ok();
}

namespace {

BreakerConfig sanitized(BreakerConfig config) {
    auto valid = config.validate();
    if (valid.hasValue()) {
        return config;
    }
    LogContext ctx;
    ctx.breakerName = config.name;
    ctx.extra["fail_max"] = std::to_string(config.failMax);
    ctx.extra["reset_timeout_ms"] = std::to_string(config.resetTimeout.count());
    CBREAK_LOG_CTX(LogLevel::Error, LogCategory::Breaker,
                   std::string(valid.error().message()) + ", using default", ctx);

    const BreakerConfig defaults;
    if (config.failMax == 0) {
        config.failMax = defaults.failMax;
    }
    if (config.resetTimeout.count() <= 0) {
        config.resetTimeout = defaults.resetTimeout;
    }
    return config;
}

}  // namespace

CircuitBreaker::CircuitBreaker(BreakerConfig config,
                               std::shared_ptr<storage::ICircuitStorage> storage,
                               std::vector<ListenerPtr> listeners)
    : config_(sanitized(std::move(config))),
      storage_(storage ? std::move(storage)
                       : std::make_shared<storage::MemoryCircuitStorage>()),
      listeners_(std::move(listeners)) {
    std::erase(listeners_, nullptr);
    state_ = makeState(*this, storage_->state());
}

CircuitBreaker::~CircuitBreaker() = default;

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------
CircuitBreaker::CallTicket CircuitBreaker::admit() {
    std::lock_guard lock(mutex_);
    reconcileLocked();

    auto state = state_;
    auto rejection = state->beforeCall();
    if (rejection) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        if (config_.countRejectedCalls) {
            storage_->incrementCounter();
        }
        return CallTicket{generation_, std::move(rejection)};
    }

    auto listeners = listeners_;
    for (const auto& listener : listeners) {
        listener->beforeCall(*this);
    }
    return CallTicket{generation_, std::nullopt};
}

void CircuitBreaker::recordSuccess(const CallTicket& ticket) {
    std::lock_guard lock(mutex_);
    reconcileLocked();

    if (ticket.generation == generation_) {
        storage_->resetCounter();
        auto state = state_;
        state->onSuccess();
    }

    auto listeners = listeners_;
    for (const auto& listener : listeners) {
        listener->onSuccess(*this);
    }
}

std::optional<BreakerError> CircuitBreaker::recordFailure(const CallTicket& ticket,
                                                          const BreakerError& error) {
    std::lock_guard lock(mutex_);
    reconcileLocked();

    const bool excluded = config_.excluded.matches(error);
    const bool stale = ticket.generation != generation_;
    auto listeners = listeners_;

    if (excluded) {
        if (!stale) {
            storage_->resetCounter();
            auto state = state_;
            state->onNeutral();
        }
        for (const auto& listener : listeners) {
            listener->onSuccess(*this);
        }
        return std::nullopt;
    }

    if (stale) {
        for (const auto& listener : listeners) {
            listener->onFailure(*this, error);
        }
        return std::nullopt;
    }

    // Only Closed accumulates failures; a failed HalfOpen trial reopens
    // without touching the counter.
    auto state = state_;
    uint32_t failCount = 0;
    if (state->kind() == CircuitState::Closed) {
        failCount = storage_->incrementCounter();
    }
    for (const auto& listener : listeners) {
        listener->onFailure(*this, error);
    }
    return state->onFailure(error, failCount);
}

void CircuitBreaker::abandon(const CallTicket& ticket) {
    std::lock_guard lock(mutex_);
    if (ticket.generation == generation_) {
        auto state = state_;
        state->onNeutral();
    }
}

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------
void CircuitBreaker::open() {
    transitionTo(CircuitState::Open);
}

void CircuitBreaker::halfOpen() {
    transitionTo(CircuitState::HalfOpen);
}

void CircuitBreaker::close() {
    transitionTo(CircuitState::Closed);
}

void CircuitBreaker::transitionTo(CircuitState newState) {
    std::lock_guard lock(mutex_);
    auto oldState = state_->kind();
    storage_->setState(newState);
    enterState(oldState, newState);
}

CircuitState CircuitBreaker::reconcile() {
    std::lock_guard lock(mutex_);
    reconcileLocked();
    return state_->kind();
}

void CircuitBreaker::reconcileLocked() {
    auto canonical = storage_->state();
    auto cached = state_->kind();
    if (canonical != cached) {
        LogContext ctx;
        ctx.breakerName = config_.name;
        ctx.state = std::string(toString(canonical));
        ctx.extra["cached"] = std::string(toString(cached));
        CBREAK_LOG_CTX(LogLevel::Debug, LogCategory::Breaker,
                       "cached state differs from storage, rebuilding", ctx);
        enterState(cached, canonical);
    }
}

void CircuitBreaker::enterState(CircuitState oldState, CircuitState newState) {
    state_ = makeState(*this, newState);
    ++generation_;
    auto state = state_;
    state->onEntry();

    // Re-entering the same state refreshes its entry effects only.
    if (oldState == newState) {
        return;
    }
    auto listeners = listeners_;
    for (const auto& listener : listeners) {
        listener->onStateChange(*this, oldState, newState);
    }
}

BreakerError CircuitBreaker::makeCircuitOpenError(std::string reason,
                                                  std::optional<BreakerError> underlying) const {
    std::lock_guard lock(mutex_);
    CircuitOpenContext ctx{
        .breakerName = config_.name,
        .state = state_->kind(),
        .reason = reason,
        .underlying = std::move(underlying),
    };
    return BreakerError(ErrorCode::CircuitOpen, std::move(reason), std::move(ctx));
}

// ---------------------------------------------------------------------------
// Queries and configuration
// ---------------------------------------------------------------------------
CircuitState CircuitBreaker::currentState() {
    return reconcile();
}

uint32_t CircuitBreaker::failCounter() {
    return storage_->counter();
}

uint64_t CircuitBreaker::rejectedCount() const {
    return rejected_.load(std::memory_order_relaxed);
}

uint32_t CircuitBreaker::failMax() const {
    std::lock_guard lock(mutex_);
    return config_.failMax;
}

BreakerResult<void> CircuitBreaker::setFailMax(uint32_t failMax) {
    if (failMax == 0) {
        return BreakerResult<void>::err(
            BreakerError(ErrorCode::InvalidArgument, "failMax must be positive"));
    }
    std::lock_guard lock(mutex_);
    config_.failMax = failMax;
    return BreakerResult<void>::ok();
}

std::chrono::milliseconds CircuitBreaker::resetTimeout() const {
    std::lock_guard lock(mutex_);
    return config_.resetTimeout;
}

BreakerResult<void> CircuitBreaker::setResetTimeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return BreakerResult<void>::err(
            BreakerError(ErrorCode::InvalidArgument, "resetTimeout must be positive"));
    }
    std::lock_guard lock(mutex_);
    config_.resetTimeout = timeout;
    return BreakerResult<void>::ok();
}

bool CircuitBreaker::countRejectedCalls() const {
    std::lock_guard lock(mutex_);
    return config_.countRejectedCalls;
}

void CircuitBreaker::setCountRejectedCalls(bool enabled) {
    std::lock_guard lock(mutex_);
    config_.countRejectedCalls = enabled;
}

ExclusionSet CircuitBreaker::excluded() const {
    std::lock_guard lock(mutex_);
    return config_.excluded;
}

void CircuitBreaker::addExcludedCode(ErrorCode code) {
    std::lock_guard lock(mutex_);
    config_.excluded.codes.insert(code);
}

void CircuitBreaker::removeExcludedCode(ErrorCode code) {
    std::lock_guard lock(mutex_);
    config_.excluded.codes.erase(code);
}

void CircuitBreaker::addExcludedSubsystem(ErrorSubsystem subsystem) {
    std::lock_guard lock(mutex_);
    config_.excluded.subsystems.insert(subsystem);
}

void CircuitBreaker::removeExcludedSubsystem(ErrorSubsystem subsystem) {
    std::lock_guard lock(mutex_);
    config_.excluded.subsystems.erase(subsystem);
}

bool CircuitBreaker::isExcluded(const BreakerError& error) const {
    std::lock_guard lock(mutex_);
    return config_.excluded.matches(error);
}

std::vector<CircuitBreaker::ListenerPtr> CircuitBreaker::listeners() const {
    std::lock_guard lock(mutex_);
    return listeners_;
}

void CircuitBreaker::addListener(ListenerPtr listener) {
    if (!listener) {
        return;
    }
    std::lock_guard lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void CircuitBreaker::removeListener(const ListenerPtr& listener) {
    std::lock_guard lock(mutex_);
    std::erase(listeners_, listener);
}

std::string CircuitBreaker::name() const {
    std::lock_guard lock(mutex_);
    return config_.name;
}

void CircuitBreaker::setName(std::string name) {
    std::lock_guard lock(mutex_);
    config_.name = std::move(name);
}

}  // namespace cbreak::breaker
