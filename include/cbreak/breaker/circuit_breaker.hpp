#pragma once

/// @file circuit_breaker.hpp
/// @brief Circuit breaker guarding calls to a fallible dependency.
///
/// Implements the circuit breaker pattern (Closed -> Open -> HalfOpen)
/// on top of a pluggable ICircuitStorage. The canonical state lives in
/// the storage; a breaker only caches a state object and reconciles it
/// against storage on every access, so several breakers sharing one
/// storage (in one process or many) converge on the same state.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "cbreak/breaker/breaker_listener.hpp"
#include "cbreak/breaker/breaker_states.hpp"
#include "cbreak/breaker/call_strategy.hpp"
#include "cbreak/breaker/circuit_state.hpp"
#include "cbreak/foundation/breaker_result.hpp"
#include "cbreak/foundation/call_executor.hpp"
#include "cbreak/storage/circuit_storage.hpp"

namespace cbreak::breaker {

using foundation::BreakerError;
using foundation::BreakerResult;
using foundation::ErrorCode;
using foundation::ErrorSubsystem;

/// Error classifications that never count as failures.
///
/// An error is excluded when its code is listed, or when the subsystem of
/// its code is listed. Excluded errors are business outcomes: they are
/// returned to the caller unchanged and reset the failure counter.
struct ExclusionSet {
    std::set<ErrorCode> codes;
    std::set<ErrorSubsystem> subsystems;

    [[nodiscard]] bool matches(const BreakerError& error) const {
        return codes.contains(error.code()) ||
               subsystems.contains(foundation::subsystemOf(error.code()));
    }

    [[nodiscard]] bool empty() const noexcept { return codes.empty() && subsystems.empty(); }
};

/// Configuration for a CircuitBreaker instance.
struct BreakerConfig {
    /// Consecutive qualifying failures that open the circuit.
    uint32_t failMax = 5;

    /// Time the circuit stays open before the next call becomes a trial.
    std::chrono::milliseconds resetTimeout{15000};

    ExclusionSet excluded;

    /// Human-readable name for logging and CircuitOpen context.
    std::string name;

    /// Whether a call rejected by an open circuit also increments the
    /// failure counter. Off by default; a rejected call never changes state.
    bool countRejectedCalls = false;

    /// InvalidArgument unless failMax and resetTimeout are positive.
    [[nodiscard]] BreakerResult<void> validate() const;
};

/// Circuit breaker state machine.
///
/// Usage:
/// @code
///   auto storage = std::make_shared<storage::MemoryCircuitStorage>();
///   CircuitBreaker cb(BreakerConfig{.failMax = 3, .name = "quotes"}, storage);
///
///   auto quote = cb.call([&] { return quoteClient.fetch(symbol); });
///   if (quote.hasError() && quote.error().isCircuitOpen()) {
///       // fail fast; the dependency is considered down
///   }
/// @endcode
///
/// A guarded operation is any callable returning BreakerResult<T>. A
/// std::exception escaping it is converted to an OperationThrew error.
///
/// Thread-safe. A recursive mutex serializes admission, outcome handling,
/// transitions and listener dispatch; the guarded operation itself runs
/// without the lock. An outcome whose call was admitted under a state that
/// has since been replaced is stale: it notifies listeners but leaves
/// storage and state untouched.
class CircuitBreaker {
public:
    using ListenerPtr = std::shared_ptr<IBreakerListener>;

    /// Create a breaker over @p storage (a MemoryCircuitStorage when null).
    /// The cached state is seeded from storage without entry effects, so a
    /// breaker joining a shared storage never rewrites its values.
    /// A non-positive failMax or resetTimeout is logged at Error and
    /// replaced by the BreakerConfig default.
    explicit CircuitBreaker(BreakerConfig config = {},
                            std::shared_ptr<storage::ICircuitStorage> storage = nullptr,
                            std::vector<ListenerPtr> listeners = {});

    ~CircuitBreaker();

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // ── Calls ────────────────────────────────────────────────────────────

    /// Run @p op through the breaker on the calling thread.
    /// @return The operation's result, or a CircuitOpen error.
    template <typename Op>
    OperationResult<Op> call(Op&& op) {
        return BlockingCall::run(*this, std::forward<Op>(op));
    }

    /// Run @p op through the breaker on a worker of @p executor.
    /// Same semantics as call(); the caller never blocks.
    template <typename Op>
    std::future<OperationResult<Op>> callAsync(foundation::CallExecutor& executor, Op&& op) {
        return AsyncCall::run(*this, executor, std::forward<Op>(op));
    }

    /// The engine shared by both calling conventions.
    template <typename Op>
    OperationResult<Op> execute(Op& op);

    // ── Transitions ──────────────────────────────────────────────────────

    /// Open the circuit and record opened-at = now.
    void open();

    /// Move to HalfOpen; the next call becomes the trial.
    void halfOpen();

    /// Close the circuit and reset the failure counter.
    void close();

    /// Compare the cached state with storage and rebuild it on mismatch.
    /// @return The canonical state.
    CircuitState reconcile();

    // ── Queries ──────────────────────────────────────────────────────────

    /// Canonical state (reconciles first).
    [[nodiscard]] CircuitState currentState();

    /// Current failure counter as stored.
    [[nodiscard]] uint32_t failCounter();

    /// Calls short-circuited by this instance.
    [[nodiscard]] uint64_t rejectedCount() const;

    [[nodiscard]] uint32_t failMax() const;
    /// InvalidArgument for 0; the current value is kept.
    BreakerResult<void> setFailMax(uint32_t failMax);

    [[nodiscard]] std::chrono::milliseconds resetTimeout() const;
    /// InvalidArgument unless positive; the current value is kept.
    BreakerResult<void> setResetTimeout(std::chrono::milliseconds timeout);

    [[nodiscard]] bool countRejectedCalls() const;
    void setCountRejectedCalls(bool enabled);

    [[nodiscard]] ExclusionSet excluded() const;
    void addExcludedCode(ErrorCode code);
    void removeExcludedCode(ErrorCode code);
    void addExcludedSubsystem(ErrorSubsystem subsystem);
    void removeExcludedSubsystem(ErrorSubsystem subsystem);

    /// True if @p error would not count as a failure.
    [[nodiscard]] bool isExcluded(const BreakerError& error) const;

    [[nodiscard]] std::vector<ListenerPtr> listeners() const;
    void addListener(ListenerPtr listener);
    void removeListener(const ListenerPtr& listener);

    [[nodiscard]] std::string name() const;
    void setName(std::string name);

    [[nodiscard]] const std::shared_ptr<storage::ICircuitStorage>& storage() const noexcept {
        return storage_;
    }

private:
    friend class ClosedState;
    friend class OpenState;
    friend class HalfOpenState;

    /// Admission ticket handed from admit() to the outcome handlers.
    struct CallTicket {
        uint64_t generation = 0;
        std::optional<BreakerError> rejection;
    };

    CallTicket admit();
    void recordSuccess(const CallTicket& ticket);
    std::optional<BreakerError> recordFailure(const CallTicket& ticket, const BreakerError& error);
    void abandon(const CallTicket& ticket);

    template <typename R, typename Op>
    static R invokeGuarded(Op& op);

    void transitionTo(CircuitState newState);
    void reconcileLocked();
    void enterState(CircuitState oldState, CircuitState newState);

    [[nodiscard]] BreakerError makeCircuitOpenError(
        std::string reason, std::optional<BreakerError> underlying) const;

    BreakerConfig config_;
    std::shared_ptr<storage::ICircuitStorage> storage_;
    std::vector<ListenerPtr> listeners_;

    mutable std::recursive_mutex mutex_;
    std::shared_ptr<CircuitBreakerState> state_;
    uint64_t generation_{0};
    std::atomic<uint64_t> rejected_{0};
};

// ---------------------------------------------------------------------------
// Template implementation
// ---------------------------------------------------------------------------

template <typename R, typename Op>
R CircuitBreaker::invokeGuarded(Op& op) {
    try {
        return op();
    } catch (const std::exception& e) {
        return R::err(BreakerError(ErrorCode::OperationThrew, e.what()));
    }
}

template <typename Op>
OperationResult<Op> CircuitBreaker::execute(Op& op) {
    using R = OperationResult<Op>;
    static_assert(kIsResult<R>, "guarded operation must return BreakerResult<T>");
    static_assert(std::is_same_v<typename R::error_type, BreakerError>,
                  "guarded operation must return BreakerResult<T>");

    auto ticket = admit();
    if (ticket.rejection) {
        return R::err(std::move(*ticket.rejection));
    }

    std::optional<R> result;
    try {
        result.emplace(invokeGuarded<R>(op));
    } catch (...) {
        // Not a std::exception: free the trial slot, then let it propagate.
        abandon(ticket);
        throw;
    }

    if (result->hasValue()) {
        recordSuccess(ticket);
        return std::move(*result);
    }
    if (auto replaced = recordFailure(ticket, result->error())) {
        return R::err(std::move(*replaced));
    }
    return std::move(*result);
}

}  // namespace cbreak::breaker
