#pragma once

/// @file breaker_registry.hpp
/// @brief Per-dependency circuit breakers with an explicit lifecycle.

#include <exception>
#include <future>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cbreak/breaker/circuit_breaker.hpp"
#include "cbreak/foundation/breaker_logger.hpp"
#include "cbreak/service/breaker_settings.hpp"
#include "cbreak/storage/key_value_client.hpp"

namespace cbreak::service {

/// Per-call options for BreakerRegistry::call().
struct CallOptions {
    /// Run the operation directly, without consulting or updating a breaker.
    bool skipBreaker = false;
};

/// Registry of circuit breakers keyed by dependency name.
///
/// Breakers are created lazily on first use, one per dependency, each
/// with its own storage namespace "{environment}:{dependency}". With a
/// shared key-value client every process using the same settings sees
/// the same breaker state for a dependency.
///
/// Lifecycle: reconfigure() drops every breaker so the next call builds
/// fresh ones from the new settings; shutdown() drops them for good and
/// makes later calls fail with ServiceUnavailable.
///
/// Thread-safe. Lookups take a shared lock; creation takes a unique lock.
class BreakerRegistry {
public:
    using BreakerPtr = std::shared_ptr<breaker::CircuitBreaker>;
    using ListenerPtr = breaker::CircuitBreaker::ListenerPtr;

    /// @param client Key-value client for the Shared and Redis backends.
    ///               Ignored for the Memory backend; without one the other
    ///               backends make get() fail with InvalidArgument.
    explicit BreakerRegistry(BreakerSettings settings,
                             std::shared_ptr<storage::IKeyValueClient> client = nullptr);

    ~BreakerRegistry();

    BreakerRegistry(const BreakerRegistry&) = delete;
    BreakerRegistry& operator=(const BreakerRegistry&) = delete;

    /// Build a registry for @p settings, connecting to Redis when the
    /// backend is StorageBackend::Redis.
    /// @return ConnectionFailed if Redis is unreachable, InvalidArgument for
    ///         the Shared backend (which needs a caller-supplied client).
    static BreakerResult<std::unique_ptr<BreakerRegistry>> create(BreakerSettings settings);

    /// Breaker for @p dependency, created on first access.
    /// @return ServiceUnavailable after shutdown(), InvalidArgument when a
    ///         non-memory backend has no key-value client.
    BreakerResult<BreakerPtr> get(std::string_view dependency);

    /// Run @p op guarded by the breaker of @p dependency.
    template <typename Op>
    breaker::OperationResult<Op> call(std::string_view dependency, Op&& op,
                                      CallOptions options = {});

    /// Asynchronous counterpart of call().
    template <typename Op>
    std::future<breaker::OperationResult<Op>> callAsync(std::string_view dependency,
                                                        foundation::CallExecutor& executor,
                                                        Op&& op, CallOptions options = {});

    /// Storage namespace for @p dependency: "{environment}:{dependency}".
    [[nodiscard]] std::string namespaceFor(std::string_view dependency) const;

    /// Replace the settings and drop every breaker.
    void reconfigure(BreakerSettings settings);

    /// Attach @p listener to every existing and future breaker.
    void addListener(ListenerPtr listener);

    /// Drop every breaker and refuse further calls. Idempotent.
    void shutdown();

    [[nodiscard]] bool isShutdown() const;

    /// Number of live breakers.
    [[nodiscard]] std::size_t size() const;

    /// Dependencies with a live breaker, sorted.
    [[nodiscard]] std::vector<std::string> dependencies() const;

    [[nodiscard]] BreakerSettings settings() const;

private:
    BreakerPtr createBreaker(const std::string& dependency) const;
    std::string namespaceForLocked(std::string_view dependency) const;
    void logCircuitOpen(std::string_view dependency, const foundation::BreakerError& error) const;

    mutable std::shared_mutex mutex_;
    BreakerSettings settings_;
    std::shared_ptr<storage::IKeyValueClient> client_;
    std::vector<ListenerPtr> listeners_;
    std::unordered_map<std::string, BreakerPtr> breakers_;
    bool shutdown_{false};
    bool ownsClient_{false};
};

// ---------------------------------------------------------------------------
// Template implementation
// ---------------------------------------------------------------------------

template <typename Op>
breaker::OperationResult<Op> BreakerRegistry::call(std::string_view dependency, Op&& op,
                                                   CallOptions options) {
    using R = breaker::OperationResult<Op>;
    if (options.skipBreaker) {
        return op();
    }
    auto breaker = get(dependency);
    if (breaker.hasError()) {
        return R::err(std::move(breaker).error());
    }
    auto result = breaker.value()->call(std::forward<Op>(op));
    if (result.hasError() && result.error().isCircuitOpen()) {
        logCircuitOpen(dependency, result.error());
    }
    return result;
}

template <typename Op>
std::future<breaker::OperationResult<Op>> BreakerRegistry::callAsync(
    std::string_view dependency, foundation::CallExecutor& executor, Op&& op,
    CallOptions options) {
    using R = breaker::OperationResult<Op>;
    if (options.skipBreaker) {
        auto promise = std::make_shared<std::promise<R>>();
        auto future = promise->get_future();
        auto posted = executor.post([promise, fn = std::forward<Op>(op)]() mutable {
            try {
                promise->set_value(fn());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
        if (posted.hasError()) {
            promise->set_value(R::err(std::move(posted).error()));
        }
        return future;
    }

    auto breaker = get(dependency);
    if (breaker.hasError()) {
        std::promise<R> failed;
        failed.set_value(R::err(std::move(breaker).error()));
        return failed.get_future();
    }
    // The returned future keeps no reference to the registry; the breaker
    // itself is kept alive by the job.
    auto guarded = breaker.value();
    return breaker::AsyncCall::run(
        *guarded, executor,
        [guarded, fn = std::forward<Op>(op)]() mutable { return fn(); });
}

}  // namespace cbreak::service
