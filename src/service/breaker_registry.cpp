/// @file breaker_registry.cpp
/// @brief BreakerRegistry lazy creation and lifecycle.

#include "cbreak/service/breaker_registry.hpp"

#include "cbreak/storage/memory_storage.hpp"
#include "cbreak/storage/redis_client.hpp"
#include "cbreak/storage/shared_storage.hpp"

#include <algorithm>
#include <mutex>

namespace cbreak::service {

using foundation::BreakerError;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

BreakerRegistry::BreakerRegistry(BreakerSettings settings,
                                 std::shared_ptr<storage::IKeyValueClient> client)
    : settings_(std::move(settings)), client_(std::move(client)) {}

BreakerRegistry::~BreakerRegistry() {
    shutdown();
}

BreakerResult<std::unique_ptr<BreakerRegistry>> BreakerRegistry::create(
    BreakerSettings settings) {
    using R = BreakerResult<std::unique_ptr<BreakerRegistry>>;

    switch (settings.backend) {
        case StorageBackend::Memory:
            return R::ok(std::make_unique<BreakerRegistry>(std::move(settings)));

        case StorageBackend::Shared:
            return R::err(BreakerError(ErrorCode::InvalidArgument,
                                       "shared backend needs a key-value client"));

        case StorageBackend::Redis: {
            auto client = storage::RedisKeyValueClient::connect(settings.redis);
            if (client.hasError()) {
                return R::err(std::move(client).error());
            }
            auto registry = std::make_unique<BreakerRegistry>(std::move(settings),
                                                              std::move(client).value());
            registry->ownsClient_ = true;
            return R::ok(std::move(registry));
        }
    }
    return R::err(BreakerError(ErrorCode::InvalidArgument, "unknown storage backend"));
}

// ---------------------------------------------------------------------------
// get()
// ---------------------------------------------------------------------------
BreakerResult<BreakerRegistry::BreakerPtr> BreakerRegistry::get(std::string_view dependency) {
    using R = BreakerResult<BreakerPtr>;
    auto key = std::string(dependency);

    // Fast path: existing breaker.
    {
        std::shared_lock lock(mutex_);
        if (shutdown_) {
            return R::err(BreakerError(ErrorCode::ServiceUnavailable,
                                       "breaker registry is shut down"));
        }
        auto it = breakers_.find(key);
        if (it != breakers_.end()) {
            return R::ok(it->second);
        }
    }

    std::unique_lock lock(mutex_);
    if (shutdown_) {
        return R::err(BreakerError(ErrorCode::ServiceUnavailable,
                                   "breaker registry is shut down"));
    }
    auto it = breakers_.find(key);
    if (it == breakers_.end()) {
        if (settings_.backend != StorageBackend::Memory && !client_) {
            LogContext ctx;
            ctx.breakerName = key;
            ctx.keyNamespace = namespaceForLocked(key);
            CBREAK_LOG_CTX(LogLevel::Error, LogCategory::Registry,
                           "shared storage backend configured without a key-value client", ctx);
            return R::err(BreakerError(ErrorCode::InvalidArgument,
                                       "storage backend " +
                                           std::string(storageBackendName(settings_.backend)) +
                                           " needs a key-value client"));
        }
        it = breakers_.emplace(key, createBreaker(key)).first;
    }
    return R::ok(it->second);
}

BreakerRegistry::BreakerPtr BreakerRegistry::createBreaker(const std::string& dependency) const {
    auto ns = namespaceForLocked(dependency);

    std::shared_ptr<storage::ICircuitStorage> circuitStorage;
    if (settings_.backend == StorageBackend::Memory) {
        circuitStorage = std::make_shared<storage::MemoryCircuitStorage>();
    } else {
        auto shared = std::make_shared<storage::SharedCircuitStorage>(
            client_, storage::SharedStorageOptions{
                         .baseNamespace = settings_.baseNamespace,
                         .instanceNamespace = ns,
                         .fallbackState = settings_.fallbackState,
                     });
        shared->initialize();
        circuitStorage = std::move(shared);
    }

    LogContext ctx;
    ctx.breakerName = dependency;
    ctx.keyNamespace = ns;
    ctx.extra["storage"] = std::string(circuitStorage->name());
    CBREAK_LOG_CTX(LogLevel::Info, LogCategory::Registry, "circuit breaker created", ctx);

    return std::make_shared<breaker::CircuitBreaker>(settings_.toBreakerConfig(dependency),
                                                     std::move(circuitStorage), listeners_);
}

std::string BreakerRegistry::namespaceFor(std::string_view dependency) const {
    std::shared_lock lock(mutex_);
    return namespaceForLocked(dependency);
}

std::string BreakerRegistry::namespaceForLocked(std::string_view dependency) const {
    return settings_.environment + ":" + std::string(dependency);
}

void BreakerRegistry::logCircuitOpen(std::string_view dependency,
                                     const BreakerError& error) const {
    LogContext ctx;
    ctx.breakerName = std::string(dependency);
    ctx.keyNamespace = namespaceFor(dependency);
    CBREAK_LOG_CTX(LogLevel::Error, LogCategory::Registry, error.message(), ctx);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
void BreakerRegistry::reconfigure(BreakerSettings settings) {
    std::unique_lock lock(mutex_);
    settings_ = std::move(settings);
    auto dropped = breakers_.size();
    breakers_.clear();
    lock.unlock();

    CBREAK_LOG_INFO(LogCategory::Registry,
                    "registry reconfigured, dropped " + std::to_string(dropped) + " breakers");
}

void BreakerRegistry::addListener(ListenerPtr listener) {
    if (!listener) {
        return;
    }
    std::unique_lock lock(mutex_);
    listeners_.push_back(listener);
    for (auto& [name, breaker] : breakers_) {
        breaker->addListener(listener);
    }
}

void BreakerRegistry::shutdown() {
    std::shared_ptr<storage::IKeyValueClient> client;
    {
        std::unique_lock lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        breakers_.clear();
        listeners_.clear();
        client = std::move(client_);
    }
    // A client handed in by the caller stays open for its other users.
    if (ownsClient_) {
        if (auto redis = std::dynamic_pointer_cast<storage::RedisKeyValueClient>(client)) {
            redis->close();
        }
    }
    CBREAK_LOG_INFO(LogCategory::Registry, "breaker registry shut down");
}

bool BreakerRegistry::isShutdown() const {
    std::shared_lock lock(mutex_);
    return shutdown_;
}

std::size_t BreakerRegistry::size() const {
    std::shared_lock lock(mutex_);
    return breakers_.size();
}

std::vector<std::string> BreakerRegistry::dependencies() const {
    std::vector<std::string> names;
    {
        std::shared_lock lock(mutex_);
        names.reserve(breakers_.size());
        for (const auto& [name, breaker] : breakers_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

BreakerSettings BreakerRegistry::settings() const {
    std::shared_lock lock(mutex_);
    return settings_;
}

}  // namespace cbreak::service
