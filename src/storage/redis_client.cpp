/// @file redis_client.cpp
/// @brief RedisKeyValueClient over boost::redis::connection.

#include "cbreak/storage/redis_client.hpp"

#include "cbreak/foundation/breaker_logger.hpp"

#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/redis.hpp>
#include <boost/redis/src.hpp>

#include <atomic>
#include <future>
#include <optional>
#include <thread>

namespace cbreak::storage {

namespace asio = boost::asio;
namespace redis = boost::redis;

using foundation::BreakerError;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

// Replaces opened_at only when the new epoch value is strictly greater.
constexpr std::string_view kSetIfGreaterScript =
    "local cur = redis.call('GET', KEYS[1]) "
    "if (not cur) or tonumber(ARGV[1]) > tonumber(cur) then "
    "redis.call('SET', KEYS[1], ARGV[1]) return 1 end "
    "return 0";

/// Commands fail fast while disconnected; only the first PING in connect() waits.
redis::request makeRequest(bool waitForConnection = false) {
    redis::request req;
    req.get_config().cancel_if_not_connected = !waitForConnection;
    return req;
}

std::string endpoint(const RedisOptions& options) {
    return options.host + ":" + std::to_string(options.port);
}

}  // namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct RedisKeyValueClient::Impl {
    RedisOptions options;

    // Declared before the connection so the connection is destroyed first.
    asio::io_context ioc;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work;
    std::unique_ptr<redis::connection> conn;
    std::thread worker;

    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};

    explicit Impl(RedisOptions opts) : options(std::move(opts)) {}

    ~Impl() { shutdown(); }

    void start() {
        conn = std::make_unique<redis::connection>(
            ioc.get_executor(), redis::logger{redis::logger::level::disabled});

        redis::config cfg;
        cfg.addr.host = options.host;
        cfg.addr.port = std::to_string(options.port);
        cfg.clientname = options.clientId;
        cfg.database_index = static_cast<int>(options.database);
        cfg.resolve_timeout = options.connectTimeout;
        cfg.connect_timeout = options.connectTimeout;
        cfg.reconnect_wait_interval = options.reconnectWait;

        work.emplace(ioc.get_executor());
        asio::post(ioc, [this, cfg] { conn->async_run(cfg, asio::detached); });
        worker = std::thread([this] { ioc.run(); });
    }

    void shutdown() {
        if (closed.exchange(true)) {
            return;
        }
        connected.store(false, std::memory_order_release);
        if (!worker.joinable()) {
            return;
        }
        // Handlers queued by cancel() never run once stop() is processed;
        // their waiters see a broken promise and report ConnectionLost.
        asio::post(ioc, [this] { conn->cancel(); });
        asio::post(ioc, [this] { ioc.stop(); });
        work.reset();
        worker.join();
    }

    /// Post @p req to the I/O thread and wait for its single reply.
    template <typename T>
    BreakerResult<T> exec(redis::request req, std::string_view command,
                          std::chrono::milliseconds timeout) {
        using R = BreakerResult<T>;
        if (closed.load(std::memory_order_acquire)) {
            return R::err(BreakerError(ErrorCode::StorageUnavailable, "redis client closed"));
        }

        struct Call {
            redis::request req;
            redis::response<T> resp;
            std::promise<boost::system::error_code> done;
        };
        auto call = std::make_shared<Call>();
        call->req = std::move(req);
        auto future = call->done.get_future();

        asio::post(ioc, [this, call] {
            conn->async_exec(call->req, call->resp,
                             [call](boost::system::error_code ec, std::size_t) {
                                 call->done.set_value(ec);
                             });
        });

        if (future.wait_for(timeout) != std::future_status::ready) {
            return R::err(BreakerError(ErrorCode::StorageTimeout,
                                       "redis command timed out: " + std::string(command)));
        }

        boost::system::error_code ec;
        try {
            ec = future.get();
        } catch (const std::future_error&) {
            return R::err(BreakerError(ErrorCode::ConnectionLost,
                                       "redis client closed during " + std::string(command)));
        }

        auto& slot = std::get<0>(call->resp);
        if (slot.has_error()) {
            return R::err(BreakerError(ErrorCode::StorageCommandFailed,
                                       std::string(command) + ": " + slot.error().diagnostic));
        }
        if (ec == redis::error::not_connected) {
            return R::err(BreakerError(ErrorCode::StorageUnavailable,
                                       "redis not connected: " + endpoint(options)));
        }
        if (ec == asio::error::operation_aborted) {
            return R::err(BreakerError(ErrorCode::ConnectionLost,
                                       "redis connection lost during " + std::string(command)));
        }
        if (ec) {
            return R::err(BreakerError(ErrorCode::StorageError,
                                       std::string(command) + ": " + ec.message()));
        }
        return R::ok(std::move(slot).value());
    }

    template <typename T>
    BreakerResult<T> exec(redis::request req, std::string_view command) {
        return exec<T>(std::move(req), command, options.commandTimeout);
    }
};

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------
RedisKeyValueClient::RedisKeyValueClient(RedisOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

RedisKeyValueClient::~RedisKeyValueClient() {
    close();
}

BreakerResult<std::shared_ptr<RedisKeyValueClient>> RedisKeyValueClient::connect(
    RedisOptions options) {
    using Created = BreakerResult<std::shared_ptr<RedisKeyValueClient>>;

    std::shared_ptr<RedisKeyValueClient> self(new RedisKeyValueClient(std::move(options)));
    auto& impl = *self->impl_;
    impl.start();

    // The first PING waits for the handshake (HELLO, SELECT) to finish.
    auto first = makeRequest(true);
    first.push("PING");
    auto pong = impl.exec<std::string>(std::move(first), "PING", impl.options.connectTimeout);
    if (pong.hasError()) {
        self->close();
        return Created::err(BreakerError(
            ErrorCode::ConnectionFailed,
            "redis connect failed: " + endpoint(impl.options) + " (" +
                std::string(pong.error().message()) + ")"));
    }
    impl.connected.store(true, std::memory_order_release);

    LogContext ctx;
    ctx.extra["endpoint"] = endpoint(impl.options);
    ctx.extra["database"] = std::to_string(impl.options.database);
    CBREAK_LOG_CTX(LogLevel::Info, LogCategory::Network, "redis client connected", ctx);
    return Created::ok(std::move(self));
}

bool RedisKeyValueClient::isConnected() const {
    return impl_->connected.load(std::memory_order_acquire);
}

void RedisKeyValueClient::close() {
    impl_->shutdown();
}

const RedisOptions& RedisKeyValueClient::options() const {
    return impl_->options;
}

BreakerResult<std::string> RedisKeyValueClient::ping() {
    auto req = makeRequest();
    req.push("PING");
    return impl_->exec<std::string>(std::move(req), "PING");
}

// ---------------------------------------------------------------------------
// IKeyValueClient
// ---------------------------------------------------------------------------
BreakerResult<std::optional<std::string>> RedisKeyValueClient::get(std::string_view key) {
    auto req = makeRequest();
    req.push("GET", key);
    return impl_->exec<std::optional<std::string>>(std::move(req), "GET");
}

BreakerResult<void> RedisKeyValueClient::set(std::string_view key, std::string_view value) {
    auto req = makeRequest();
    req.push("SET", key, value);
    auto reply = impl_->exec<redis::ignore_t>(std::move(req), "SET");
    if (reply.hasError()) {
        return BreakerResult<void>::err(std::move(reply).error());
    }
    return BreakerResult<void>::ok();
}

BreakerResult<bool> RedisKeyValueClient::setIfAbsent(std::string_view key,
                                                     std::string_view value) {
    auto req = makeRequest();
    req.push("SET", key, value, "NX");
    auto reply = impl_->exec<std::optional<std::string>>(std::move(req), "SET NX");
    if (reply.hasError()) {
        return BreakerResult<bool>::err(std::move(reply).error());
    }
    // OK when written, null when the key already existed.
    return BreakerResult<bool>::ok(reply.value().has_value());
}

BreakerResult<int64_t> RedisKeyValueClient::increment(std::string_view key) {
    auto req = makeRequest();
    req.push("INCR", key);
    auto reply = impl_->exec<long long>(std::move(req), "INCR");
    if (reply.hasError()) {
        return BreakerResult<int64_t>::err(std::move(reply).error());
    }
    return BreakerResult<int64_t>::ok(static_cast<int64_t>(reply.value()));
}

BreakerResult<bool> RedisKeyValueClient::setIfGreater(std::string_view key, int64_t value) {
    auto req = makeRequest();
    req.push("EVAL", kSetIfGreaterScript, 1, key, value);
    auto reply = impl_->exec<long long>(std::move(req), "EVAL");
    if (reply.hasError()) {
        return BreakerResult<bool>::err(std::move(reply).error());
    }
    return BreakerResult<bool>::ok(reply.value() == 1);
}

BreakerResult<bool> RedisKeyValueClient::remove(std::string_view key) {
    auto req = makeRequest();
    req.push("DEL", key);
    auto reply = impl_->exec<long long>(std::move(req), "DEL");
    if (reply.hasError()) {
        return BreakerResult<bool>::err(std::move(reply).error());
    }
    return BreakerResult<bool>::ok(reply.value() > 0);
}

BreakerResult<std::vector<std::string>> RedisKeyValueClient::keys(std::string_view prefix) {
    auto req = makeRequest();
    req.push("KEYS", std::string(prefix) + "*");
    return impl_->exec<std::vector<std::string>>(std::move(req), "KEYS");
}

}  // namespace cbreak::storage
