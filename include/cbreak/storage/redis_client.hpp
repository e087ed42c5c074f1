#pragma once

/// @file redis_client.hpp
/// @brief IKeyValueClient backed by a Redis server through Boost.Redis.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "cbreak/storage/key_value_client.hpp"

namespace cbreak::storage {

/// Connection settings for RedisKeyValueClient.
struct RedisOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;

    /// Logical database selected during the handshake (0 = default).
    uint32_t database = 0;

    /// Upper bound on the wait for one command's reply.
    std::chrono::milliseconds commandTimeout{500};

    /// Upper bound on resolve, connect and the first round trip.
    std::chrono::milliseconds connectTimeout{2000};

    /// Pause between reconnect attempts after the server goes away.
    std::chrono::milliseconds reconnectWait{1000};

    std::string clientId = "cbreak-redis";
};

/// Redis client running one boost::redis::connection on a private
/// io_context thread.
///
/// Commands from any number of threads are posted to that thread and
/// pipelined on the single connection. While the server is unreachable
/// commands fail immediately with StorageUnavailable and the connection
/// keeps reconnecting every RedisOptions::reconnectWait.
///
/// Atomicity: increment uses INCR, setIfAbsent uses SET NX, and
/// setIfGreater runs as one EVAL script, so none of them is a
/// read-modify-write across round trips. Requires Redis 6 or newer
/// (the handshake speaks RESP3).
class RedisKeyValueClient : public IKeyValueClient {
public:
    /// Connect, select the configured database and wait for a PING reply.
    /// @return ConnectionFailed if that does not happen within connectTimeout.
    static BreakerResult<std::shared_ptr<RedisKeyValueClient>> connect(RedisOptions options);

    ~RedisKeyValueClient() override;

    RedisKeyValueClient(const RedisKeyValueClient&) = delete;
    RedisKeyValueClient& operator=(const RedisKeyValueClient&) = delete;

    [[nodiscard]] BreakerResult<std::optional<std::string>> get(std::string_view key) override;
    BreakerResult<void> set(std::string_view key, std::string_view value) override;
    BreakerResult<bool> setIfAbsent(std::string_view key, std::string_view value) override;
    BreakerResult<int64_t> increment(std::string_view key) override;
    BreakerResult<bool> setIfGreater(std::string_view key, int64_t value) override;
    BreakerResult<bool> remove(std::string_view key) override;
    [[nodiscard]] BreakerResult<std::vector<std::string>> keys(std::string_view prefix) override;

    /// Round trip to the server. Returns the reply text ("PONG").
    BreakerResult<std::string> ping();

    [[nodiscard]] bool isConnected() const;

    /// Cancel the connection and stop the I/O thread. Later commands fail
    /// with StorageUnavailable.
    void close();

    [[nodiscard]] const RedisOptions& options() const;

private:
    explicit RedisKeyValueClient(RedisOptions options);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cbreak::storage
