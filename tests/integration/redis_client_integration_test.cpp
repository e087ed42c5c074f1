/// @file redis_client_integration_test.cpp
/// @brief RedisKeyValueClient and SharedCircuitStorage over a real TCP connection.
///
/// Connection failure tests run everywhere. The LiveRedis suite runs only
/// when CBREAK_REDIS_HOST names a reachable Redis 6+ server
/// (CBREAK_REDIS_PORT defaults to 6379).

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "cbreak/breaker/circuit_breaker.hpp"
#include "cbreak/storage/redis_client.hpp"
#include "cbreak/storage/shared_storage.hpp"

#include "support/silent_tcp_server.hpp"

using namespace cbreak::storage;
using cbreak::breaker::BreakerConfig;
using cbreak::breaker::CircuitBreaker;
using cbreak::breaker::CircuitState;
using cbreak::foundation::BreakerError;
using cbreak::foundation::BreakerResult;
using cbreak::foundation::ErrorCode;
using cbreak::test::SilentTcpServer;
using namespace std::chrono_literals;

namespace {

constexpr uint16_t kSilentServerPort = 19201;
constexpr auto kStartupDelay = 200ms;

}  // namespace

// ===========================================================================
// Connection failures
// ===========================================================================

TEST(RedisConnectTest, UnreachableServerFailsToConnect) {
    RedisOptions options;
    options.port = 1;
    options.connectTimeout = 300ms;

    auto start = std::chrono::steady_clock::now();
    auto client = RedisKeyValueClient::connect(options);
    ASSERT_TRUE(client.hasError());
    EXPECT_EQ(client.error().code(), ErrorCode::ConnectionFailed);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(RedisConnectTest, UnansweredHandshakeFailsToConnect) {
    SilentTcpServer server;
    ASSERT_TRUE(server.start(kSilentServerPort));
    std::this_thread::sleep_for(kStartupDelay);

    RedisOptions options;
    options.port = kSilentServerPort;
    options.connectTimeout = 500ms;
    auto client = RedisKeyValueClient::connect(options);

    ASSERT_TRUE(client.hasError());
    EXPECT_EQ(client.error().code(), ErrorCode::ConnectionFailed);
    EXPECT_GE(server.connections(), 1u);
    EXPECT_GT(server.bytesReceived(), 0u);
}

// ===========================================================================
// Live Redis (opt-in)
// ===========================================================================

class LiveRedisTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* host = std::getenv("CBREAK_REDIS_HOST");
        if (host == nullptr || *host == '\0') {
            GTEST_SKIP() << "CBREAK_REDIS_HOST not set";
        }
        auto connected = RedisKeyValueClient::connect(liveOptions());
        ASSERT_TRUE(connected.hasValue()) << connected.error().message();
        client_ = std::move(connected).value();
        prefix_ = "cbreak-test:" + std::to_string(std::chrono::steady_clock::now()
                                                      .time_since_epoch()
                                                      .count());
    }

    void TearDown() override {
        if (!client_ || !client_->isConnected()) {
            return;
        }
        auto keys = client_->keys(prefix_);
        if (keys.hasValue()) {
            for (const auto& key : keys.value()) {
                (void)client_->remove(key);
            }
        }
        client_->close();
    }

    static RedisOptions liveOptions() {
        RedisOptions options;
        options.host = std::getenv("CBREAK_REDIS_HOST");
        if (const char* port = std::getenv("CBREAK_REDIS_PORT")) {
            options.port = static_cast<uint16_t>(std::atoi(port));
        }
        return options;
    }

    std::string key(std::string_view suffix) const { return prefix_ + ":" + std::string(suffix); }

    std::shared_ptr<RedisKeyValueClient> client_;
    std::string prefix_;
};

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

TEST_F(LiveRedisTest, PingAnswersPong) {
    EXPECT_TRUE(client_->isConnected());
    EXPECT_EQ(client_->ping().value(), "PONG");
}

TEST_F(LiveRedisTest, SetThenGet) {
    ASSERT_TRUE(client_->set(key("state"), "open").hasValue());
    EXPECT_EQ(client_->get(key("state")).value(), std::optional<std::string>("open"));

    auto missing = client_->get(key("absent"));
    ASSERT_TRUE(missing.hasValue());
    EXPECT_FALSE(missing.value().has_value());
}

TEST_F(LiveRedisTest, SetIfAbsentWritesOnce) {
    EXPECT_TRUE(client_->setIfAbsent(key("k"), "first").value());
    EXPECT_FALSE(client_->setIfAbsent(key("k"), "second").value());
    EXPECT_EQ(client_->get(key("k")).value(), std::optional<std::string>("first"));
}

TEST_F(LiveRedisTest, IncrementAndRemove) {
    EXPECT_EQ(client_->increment(key("counter")).value(), 1);
    EXPECT_EQ(client_->increment(key("counter")).value(), 2);
    EXPECT_TRUE(client_->remove(key("counter")).value());
    EXPECT_FALSE(client_->remove(key("counter")).value());
}

TEST_F(LiveRedisTest, SetIfGreaterIsMonotonic) {
    EXPECT_TRUE(client_->setIfGreater(key("opened_at"), 100).value());
    EXPECT_FALSE(client_->setIfGreater(key("opened_at"), 50).value());
    EXPECT_TRUE(client_->setIfGreater(key("opened_at"), 200).value());
    EXPECT_EQ(client_->get(key("opened_at")).value(), std::optional<std::string>("200"));
}

TEST_F(LiveRedisTest, KeysByPrefix) {
    ASSERT_TRUE(client_->set(key("a:state"), "closed").hasValue());
    ASSERT_TRUE(client_->set(key("b:state"), "open").hasValue());

    auto keys = client_->keys(prefix_ + ":");
    ASSERT_TRUE(keys.hasValue());
    EXPECT_EQ(keys.value().size(), 2u);
}

TEST_F(LiveRedisTest, ErrorReplyBecomesCommandFailed) {
    ASSERT_TRUE(client_->set(key("text"), "not-a-number").hasValue());

    auto reply = client_->increment(key("text"));
    ASSERT_TRUE(reply.hasError());
    EXPECT_EQ(reply.error().code(), ErrorCode::StorageCommandFailed);

    // The connection stays usable.
    EXPECT_EQ(client_->ping().value(), "PONG");
}

TEST_F(LiveRedisTest, PipelinedCommandsFromManyThreads) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this] {
            for (int n = 0; n < 25; ++n) {
                EXPECT_TRUE(client_->increment(key("shared")).hasValue());
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(client_->get(key("shared")).value(), std::optional<std::string>("200"));
}

TEST_F(LiveRedisTest, SelectsConfiguredDatabase) {
    auto options = liveOptions();
    options.database = 1;
    auto other = RedisKeyValueClient::connect(options);
    ASSERT_TRUE(other.hasValue()) << other.error().message();

    ASSERT_TRUE(other.value()->set(key("db"), "one").hasValue());
    EXPECT_FALSE(client_->get(key("db")).value().has_value());
    EXPECT_EQ(other.value()->get(key("db")).value(), std::optional<std::string>("one"));

    EXPECT_TRUE(other.value()->remove(key("db")).value());
    other.value()->close();
}

TEST_F(LiveRedisTest, ClosedClientFailsCommands) {
    client_->close();
    client_->close();
    EXPECT_FALSE(client_->isConnected());

    auto reply = client_->get(key("k"));
    ASSERT_TRUE(reply.hasError());
    EXPECT_EQ(reply.error().code(), ErrorCode::StorageUnavailable);
}

// ---------------------------------------------------------------------------
// Breakers sharing state through the server
// ---------------------------------------------------------------------------

TEST_F(LiveRedisTest, BreakersShareStateThroughServer) {
    auto makeBreaker = [this] {
        auto storage = std::make_shared<SharedCircuitStorage>(
            client_, SharedStorageOptions{.baseNamespace = prefix_,
                                          .instanceNamespace = "prod:quotes"});
        storage->initialize();
        return std::make_unique<CircuitBreaker>(
            BreakerConfig{.failMax = 2, .resetTimeout = 1h, .name = "quotes"}, storage);
    };
    auto a = makeBreaker();
    auto b = makeBreaker();

    auto fail = [] { return BreakerResult<int>::err(BreakerError(ErrorCode::Timeout)); };
    (void)a->call(fail);
    EXPECT_TRUE(a->call(fail).error().isCircuitOpen());

    EXPECT_EQ(client_->get(key("prod:quotes:state")).value(), std::optional<std::string>("open"));
    EXPECT_EQ(b->currentState(), CircuitState::Open);
    EXPECT_EQ(b->failCounter(), 2u);

    b->close();
    EXPECT_EQ(a->currentState(), CircuitState::Closed);
}

TEST_F(LiveRedisTest, BreakerReopensAfterTimeout) {
    auto storage = std::make_shared<SharedCircuitStorage>(
        client_, SharedStorageOptions{.baseNamespace = prefix_, .instanceNamespace = "svc"});
    storage->initialize();
    CircuitBreaker cb(BreakerConfig{.failMax = 1, .resetTimeout = 2s}, storage);

    auto opened = cb.call([] { return BreakerResult<int>::err(BreakerError(ErrorCode::Timeout)); });
    EXPECT_TRUE(opened.error().isCircuitOpen());
    EXPECT_EQ(storage->state(), CircuitState::Open);
    EXPECT_TRUE(storage->openedAt().has_value());

    std::this_thread::sleep_for(3s);
    EXPECT_TRUE(cb.call([] { return BreakerResult<int>::ok(1); }).hasValue());
    EXPECT_EQ(storage->state(), CircuitState::Closed);
}

TEST_F(LiveRedisTest, LostClientFallsBackWithoutFailingCalls) {
    auto storage = std::make_shared<SharedCircuitStorage>(
        client_, SharedStorageOptions{.baseNamespace = prefix_,
                                      .instanceNamespace = "prod:quotes",
                                      .fallbackState = CircuitState::Closed});
    storage->initialize();
    CircuitBreaker cb(BreakerConfig{.failMax = 2, .resetTimeout = 1h}, storage);

    client_->close();

    auto result = cb.call([] { return BreakerResult<int>::ok(7); });
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(cb.currentState(), CircuitState::Closed);
}
