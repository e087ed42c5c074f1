/// @file circuit_storage_test.cpp
/// @brief Unit tests for the memory and shared circuit storages.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "cbreak/storage/key_value_client.hpp"
#include "cbreak/storage/memory_storage.hpp"
#include "cbreak/storage/shared_storage.hpp"

#include "support/failing_kv_client.hpp"
#include "support/mock_logger.hpp"

using namespace cbreak::storage;
using cbreak::breaker::CircuitState;
using cbreak::foundation::ErrorCode;
using cbreak::test::FailingKeyValueClient;
using cbreak::test::GlobalLoggerRegistry;
using cbreak::test::MockLogger;
using cbreak::test::log_level;
using namespace std::chrono_literals;

// ===========================================================================
// InMemoryKeyValueClient
// ===========================================================================

TEST(InMemoryKeyValueClientTest, GetAbsentKeyIsEmpty) {
    InMemoryKeyValueClient kv;
    auto result = kv.get("missing");
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().has_value());
}

TEST(InMemoryKeyValueClientTest, SetIfAbsentOnlyWritesOnce) {
    InMemoryKeyValueClient kv;
    EXPECT_TRUE(kv.setIfAbsent("k", "first").value());
    EXPECT_FALSE(kv.setIfAbsent("k", "second").value());
    EXPECT_EQ(kv.get("k").value(), "first");
}

TEST(InMemoryKeyValueClientTest, IncrementStartsFromZero) {
    InMemoryKeyValueClient kv;
    EXPECT_EQ(kv.increment("n").value(), 1);
    EXPECT_EQ(kv.increment("n").value(), 2);
    EXPECT_EQ(kv.get("n").value(), "2");
}

TEST(InMemoryKeyValueClientTest, IncrementRejectsNonInteger) {
    InMemoryKeyValueClient kv;
    ASSERT_TRUE(kv.set("n", "abc").hasValue());
    auto result = kv.increment("n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::StorageCommandFailed);
}

TEST(InMemoryKeyValueClientTest, SetIfGreaterNeverRegresses) {
    InMemoryKeyValueClient kv;
    EXPECT_TRUE(kv.setIfGreater("t", 100).value());
    EXPECT_FALSE(kv.setIfGreater("t", 50).value());
    EXPECT_FALSE(kv.setIfGreater("t", 100).value());
    EXPECT_TRUE(kv.setIfGreater("t", 101).value());
    EXPECT_EQ(kv.get("t").value(), "101");
}

TEST(InMemoryKeyValueClientTest, KeysByPrefixAreSorted) {
    InMemoryKeyValueClient kv;
    ASSERT_TRUE(kv.set("cb:b", "1").hasValue());
    ASSERT_TRUE(kv.set("cb:a", "1").hasValue());
    ASSERT_TRUE(kv.set("other", "1").hasValue());

    auto keys = kv.keys("cb:");
    ASSERT_TRUE(keys.hasValue());
    EXPECT_EQ(keys.value(), (std::vector<std::string>{"cb:a", "cb:b"}));

    EXPECT_TRUE(kv.remove("cb:a").value());
    EXPECT_FALSE(kv.remove("cb:a").value());
    EXPECT_EQ(kv.size(), 2u);
}

TEST(InMemoryKeyValueClientTest, ConcurrentIncrementsAreAtomic) {
    InMemoryKeyValueClient kv;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 250;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&kv] {
            for (int i = 0; i < kPerThread; ++i) {
                (void)kv.increment("n");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(kv.get("n").value(), std::to_string(kThreads * kPerThread));
}

// ===========================================================================
// MemoryCircuitStorage
// ===========================================================================

TEST(MemoryCircuitStorageTest, DefaultsToClosed) {
    MemoryCircuitStorage storage;
    EXPECT_EQ(storage.state(), CircuitState::Closed);
    EXPECT_EQ(storage.counter(), 0u);
    EXPECT_FALSE(storage.openedAt().has_value());
    EXPECT_EQ(storage.name(), "memory");
}

TEST(MemoryCircuitStorageTest, InitialStateIsHonored) {
    MemoryCircuitStorage storage(CircuitState::HalfOpen);
    EXPECT_EQ(storage.state(), CircuitState::HalfOpen);
}

TEST(MemoryCircuitStorageTest, CounterIncrementAndReset) {
    MemoryCircuitStorage storage;
    EXPECT_EQ(storage.incrementCounter(), 1u);
    EXPECT_EQ(storage.incrementCounter(), 2u);
    EXPECT_EQ(storage.counter(), 2u);
    storage.resetCounter();
    EXPECT_EQ(storage.counter(), 0u);
}

TEST(MemoryCircuitStorageTest, OpenedAtOnlyMovesForward) {
    MemoryCircuitStorage storage;
    auto now = std::chrono::system_clock::now();

    storage.setOpenedAt(now);
    storage.setOpenedAt(now - 10s);
    EXPECT_EQ(storage.openedAt(), now);

    storage.setOpenedAt(now + 1ms);
    EXPECT_EQ(storage.openedAt(), now + 1ms);
}

// ===========================================================================
// SharedCircuitStorage
// ===========================================================================

class SharedCircuitStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
        kv_ = std::make_shared<FailingKeyValueClient>();
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    SharedCircuitStorage makeStorage(std::string instance,
                                     CircuitState fallback = CircuitState::Closed) {
        return SharedCircuitStorage(kv_, SharedStorageOptions{
                                             .instanceNamespace = std::move(instance),
                                             .fallbackState = fallback,
                                         });
    }

    std::shared_ptr<MockLogger> mockLogger_;
    std::shared_ptr<FailingKeyValueClient> kv_;
};

TEST_F(SharedCircuitStorageTest, KeyLayout) {
    auto storage = makeStorage("prod:payments");
    EXPECT_EQ(storage.key("state"), "cbreak:prod:payments:state");
    EXPECT_EQ(storage.key("fail_counter"), "cbreak:prod:payments:fail_counter");
    EXPECT_EQ(storage.key("opened_at"), "cbreak:prod:payments:opened_at");
    EXPECT_EQ(storage.name(), "shared");

    auto bare = makeStorage("");
    EXPECT_EQ(bare.key("state"), "cbreak:state");
}

TEST_F(SharedCircuitStorageTest, InitializeSeedsOnlyAbsentKeys) {
    ASSERT_TRUE(kv_->set("cbreak:svc:state", "open").hasValue());

    auto storage = makeStorage("svc");
    storage.initialize();

    EXPECT_EQ(storage.state(), CircuitState::Open);
    EXPECT_EQ(kv_->get("cbreak:svc:fail_counter").value(), "0");
}

TEST_F(SharedCircuitStorageTest, AbsentStateReadsClosed) {
    auto storage = makeStorage("svc", CircuitState::Open);
    EXPECT_EQ(storage.state(), CircuitState::Closed);
}

TEST_F(SharedCircuitStorageTest, StateRoundTripsCanonicalStrings) {
    auto storage = makeStorage("svc");
    storage.setState(CircuitState::HalfOpen);
    EXPECT_EQ(kv_->get("cbreak:svc:state").value(), "half-open");
    EXPECT_EQ(storage.state(), CircuitState::HalfOpen);
}

TEST_F(SharedCircuitStorageTest, ReadFailureReturnsFallbackState) {
    auto storage = makeStorage("svc", CircuitState::Open);
    storage.setState(CircuitState::Closed);

    kv_->failReads = true;
    EXPECT_EQ(storage.state(), CircuitState::Open);
    EXPECT_EQ(storage.counter(), 0u);
    EXPECT_FALSE(storage.openedAt().has_value());
    EXPECT_GE(mockLogger_->count(log_level::error, "[Storage] storage backend error"), 1u);
}

TEST_F(SharedCircuitStorageTest, UnknownStoredStateReturnsFallback) {
    ASSERT_TRUE(kv_->set("cbreak:svc:state", "sideways").hasValue());
    auto storage = makeStorage("svc", CircuitState::HalfOpen);
    EXPECT_EQ(storage.state(), CircuitState::HalfOpen);
    EXPECT_TRUE(mockLogger_->contains("stored=sideways"));
}

TEST_F(SharedCircuitStorageTest, WriteFailuresAreContained) {
    auto storage = makeStorage("svc");
    storage.setState(CircuitState::Closed);
    (void)storage.incrementCounter();

    kv_->failWrites = true;
    storage.setState(CircuitState::Open);
    storage.resetCounter();
    storage.setOpenedAt(std::chrono::system_clock::now());
    EXPECT_EQ(storage.incrementCounter(), 1u);  // falls back to the stored value

    kv_->failWrites = false;
    EXPECT_EQ(storage.state(), CircuitState::Closed);
    EXPECT_EQ(storage.counter(), 1u);
    EXPECT_FALSE(storage.openedAt().has_value());
    EXPECT_GE(mockLogger_->count(log_level::error, "operation=setState"), 1u);
}

TEST_F(SharedCircuitStorageTest, OpenedAtHasSecondPrecisionAndNeverRegresses) {
    auto storage = makeStorage("svc");
    auto when = std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000)) + 750ms;

    storage.setOpenedAt(when);
    EXPECT_EQ(kv_->get("cbreak:svc:opened_at").value(), "1700000000");
    EXPECT_EQ(storage.openedAt(),
              std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000)));

    storage.setOpenedAt(when - 60s);
    EXPECT_EQ(kv_->get("cbreak:svc:opened_at").value(), "1700000000");

    storage.setOpenedAt(when + 5s);
    EXPECT_EQ(kv_->get("cbreak:svc:opened_at").value(), "1700000005");
}

TEST_F(SharedCircuitStorageTest, NamespacesAreIsolated) {
    auto a = makeStorage("prod:a");
    auto b = makeStorage("prod:b");

    a.setState(CircuitState::Open);
    (void)a.incrementCounter();
    a.setOpenedAt(std::chrono::system_clock::now());

    EXPECT_EQ(b.state(), CircuitState::Closed);
    EXPECT_EQ(b.counter(), 0u);
    EXPECT_FALSE(b.openedAt().has_value());
}
