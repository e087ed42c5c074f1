/// @file breaker_settings_test.cpp
/// @brief Unit tests for BreakerSettings loading from ConfigManager.

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "cbreak/foundation/config_manager.hpp"
#include "cbreak/service/breaker_settings.hpp"

using namespace cbreak::service;
using cbreak::breaker::CircuitState;
using cbreak::foundation::BreakerError;
using cbreak::foundation::ConfigManager;
using cbreak::foundation::ErrorCode;
using cbreak::foundation::ErrorSubsystem;
using namespace std::chrono_literals;

class BreakerSettingsTest : public ::testing::Test {
protected:
    BreakerResult<BreakerSettings> load(std::string_view yaml) {
        auto loaded = config_.loadFromString(yaml);
        EXPECT_TRUE(loaded.hasValue());
        return BreakerSettings::fromConfig(config_);
    }

    ConfigManager config_;
};

// ===========================================================================
// Defaults
// ===========================================================================

TEST_F(BreakerSettingsTest, EmptyConfigYieldsDefaults) {
    auto result = load("other: 1\n");
    ASSERT_TRUE(result.hasValue());
    const auto& s = result.value();
    EXPECT_EQ(s.failMax, 5u);
    EXPECT_EQ(s.resetTimeout, 15000ms);
    EXPECT_FALSE(s.countRejectedCalls);
    EXPECT_EQ(s.environment, "development");
    EXPECT_TRUE(s.excluded.empty());
    EXPECT_EQ(s.backend, StorageBackend::Memory);
    EXPECT_EQ(s.baseNamespace, "cbreak");
    EXPECT_EQ(s.fallbackState, CircuitState::Closed);
    EXPECT_EQ(s.redis.host, "127.0.0.1");
    EXPECT_EQ(s.redis.port, 6379);
}

// ===========================================================================
// Full document
// ===========================================================================

TEST_F(BreakerSettingsTest, ReadsEveryKey) {
    auto result = load(R"(
breaker:
  fail_max: 3
  reset_timeout: 0.5
  count_rejected_calls: true
  environment: production
  excluded_codes: ["0x0003", "6"]
  excluded_subsystems: [Config]
  storage:
    backend: redis
    base_namespace: payments
    fallback_state: open
  redis:
    host: cache.internal
    port: 6380
    database: 3
    timeout: 250ms
)");
    ASSERT_TRUE(result.hasValue());
    const auto& s = result.value();
    EXPECT_EQ(s.failMax, 3u);
    EXPECT_EQ(s.resetTimeout, 500ms);
    EXPECT_TRUE(s.countRejectedCalls);
    EXPECT_EQ(s.environment, "production");
    EXPECT_TRUE(s.excluded.codes.contains(ErrorCode::NotFound));
    EXPECT_TRUE(s.excluded.codes.contains(ErrorCode::PermissionDenied));
    EXPECT_TRUE(s.excluded.subsystems.contains(ErrorSubsystem::Config));
    EXPECT_EQ(s.backend, StorageBackend::Redis);
    EXPECT_EQ(s.baseNamespace, "payments");
    EXPECT_EQ(s.fallbackState, CircuitState::Open);
    EXPECT_EQ(s.redis.host, "cache.internal");
    EXPECT_EQ(s.redis.port, 6380);
    EXPECT_EQ(s.redis.database, 3u);
    EXPECT_EQ(s.redis.commandTimeout, 250ms);
}

TEST_F(BreakerSettingsTest, ToBreakerConfigCarriesSettings) {
    auto result = load("breaker:\n  fail_max: 7\n  reset_timeout: 2s\n"
                       "  excluded_codes: [\"0x0003\"]\n");
    ASSERT_TRUE(result.hasValue());

    auto config = result.value().toBreakerConfig("quotes");
    EXPECT_EQ(config.name, "quotes");
    EXPECT_EQ(config.failMax, 7u);
    EXPECT_EQ(config.resetTimeout, 2000ms);
    EXPECT_TRUE(config.excluded.matches(BreakerError(ErrorCode::NotFound)));
    EXPECT_FALSE(config.countRejectedCalls);
}

// ===========================================================================
// Validation
// ===========================================================================

TEST_F(BreakerSettingsTest, RejectsNonPositiveFailMax) {
    auto result = load("breaker:\n  fail_max: 0\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(BreakerSettingsTest, RejectsNonPositiveResetTimeout) {
    auto result = load("breaker:\n  reset_timeout: 0\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(BreakerSettingsTest, RejectsUnknownBackend) {
    auto result = load("breaker:\n  storage:\n    backend: etcd\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(BreakerSettingsTest, RejectsUnknownFallbackState) {
    auto result = load("breaker:\n  storage:\n    fallback_state: ajar\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(BreakerSettingsTest, RejectsEmptyBaseNamespace) {
    auto result = load("breaker:\n  storage:\n    base_namespace: \"\"\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(BreakerSettingsTest, RejectsMalformedExcludedCode) {
    auto result = load("breaker:\n  excluded_codes: [\"0xZZ\"]\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(BreakerSettingsTest, RejectsUnknownSubsystem) {
    auto result = load("breaker:\n  excluded_subsystems: [Graphics]\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(BreakerSettingsTest, RejectsOutOfRangePort) {
    auto result = load("breaker:\n  redis:\n    port: 70000\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(BreakerSettingsTest, RejectsNonPositiveRedisTimeout) {
    for (const char* timeout : {"0", "0ms"}) {
        auto result = load(std::string("breaker:\n  redis:\n    timeout: ") + timeout + "\n");
        ASSERT_TRUE(result.hasError()) << timeout;
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalidValue);
    }
}

TEST_F(BreakerSettingsTest, RejectsOutOfRangeRedisDatabase) {
    auto negative = load("breaker:\n  redis:\n    database: -1\n");
    ASSERT_TRUE(negative.hasError());
    EXPECT_EQ(negative.error().code(), ErrorCode::ConfigInvalidValue);

    auto huge = load("breaker:\n  redis:\n    database: 4294967296\n");
    ASSERT_TRUE(huge.hasError());
    EXPECT_EQ(huge.error().code(), ErrorCode::ConfigInvalidValue);

    auto fine = load("breaker:\n  redis:\n    database: 15\n");
    ASSERT_TRUE(fine.hasValue());
    EXPECT_EQ(fine.value().redis.database, 15u);
}

TEST_F(BreakerSettingsTest, TypeMismatchPropagates) {
    auto result = load("breaker:\n  fail_max: lots\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

// ===========================================================================
// Parsers
// ===========================================================================

TEST(BreakerSettingsParseTest, StorageBackendIsCaseInsensitive) {
    EXPECT_EQ(parseStorageBackend("Memory"), StorageBackend::Memory);
    EXPECT_EQ(parseStorageBackend("SHARED"), StorageBackend::Shared);
    EXPECT_EQ(parseStorageBackend("redis"), StorageBackend::Redis);
    EXPECT_FALSE(parseStorageBackend("disk").has_value());
}

TEST(BreakerSettingsParseTest, ErrorSubsystemNames) {
    EXPECT_EQ(parseErrorSubsystem("storage"), ErrorSubsystem::Storage);
    EXPECT_EQ(parseErrorSubsystem("Network"), ErrorSubsystem::Network);
    EXPECT_EQ(parseErrorSubsystem("GENERAL"), ErrorSubsystem::General);
    EXPECT_FALSE(parseErrorSubsystem("").has_value());
}
