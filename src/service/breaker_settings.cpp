/// @file breaker_settings.cpp
/// @brief BreakerSettings loading and validation.

#include "cbreak/service/breaker_settings.hpp"

#include "cbreak/foundation/breaker_logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <utility>
#include <vector>

namespace cbreak::service {

using foundation::BreakerError;
using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::ErrorSubsystem;
using foundation::LogCategory;

namespace {

BreakerError invalidValue(std::string_view key, std::string_view detail) {
    return BreakerError(ErrorCode::ConfigInvalidValue,
                        "invalid value for " + std::string(key) + ": " + std::string(detail));
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// "0x0003" (hex) or "3" (decimal).
std::optional<ErrorCode> parseErrorCode(std::string_view text) {
    int base = 10;
    if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
        base = 16;
    }
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return static_cast<ErrorCode>(value);
}

}  // namespace

std::optional<StorageBackend> parseStorageBackend(std::string_view text) {
    auto name = lowercase(text);
    if (name == "memory") {
        return StorageBackend::Memory;
    }
    if (name == "shared") {
        return StorageBackend::Shared;
    }
    if (name == "redis") {
        return StorageBackend::Redis;
    }
    return std::nullopt;
}

std::optional<ErrorSubsystem> parseErrorSubsystem(std::string_view text) {
    static constexpr std::pair<std::string_view, ErrorSubsystem> kNames[] = {
        {"general", ErrorSubsystem::General}, {"breaker", ErrorSubsystem::Breaker},
        {"storage", ErrorSubsystem::Storage}, {"network", ErrorSubsystem::Network},
        {"config", ErrorSubsystem::Config},   {"thread", ErrorSubsystem::Thread},
        {"logger", ErrorSubsystem::Logger},
    };
    auto name = lowercase(text);
    for (const auto& [candidate, subsystem] : kNames) {
        if (name == candidate) {
            return subsystem;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// fromConfig()
// ---------------------------------------------------------------------------
BreakerResult<BreakerSettings> BreakerSettings::fromConfig(const ConfigManager& config) {
    using R = BreakerResult<BreakerSettings>;
    BreakerSettings s;

    auto failMax = config.getOr<int64_t>("breaker.fail_max", s.failMax);
    if (failMax.hasError()) {
        return R::err(std::move(failMax).error());
    }
    if (failMax.value() <= 0 || failMax.value() > UINT32_MAX) {
        return R::err(invalidValue("breaker.fail_max", "must be a positive integer"));
    }
    s.failMax = static_cast<uint32_t>(failMax.value());

    if (config.hasKey("breaker.reset_timeout")) {
        auto timeout = config.getDuration("breaker.reset_timeout");
        if (timeout.hasError()) {
            return R::err(std::move(timeout).error());
        }
        if (timeout.value().count() <= 0) {
            return R::err(invalidValue("breaker.reset_timeout", "must be positive"));
        }
        s.resetTimeout = timeout.value();
    }

    auto countRejected = config.getOr<bool>("breaker.count_rejected_calls", s.countRejectedCalls);
    if (countRejected.hasError()) {
        return R::err(std::move(countRejected).error());
    }
    s.countRejectedCalls = countRejected.value();

    auto environment = config.getOr<std::string>("breaker.environment", s.environment);
    if (environment.hasError()) {
        return R::err(std::move(environment).error());
    }
    s.environment = std::move(environment).value();

    auto codes = config.getOr<std::vector<std::string>>("breaker.excluded_codes", {});
    if (codes.hasError()) {
        return R::err(std::move(codes).error());
    }
    for (const auto& text : codes.value()) {
        auto code = parseErrorCode(text);
        if (!code) {
            return R::err(invalidValue("breaker.excluded_codes", text));
        }
        s.excluded.codes.insert(*code);
    }

    auto subsystems = config.getOr<std::vector<std::string>>("breaker.excluded_subsystems", {});
    if (subsystems.hasError()) {
        return R::err(std::move(subsystems).error());
    }
    for (const auto& text : subsystems.value()) {
        auto subsystem = parseErrorSubsystem(text);
        if (!subsystem) {
            return R::err(invalidValue("breaker.excluded_subsystems", text));
        }
        s.excluded.subsystems.insert(*subsystem);
    }

    // storage
    auto backend = config.getOr<std::string>("breaker.storage.backend", "memory");
    if (backend.hasError()) {
        return R::err(std::move(backend).error());
    }
    auto parsedBackend = parseStorageBackend(backend.value());
    if (!parsedBackend) {
        return R::err(invalidValue("breaker.storage.backend", backend.value()));
    }
    s.backend = *parsedBackend;

    auto base = config.getOr<std::string>("breaker.storage.base_namespace", s.baseNamespace);
    if (base.hasError()) {
        return R::err(std::move(base).error());
    }
    if (base.value().empty()) {
        return R::err(invalidValue("breaker.storage.base_namespace", "must not be empty"));
    }
    s.baseNamespace = std::move(base).value();

    auto fallback = config.getOr<std::string>("breaker.storage.fallback_state", "closed");
    if (fallback.hasError()) {
        return R::err(std::move(fallback).error());
    }
    auto fallbackState = breaker::parseCircuitState(fallback.value());
    if (!fallbackState) {
        return R::err(invalidValue("breaker.storage.fallback_state", fallback.value()));
    }
    s.fallbackState = *fallbackState;

    // redis
    auto host = config.getOr<std::string>("breaker.redis.host", s.redis.host);
    if (host.hasError()) {
        return R::err(std::move(host).error());
    }
    s.redis.host = std::move(host).value();

    auto port = config.getOr<int64_t>("breaker.redis.port", s.redis.port);
    if (port.hasError()) {
        return R::err(std::move(port).error());
    }
    if (port.value() <= 0 || port.value() > UINT16_MAX) {
        return R::err(invalidValue("breaker.redis.port", std::to_string(port.value())));
    }
    s.redis.port = static_cast<uint16_t>(port.value());

    auto database = config.getOr<int64_t>("breaker.redis.database", s.redis.database);
    if (database.hasError()) {
        return R::err(std::move(database).error());
    }
    if (database.value() < 0 || database.value() > INT32_MAX) {
        return R::err(invalidValue("breaker.redis.database", std::to_string(database.value())));
    }
    s.redis.database = static_cast<uint32_t>(database.value());

    if (config.hasKey("breaker.redis.timeout")) {
        auto timeout = config.getDuration("breaker.redis.timeout");
        if (timeout.hasError()) {
            return R::err(std::move(timeout).error());
        }
        if (timeout.value().count() <= 0) {
            return R::err(invalidValue("breaker.redis.timeout", "must be positive"));
        }
        s.redis.commandTimeout = timeout.value();
    }

    CBREAK_LOG_DEBUG(LogCategory::Config,
                     "breaker settings loaded: fail_max=" + std::to_string(s.failMax) +
                         " reset_timeout=" + std::to_string(s.resetTimeout.count()) + "ms");
    return R::ok(std::move(s));
}

breaker::BreakerConfig BreakerSettings::toBreakerConfig(std::string name) const {
    return breaker::BreakerConfig{
        .failMax = failMax,
        .resetTimeout = resetTimeout,
        .excluded = excluded,
        .name = std::move(name),
        .countRejectedCalls = countRejectedCalls,
    };
}

}  // namespace cbreak::service
