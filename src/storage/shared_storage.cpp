/// @file shared_storage.cpp
/// @brief SharedCircuitStorage implementation.

#include "cbreak/storage/shared_storage.hpp"

#include "cbreak/foundation/breaker_logger.hpp"

#include <algorithm>
#include <charconv>
#include <limits>

namespace cbreak::storage {

using foundation::BreakerError;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr std::string_view kStateField = "state";
constexpr std::string_view kCounterField = "fail_counter";
constexpr std::string_view kOpenedAtField = "opened_at";

std::optional<int64_t> parseInteger(std::string_view text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

SharedCircuitStorage::SharedCircuitStorage(std::shared_ptr<IKeyValueClient> client,
                                           SharedStorageOptions options)
    : client_(std::move(client)), options_(std::move(options)) {
    stateKey_ = key(kStateField);
    counterKey_ = key(kCounterField);
    openedAtKey_ = key(kOpenedAtField);
}

std::string SharedCircuitStorage::key(std::string_view field) const {
    std::string out = options_.baseNamespace;
    if (!options_.instanceNamespace.empty()) {
        out += ':';
        out += options_.instanceNamespace;
    }
    out += ':';
    out += field;
    return out;
}

void SharedCircuitStorage::initialize() {
    auto seededState = client_->setIfAbsent(stateKey_, breaker::toString(options_.initialState));
    if (seededState.hasError()) {
        logFailure("initialize(state)", seededState.error());
    }
    auto seededCounter = client_->setIfAbsent(counterKey_, "0");
    if (seededCounter.hasError()) {
        logFailure("initialize(fail_counter)", seededCounter.error());
    }
}

breaker::CircuitState SharedCircuitStorage::state() {
    auto result = client_->get(stateKey_);
    if (result.hasError()) {
        logFailure("state: falling back to default circuit state", result.error());
        return options_.fallbackState;
    }
    const auto& stored = result.value();
    if (!stored) {
        return breaker::CircuitState::Closed;
    }
    auto parsed = breaker::parseCircuitState(*stored);
    if (!parsed) {
        LogContext ctx;
        ctx.keyNamespace = options_.instanceNamespace;
        ctx.extra["stored"] = *stored;
        CBREAK_LOG_CTX(LogLevel::Warning, LogCategory::Storage,
                       "unknown stored circuit state, using fallback", ctx);
        return options_.fallbackState;
    }
    return *parsed;
}

void SharedCircuitStorage::setState(breaker::CircuitState state) {
    auto result = client_->set(stateKey_, breaker::toString(state));
    if (result.hasError()) {
        logFailure("setState", result.error());
    }
}

uint32_t SharedCircuitStorage::counter() {
    auto result = client_->get(counterKey_);
    if (result.hasError()) {
        logFailure("counter: assuming no failures", result.error());
        return 0;
    }
    if (!result.value()) {
        return 0;
    }
    auto parsed = parseInteger(*result.value());
    if (!parsed || *parsed < 0) {
        return 0;
    }
    return static_cast<uint32_t>(
        std::min<int64_t>(*parsed, std::numeric_limits<uint32_t>::max()));
}

uint32_t SharedCircuitStorage::incrementCounter() {
    auto result = client_->increment(counterKey_);
    if (result.hasError()) {
        logFailure("incrementCounter", result.error());
        // The increment may or may not have landed; report what is stored.
        return counter();
    }
    auto value = result.value();
    if (value < 0) {
        return 0;
    }
    return static_cast<uint32_t>(
        std::min<int64_t>(value, std::numeric_limits<uint32_t>::max()));
}

void SharedCircuitStorage::resetCounter() {
    auto result = client_->set(counterKey_, "0");
    if (result.hasError()) {
        logFailure("resetCounter", result.error());
    }
}

std::optional<TimePoint> SharedCircuitStorage::openedAt() {
    auto result = client_->get(openedAtKey_);
    if (result.hasError()) {
        logFailure("openedAt", result.error());
        return std::nullopt;
    }
    if (!result.value()) {
        return std::nullopt;
    }
    auto seconds = parseInteger(*result.value());
    if (!seconds) {
        return std::nullopt;
    }
    return TimePoint(std::chrono::seconds(*seconds));
}

void SharedCircuitStorage::setOpenedAt(TimePoint when) {
    auto epochSeconds = std::chrono::duration_cast<std::chrono::seconds>(
        when.time_since_epoch()).count();
    auto result = client_->setIfGreater(openedAtKey_, epochSeconds);
    if (result.hasError()) {
        logFailure("setOpenedAt", result.error());
    }
}

void SharedCircuitStorage::logFailure(std::string_view operation,
                                      const BreakerError& error) const {
    LogContext ctx;
    ctx.keyNamespace = options_.instanceNamespace;
    ctx.extra["operation"] = std::string(operation);
    ctx.extra["error"] = std::string(error.message());
    ctx.extra["code"] = std::string(error.subsystem());
    CBREAK_LOG_CTX(LogLevel::Error, LogCategory::Storage, "storage backend error", ctx);
}

}  // namespace cbreak::storage
