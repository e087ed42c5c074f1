/// @file breaker_listener.cpp
/// @brief LoggingListener implementation.

#include "cbreak/breaker/breaker_listener.hpp"

#include "cbreak/breaker/circuit_breaker.hpp"
#include "cbreak/foundation/breaker_logger.hpp"

namespace cbreak::breaker {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

void LoggingListener::onFailure(CircuitBreaker& breaker, const foundation::BreakerError& error) {
    LogContext ctx;
    ctx.breakerName = breaker.name();
    ctx.extra["error"] = std::string(error.message());
    ctx.extra["subsystem"] = std::string(error.subsystem());
    CBREAK_LOG_CTX(LogLevel::Debug, LogCategory::Breaker, "guarded call failed", ctx);
}

void LoggingListener::onStateChange(CircuitBreaker& breaker, CircuitState oldState,
                                    CircuitState newState) {
    LogContext ctx;
    ctx.breakerName = breaker.name();
    ctx.state = std::string(toString(newState));
    ctx.extra["previous"] = std::string(toString(oldState));

    auto level = newState == CircuitState::Open ? LogLevel::Warning : LogLevel::Info;
    CBREAK_LOG_CTX(level, LogCategory::Breaker, "circuit state changed", ctx);
}

}  // namespace cbreak::breaker
