#pragma once

/// @file breaker_logger.hpp
/// @brief Category logger for breaker events, backed by kcenon common_system.
///
/// Each subsystem logs under its own category with an adjustable minimum
/// level. Breaker name, namespace and state travel in LogContext.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "cbreak/foundation/breaker_result.hpp"

namespace cbreak::foundation {

/// Severity, ordered so that a numeric comparison filters messages.
/// Converted one-to-one to kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem a message belongs to.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Foundation services (executor, logger itself)
    Breaker  = 1, ///< State machine and transitions
    Storage  = 2, ///< Circuit state storage backends
    Network  = 3, ///< Key-value client connections
    Registry = 4, ///< Per-dependency breaker registry
    Config   = 5  ///< Settings loading
};

inline constexpr std::size_t kLogCategoryCount = 6;

/// Bracketed prefix used in formatted lines.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Breaker", "Storage", "Network", "Registry", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Optional key-value fields rendered after the message as `{k=v, ...}`.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.breakerName = "payments";
///   ctx.keyNamespace = "prod:payments";
///   ctx.extra["fail_counter"] = "3";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Breaker,
///                         "circuit opened", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> breakerName;
    std::optional<std::string> keyNamespace;
    std::optional<std::string> state;
    std::unordered_map<std::string, std::string> extra;
};

/// Process-wide logger for the library.
///
/// Messages are routed to the logger registered under "cbreak.<Category>"
/// in kcenon's GlobalLoggerRegistry, falling back to the default logger.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Breaker  | Info          |
/// | Storage  | Info          |
/// | Network  | Info          |
/// | Registry | Info          |
/// | Config   | Info          |
class BreakerLogger {
public:
    BreakerLogger();
    ~BreakerLogger();

    BreakerLogger(const BreakerLogger&) = delete;
    BreakerLogger& operator=(const BreakerLogger&) = delete;
    BreakerLogger(BreakerLogger&&) noexcept;
    BreakerLogger& operator=(BreakerLogger&&) noexcept;

    /// Dropped when @p level is below the minimum set for @p cat.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flushes the registry's default logger. Fails with LoggerFlushFailed.
    BreakerResult<void> flush();

    static BreakerLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cbreak::foundation

/// @name Logging macros
/// Define CBREAK_MIN_LOG_LEVEL (numeric LogLevel) to compile out
/// messages below it. The runtime category level still applies.
/// @{

#ifndef CBREAK_MIN_LOG_LEVEL
    #define CBREAK_MIN_LOG_LEVEL 0
#endif

#define CBREAK_LOG(level, cat, msg)                                                   \
    do {                                                                              \
        _Pragma("GCC diagnostic push")                                                \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                           \
        if (static_cast<int>(level) >= CBREAK_MIN_LOG_LEVEL &&                        \
            ::cbreak::foundation::BreakerLogger::instance().isEnabled((level), (cat)))  \
        {                                                                             \
            ::cbreak::foundation::BreakerLogger::instance().log((level), (cat), (msg)); \
        }                                                                             \
        _Pragma("GCC diagnostic pop")                                                 \
    } while (0)

#define CBREAK_LOG_CTX(level, cat, msg, ctx)                                          \
    do {                                                                              \
        if (static_cast<int>(level) >= CBREAK_MIN_LOG_LEVEL) {                        \
            ::cbreak::foundation::BreakerLogger::instance().logWithContext(           \
                (level), (cat), (msg), (ctx));                                        \
        }                                                                             \
    } while (0)

#define CBREAK_LOG_DEBUG(cat, msg) \
    CBREAK_LOG(::cbreak::foundation::LogLevel::Debug, (cat), (msg))

#define CBREAK_LOG_INFO(cat, msg) \
    CBREAK_LOG(::cbreak::foundation::LogLevel::Info, (cat), (msg))

#define CBREAK_LOG_WARN(cat, msg) \
    CBREAK_LOG(::cbreak::foundation::LogLevel::Warning, (cat), (msg))

#define CBREAK_LOG_ERROR(cat, msg) \
    CBREAK_LOG(::cbreak::foundation::LogLevel::Error, (cat), (msg))

/// @}
