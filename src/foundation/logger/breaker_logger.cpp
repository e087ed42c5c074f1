/// @file breaker_logger.cpp
/// @brief BreakerLogger over kcenon's GlobalLoggerRegistry.

#include "cbreak/foundation/breaker_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace cbreak::foundation {

namespace kci = kcenon::common::interfaces;

static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr LogLevel kDefaultCategoryLevel = LogLevel::Info;

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.breakerName && !ctx.breakerName->empty()) {
        append("breaker", *ctx.breakerName);
    }
    if (ctx.keyNamespace && !ctx.keyNamespace->empty()) {
        append("namespace", *ctx.keyNamespace);
    }
    if (ctx.state) {
        append("state", *ctx.state);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

struct BreakerLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> minLevels;
    std::array<std::string, kLogCategoryCount> registryKeys; // "cbreak.<Category>"

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            minLevels[i].store(kDefaultCategoryLevel, std::memory_order_relaxed);
            registryKeys[i] = std::string("cbreak.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(registryKeys[idx]);
        // No category-specific logger registered: use the default one.
        if (!logger || logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view ctxStr) const {
        auto logger = getLogger(cat);
        if (!logger) {
            return;
        }

        std::string formatted;
        formatted.reserve(msg.size() + ctxStr.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctxStr.empty()) {
            formatted += " {";
            formatted += ctxStr;
            formatted += '}';
        }

        // A failing sink must never disturb the guarded call path.
        (void)logger->log(mapLevel(level), formatted);
    }
};

BreakerLogger::BreakerLogger() : impl_(std::make_unique<Impl>()) {}

BreakerLogger::~BreakerLogger() = default;

BreakerLogger::BreakerLogger(BreakerLogger&&) noexcept = default;
BreakerLogger& BreakerLogger::operator=(BreakerLogger&&) noexcept = default;

void BreakerLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void BreakerLogger::logWithContext(LogLevel level, LogCategory cat,
                                   std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

void BreakerLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->minLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel BreakerLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->minLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool BreakerLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->minLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

BreakerResult<void> BreakerLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return BreakerResult<void>::err(
            BreakerError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return BreakerResult<void>::ok();
}

BreakerLogger& BreakerLogger::instance() {
    static BreakerLogger inst;
    return inst;
}

} // namespace cbreak::foundation
