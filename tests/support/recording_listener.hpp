#pragma once

/// @file recording_listener.hpp
/// @brief Listener that appends every notification to a shared event log.

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cbreak/breaker/breaker_listener.hpp"
#include "cbreak/breaker/circuit_breaker.hpp"

namespace cbreak::test {

/// Thread-safe event log shared by several listeners.
class EventLog {
public:
    void append(std::string event) {
        std::lock_guard lock(mutex_);
        events_.push_back(std::move(event));
    }

    std::vector<std::string> events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

    std::size_t count(const std::string& event) const {
        std::lock_guard lock(mutex_);
        std::size_t n = 0;
        for (const auto& e : events_) {
            n += (e == event) ? 1 : 0;
        }
        return n;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

/// Records "<tag>:before", "<tag>:success", "<tag>:failure" and
/// "<tag>:<old>-><new>".
class RecordingListener : public breaker::IBreakerListener {
public:
    RecordingListener(std::shared_ptr<EventLog> log, std::string tag)
        : log_(std::move(log)), tag_(std::move(tag)) {}

    void beforeCall(breaker::CircuitBreaker& /*breaker*/) override {
        log_->append(tag_ + ":before");
    }

    void onSuccess(breaker::CircuitBreaker& /*breaker*/) override {
        log_->append(tag_ + ":success");
    }

    void onFailure(breaker::CircuitBreaker& /*breaker*/,
                   const foundation::BreakerError& /*error*/) override {
        log_->append(tag_ + ":failure");
    }

    void onStateChange(breaker::CircuitBreaker& /*breaker*/, breaker::CircuitState oldState,
                       breaker::CircuitState newState) override {
        log_->append(tag_ + ":" + std::string(breaker::toString(oldState)) + "->" +
                     std::string(breaker::toString(newState)));
    }

private:
    std::shared_ptr<EventLog> log_;
    std::string tag_;
};

}  // namespace cbreak::test
