/// @file memory_storage.cpp
/// @brief MemoryCircuitStorage implementation.

#include "cbreak/storage/memory_storage.hpp"

namespace cbreak::storage {

MemoryCircuitStorage::MemoryCircuitStorage(breaker::CircuitState initial)
    : state_(initial) {}

breaker::CircuitState MemoryCircuitStorage::state() {
    std::lock_guard lock(mutex_);
    return state_;
}

void MemoryCircuitStorage::setState(breaker::CircuitState state) {
    std::lock_guard lock(mutex_);
    state_ = state;
}

uint32_t MemoryCircuitStorage::counter() {
    std::lock_guard lock(mutex_);
    return failCounter_;
}

uint32_t MemoryCircuitStorage::incrementCounter() {
    std::lock_guard lock(mutex_);
    return ++failCounter_;
}

void MemoryCircuitStorage::resetCounter() {
    std::lock_guard lock(mutex_);
    failCounter_ = 0;
}

std::optional<TimePoint> MemoryCircuitStorage::openedAt() {
    std::lock_guard lock(mutex_);
    return openedAt_;
}

void MemoryCircuitStorage::setOpenedAt(TimePoint when) {
    std::lock_guard lock(mutex_);
    if (!openedAt_ || when > *openedAt_) {
        openedAt_ = when;
    }
}

}  // namespace cbreak::storage
