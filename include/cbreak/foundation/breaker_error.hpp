#pragma once

/// @file breaker_error.hpp
/// @brief Error type used with Result<T, BreakerError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "cbreak/foundation/error_code.hpp"

namespace cbreak::foundation {

/// ErrorCode plus message, with an optional payload of any type.
///
/// A circuit-open error produced by a breaker carries a
/// breaker::CircuitOpenContext describing why the call was refused.
class BreakerError {
public:
    BreakerError() = default;

    explicit BreakerError(ErrorCode code)
        : code_(code) {}

    BreakerError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    BreakerError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// Name of the code's range, e.g. "Breaker" or "Storage".
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// nullptr unless the payload is exactly a T.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// True for errors synthesized by a breaker that refused or replaced a call.
    [[nodiscard]] bool isCircuitOpen() const noexcept {
        return code_ == ErrorCode::CircuitOpen;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace cbreak::foundation
