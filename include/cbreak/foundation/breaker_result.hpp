#pragma once

/// @file breaker_result.hpp
/// @brief BreakerResult<T> type alias used throughout the library.

#include "cbreak/core/result.hpp"
#include "cbreak/foundation/breaker_error.hpp"

namespace cbreak::foundation {

/// Result type specialized with BreakerError.
///
/// Storage clients, configuration access and guarded operations all
/// return BreakerResult<T>.
///
/// Example:
/// @code
///   BreakerResult<std::string> fetchQuote() {
///       if (!connected_) {
///           return BreakerResult<std::string>::err(
///               BreakerError(ErrorCode::ConnectionFailed, "quote service down"));
///       }
///       return BreakerResult<std::string>::ok(readQuote());
///   }
/// @endcode
template <typename T>
using BreakerResult = cbreak::Result<T, BreakerError>;

}  // namespace cbreak::foundation
