#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the circuit breaker library.

#include <cstdint>
#include <string_view>

namespace cbreak::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone. Guarded
/// operations report their failures with these codes too, so the
/// subsystem doubles as a coarse error classification that a breaker can
/// exclude as a whole (see ExclusionSet).
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,
    PermissionDenied = 0x0006,
    ServiceUnavailable = 0x0007,

    // Breaker (0x0100 - 0x01FF)
    CircuitOpen = 0x0100,
    OperationFailed = 0x0101,
    OperationThrew = 0x0102,
    InvalidState = 0x0103,

    // Storage (0x0200 - 0x02FF)
    StorageError = 0x0200,
    StorageUnavailable = 0x0201,
    StorageCommandFailed = 0x0202,
    StorageProtocolError = 0x0203,
    StorageTimeout = 0x0204,

    // Network (0x0300 - 0x03FF)
    NetworkError = 0x0300,
    ConnectionFailed = 0x0301,
    ConnectionLost = 0x0302,
    Timeout = 0x0303,
    SendFailed = 0x0304,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    ExecutorStopped = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Subsystem ranges, usable as a whole-category exclusion.
enum class ErrorSubsystem : uint32_t {
    General = 0x0000,
    Breaker = 0x0100,
    Storage = 0x0200,
    Network = 0x0300,
    Config = 0x0600,
    Thread = 0x0700,
    Logger = 0x0800,
};

/// Return the subsystem range a code belongs to.
constexpr ErrorSubsystem subsystemOf(ErrorCode code) {
    return static_cast<ErrorSubsystem>(static_cast<uint32_t>(code) & 0xFF00);
}

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (subsystemOf(code)) {
        case ErrorSubsystem::General: return "General";
        case ErrorSubsystem::Breaker: return "Breaker";
        case ErrorSubsystem::Storage: return "Storage";
        case ErrorSubsystem::Network: return "Network";
        case ErrorSubsystem::Config: return "Config";
        case ErrorSubsystem::Thread: return "Thread";
        case ErrorSubsystem::Logger: return "Logger";
    }
    return "Unknown";
}

} // namespace cbreak::foundation
