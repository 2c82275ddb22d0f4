#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the tripwire library.

#include <cstdint>
#include <string_view>

namespace tripwire::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the error source
/// can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,
    ValidationFailed = 0x0006,
    Cancelled = 0x0007,

    // Network (0x0100 - 0x01FF)
    NetworkError = 0x0100,
    ConnectionFailed = 0x0101,
    ConnectionLost = 0x0102,
    Timeout = 0x0103,
    HttpError = 0x0104,

    // Database (0x0200 - 0x02FF)
    DatabaseError = 0x0200,
    QueryFailed = 0x0201,
    TransactionFailed = 0x0202,
    NotConnected = 0x0203,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Resilience (0x0900 - 0x09FF)
    CircuitOpen = 0x0900,
    CircuitBreakerNotFound = 0x0901,
    OperationAborted = 0x0902,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Network";
        case 0x0200: return "Database";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Resilience";
        default: return "Unknown";
    }
}

}  // namespace tripwire::foundation
