#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the call-resilience engine.

#include <cstdint>
#include <string_view>

namespace callguard::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,
    OperationFailed = 0x0006,

    // Downstream (0x0100 - 0x01FF)
    // Reported by protected operations to classify dependency failures.
    DownstreamError = 0x0100,
    ConnectionFailed = 0x0101,
    ConnectionLost = 0x0102,
    QueryFailed = 0x0103,
    Throttled = 0x0104,
    DependencyUnavailable = 0x0105,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    ExecutorStopped = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,

    // Resilience (0x0900 - 0x09FF)
    CircuitOpen = 0x0900,
    BulkheadRejected = 0x0901,
    RetryExhausted = 0x0902,
    DeadlineExceeded = 0x0903,
    ResultTypeMismatch = 0x0904,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Downstream";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        case 0x0900: return "Resilience";
        default: return "Unknown";
    }
}

/// Return the symbolic name of an error code.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:               return "Success";
        case ErrorCode::Unknown:               return "Unknown";
        case ErrorCode::InvalidArgument:       return "InvalidArgument";
        case ErrorCode::NotFound:              return "NotFound";
        case ErrorCode::AlreadyExists:         return "AlreadyExists";
        case ErrorCode::NotImplemented:        return "NotImplemented";
        case ErrorCode::OperationFailed:       return "OperationFailed";
        case ErrorCode::DownstreamError:       return "DownstreamError";
        case ErrorCode::ConnectionFailed:      return "ConnectionFailed";
        case ErrorCode::ConnectionLost:        return "ConnectionLost";
        case ErrorCode::QueryFailed:           return "QueryFailed";
        case ErrorCode::Throttled:             return "Throttled";
        case ErrorCode::DependencyUnavailable: return "DependencyUnavailable";
        case ErrorCode::ConfigLoadFailed:      return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound:     return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch:    return "ConfigTypeMismatch";
        case ErrorCode::ThreadError:           return "ThreadError";
        case ErrorCode::JobScheduleFailed:     return "JobScheduleFailed";
        case ErrorCode::ExecutorStopped:       return "ExecutorStopped";
        case ErrorCode::LoggerError:           return "LoggerError";
        case ErrorCode::LoggerNotInitialized:  return "LoggerNotInitialized";
        case ErrorCode::LoggerFlushFailed:     return "LoggerFlushFailed";
        case ErrorCode::CircuitOpen:           return "CircuitOpen";
        case ErrorCode::BulkheadRejected:      return "BulkheadRejected";
        case ErrorCode::RetryExhausted:        return "RetryExhausted";
        case ErrorCode::DeadlineExceeded:      return "DeadlineExceeded";
        case ErrorCode::ResultTypeMismatch:    return "ResultTypeMismatch";
    }
    return "Unknown";
}

} // namespace callguard::foundation
