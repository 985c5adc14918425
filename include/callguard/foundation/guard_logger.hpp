#pragma once

/// @file guard_logger.hpp
/// @brief GuardLogger wrapping kcenon logger_system for policy diagnostics.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "callguard/foundation/guard_result.hpp"

namespace callguard::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per engine subsystem.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Pipelines and call-site wrappers
    Retry    = 1, ///< Retry attempts and exhaustion
    Timeout  = 2, ///< Deadlines and abandoned workers
    Bulkhead = 3, ///< Slot rejections
    Fallback = 4, ///< Substituted failures
    Circuit  = 5, ///< Breaker state transitions
    Config   = 6, ///< Catalog and configuration loading
    Executor = 7  ///< Worker pool lifecycle
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 8;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Retry", "Timeout", "Bulkhead",
        "Fallback", "Circuit", "Config", "Executor"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
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

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.policy = "circuit";
///   ctx.target = "payments";
///   ctx.extra["failures"] = "5";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Circuit,
///                         "Circuit opened", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> policy;
    std::optional<std::string> target;
    std::optional<uint32_t> attempt;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
/// Policies only emit diagnostics; nothing they decide depends on whether
/// a message was written.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Retry    | Info          |
/// | Timeout  | Info          |
/// | Bulkhead | Info          |
/// | Fallback | Info          |
/// | Circuit  | Info          |
/// | Config   | Info          |
/// | Executor | Warning       |
class GuardLogger {
public:
    GuardLogger();
    ~GuardLogger();

    // Non-copyable, movable.
    GuardLogger(const GuardLogger&) = delete;
    GuardLogger& operator=(const GuardLogger&) = delete;
    GuardLogger(GuardLogger&&) noexcept;
    GuardLogger& operator=(GuardLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GuardResult<void> flush();

    /// Get the global GuardLogger instance.
    static GuardLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse a level name ("debug", "warning", ...); case-insensitive.
[[nodiscard]] GuardResult<LogLevel> parseLogLevel(std::string_view name);

} // namespace callguard::foundation

// ---------------------------------------------------------------------------
// Convenience macros (outside the namespace; macros are global)
// ---------------------------------------------------------------------------

/// @name CALLGUARD_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// CALLGUARD_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef CALLGUARD_MIN_LOG_LEVEL
    #define CALLGUARD_MIN_LOG_LEVEL 0
#endif

#define CALLGUARD_LOG(level, cat, msg)                                                 \
    do {                                                                               \
        _Pragma("GCC diagnostic push")                                                 \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                            \
        if (static_cast<int>(level) >= CALLGUARD_MIN_LOG_LEVEL &&                      \
            ::callguard::foundation::GuardLogger::instance().isEnabled((level), (cat))) \
        {                                                                              \
            ::callguard::foundation::GuardLogger::instance().log((level), (cat), (msg)); \
        }                                                                              \
        _Pragma("GCC diagnostic pop")                                                  \
    } while (0)

#define CALLGUARD_LOG_DEBUG(cat, msg) \
    CALLGUARD_LOG(::callguard::foundation::LogLevel::Debug, (cat), (msg))

#define CALLGUARD_LOG_INFO(cat, msg) \
    CALLGUARD_LOG(::callguard::foundation::LogLevel::Info, (cat), (msg))

#define CALLGUARD_LOG_WARN(cat, msg) \
    CALLGUARD_LOG(::callguard::foundation::LogLevel::Warning, (cat), (msg))

#define CALLGUARD_LOG_ERROR(cat, msg) \
    CALLGUARD_LOG(::callguard::foundation::LogLevel::Error, (cat), (msg))

/// @}
