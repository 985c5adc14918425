/// @file guard_logger.cpp
/// @brief GuardLogger implementation wrapping kcenon logger_system.

#include "callguard/foundation/guard_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace callguard::foundation {

// ---------------------------------------------------------------------------
// Level mapping: callguard -> kcenon
// ---------------------------------------------------------------------------
static kcenon::common::interfaces::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kcenon::common::interfaces::log_level::trace;
        case LogLevel::Debug:    return kcenon::common::interfaces::log_level::debug;
        case LogLevel::Info:     return kcenon::common::interfaces::log_level::info;
        case LogLevel::Warning:  return kcenon::common::interfaces::log_level::warning;
        case LogLevel::Error:    return kcenon::common::interfaces::log_level::error;
        case LogLevel::Critical: return kcenon::common::interfaces::log_level::critical;
        case LogLevel::Off:      return kcenon::common::interfaces::log_level::off;
    }
    return kcenon::common::interfaces::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,    // Core
    LogLevel::Info,    // Retry
    LogLevel::Info,    // Timeout
    LogLevel::Info,    // Bulkhead
    LogLevel::Info,    // Fallback
    LogLevel::Info,    // Circuit
    LogLevel::Info,    // Config
    LogLevel::Warning  // Executor
};

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------
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

    if (ctx.policy && !ctx.policy->empty()) {
        append("policy", *ctx.policy);
    }
    if (ctx.target && !ctx.target->empty()) {
        append("target", *ctx.target);
    }
    if (ctx.attempt) {
        append("attempt", std::to_string(*ctx.attempt));
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GuardLogger::Impl {
    // Per-category log levels (atomic for lock-free reads on the hot path)
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers registered in GlobalLoggerRegistry, one per category
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("callguard.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kcenon::common::interfaces::ILogger> getLogger(
        LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kcenon::common::interfaces::GlobalLoggerRegistry::null_logger();
        }
        // Named logger first, default logger when the category has none.
        auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        // A NullLogger reports every level disabled.
        if (!logger->is_enabled(kcenon::common::interfaces::log_level::off)) {
            auto defaultLogger = registry.get_default_logger();
            if (defaultLogger->is_enabled(kcenon::common::interfaces::log_level::off)
                || defaultLogger != kcenon::common::interfaces::GlobalLoggerRegistry::null_logger()) {
                return defaultLogger;
            }
        }
        return logger;
    }

    void write(LogLevel level, LogCategory cat, std::string_view msg,
               std::string_view ctxStr) const {
        auto logger = getLogger(cat);

        // Format: [Category] message {key=val, ...}
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

        // A failing sink must never disturb the protected call.
        (void)logger->log(mapLevel(level), formatted);
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
GuardLogger::GuardLogger() : impl_(std::make_unique<Impl>()) {}

GuardLogger::~GuardLogger() = default;

GuardLogger::GuardLogger(GuardLogger&&) noexcept = default;
GuardLogger& GuardLogger::operator=(GuardLogger&&) noexcept = default;

void GuardLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, {});
}

void GuardLogger::logWithContext(LogLevel level, LogCategory cat,
                                 std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, formatContext(ctx));
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void GuardLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GuardLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GuardLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

GuardResult<void> GuardLogger::flush() {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return GuardResult<void>::err(
            GuardError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GuardResult<void>::ok();
}

GuardLogger& GuardLogger::instance() {
    static GuardLogger inst;
    return inst;
}

GuardResult<LogLevel> parseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") { return GuardResult<LogLevel>::ok(LogLevel::Trace); }
    if (lowered == "debug") { return GuardResult<LogLevel>::ok(LogLevel::Debug); }
    if (lowered == "info") { return GuardResult<LogLevel>::ok(LogLevel::Info); }
    if (lowered == "warning" || lowered == "warn") {
        return GuardResult<LogLevel>::ok(LogLevel::Warning);
    }
    if (lowered == "error") { return GuardResult<LogLevel>::ok(LogLevel::Error); }
    if (lowered == "critical") { return GuardResult<LogLevel>::ok(LogLevel::Critical); }
    if (lowered == "off") { return GuardResult<LogLevel>::ok(LogLevel::Off); }

    return GuardResult<LogLevel>::err(
        GuardError(ErrorCode::InvalidArgument,
                   "unknown log level: " + std::string(name)));
}

} // namespace callguard::foundation
