/// @file fallback_policy.cpp
/// @brief FallbackPolicy implementation.

#include "callguard/resilience/fallback_policy.hpp"
#include "callguard/foundation/guard_logger.hpp"

namespace callguard::resilience {

using foundation::GuardLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

FallbackPolicy::FallbackPolicy(std::any value, Handler handler,
                               ErrorPredicate appliesTo, bool logFailures)
    : value_(std::move(value)),
      handler_(std::move(handler)),
      appliesTo_(std::move(appliesTo)),
      logFailures_(logFailures) {}

ErasedResult FallbackPolicy::run(const Operation& op) {
    auto result = op();
    if (result.hasValue() || !hasSubstitute()) {
        return result;
    }

    const auto& error = result.error();
    if (appliesTo_ && !appliesTo_(error)) {
        return result;
    }

    substituted_.fetch_add(1, std::memory_order_relaxed);
    if (logFailures_ && GuardLogger::instance().isEnabled(LogLevel::Warning,
                                                           LogCategory::Fallback)) {
        LogContext ctx;
        ctx.policy = "fallback";
        ctx.extra["code"] = std::string(foundation::errorCodeName(error.code()));
        GuardLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Fallback,
            "Substituting fallback for failure: " + std::string(error.message()), ctx);
    }

    if (handler_) {
        return handler_(error);
    }
    return ErasedResult::ok(value_);
}

std::string FallbackPolicy::describe() const {
    if (handler_) {
        return "Fallback(handler)";
    }
    return value_.has_value() ? "Fallback(value)" : "Fallback(none)";
}

} // namespace callguard::resilience
