#pragma once

/// @file guard_result.hpp
/// @brief GuardResult<T> type alias for resilience-engine error handling.

#include "callguard/core/result.hpp"
#include "callguard/foundation/guard_error.hpp"

namespace callguard::foundation {

/// Result type specialized with GuardError.
///
/// Every policy returns GuardResult<T>; protected operations may return it
/// too, reporting dependency failures without throwing.
///
/// Example:
/// @code
///   GuardResult<std::string> loadProfile(int id) {
///       if (!db.connected()) {
///           return GuardResult<std::string>::err(
///               GuardError(ErrorCode::ConnectionFailed, "db offline"));
///       }
///       return GuardResult<std::string>::ok(db.profile(id));
///   }
/// @endcode
template <typename T>
using GuardResult = callguard::Result<T, GuardError>;

}  // namespace callguard::foundation
