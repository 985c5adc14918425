#pragma once

/// @file callguard.hpp
/// @brief Umbrella header for the callguard resilience engine.

#include "callguard/version.hpp"
#include "callguard/core/result.hpp"

#include "callguard/foundation/config_manager.hpp"
#include "callguard/foundation/error_code.hpp"
#include "callguard/foundation/guard_error.hpp"
#include "callguard/foundation/guard_logger.hpp"
#include "callguard/foundation/guard_result.hpp"
#include "callguard/foundation/task_executor.hpp"

#include "callguard/resilience/bulkhead_policy.hpp"
#include "callguard/resilience/circuit_breaker.hpp"
#include "callguard/resilience/circuit_registry.hpp"
#include "callguard/resilience/fallback_policy.hpp"
#include "callguard/resilience/pipeline.hpp"
#include "callguard/resilience/policy.hpp"
#include "callguard/resilience/policy_catalog.hpp"
#include "callguard/resilience/policy_presets.hpp"
#include "callguard/resilience/resilient.hpp"
#include "callguard/resilience/retry_policy.hpp"
#include "callguard/resilience/timeout_policy.hpp"
