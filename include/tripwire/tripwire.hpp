#pragma once

/// @file tripwire.hpp
/// @brief Aggregate header for the tripwire circuit breaker library.

#include "tripwire/version.hpp"
#include "tripwire/core/result.hpp"
#include "tripwire/foundation/call_result.hpp"
#include "tripwire/foundation/config_manager.hpp"
#include "tripwire/foundation/error.hpp"
#include "tripwire/foundation/error_code.hpp"
#include "tripwire/foundation/logger.hpp"
#include "tripwire/foundation/signal.hpp"
#include "tripwire/resilience/circuit_breaker.hpp"
#include "tripwire/resilience/circuit_breaker_error.hpp"
#include "tripwire/resilience/circuit_breaker_loader.hpp"
#include "tripwire/resilience/circuit_breaker_presets.hpp"
#include "tripwire/resilience/circuit_breaker_registry.hpp"
#include "tripwire/resilience/circuit_breaker_stats.hpp"
#include "tripwire/resilience/protected_call.hpp"
