#pragma once

/// @file circuit_breaker_loader.hpp
/// @brief Build circuit breakers from YAML configuration.
///
/// Expected layout:
/// @code
///   circuit_breakers:
///     payments:
///       preset: api              # api | database | external_service | none
///       failure_threshold: 4
///       recovery_timeout_ms: 15000
///       monitoring_period_ms: 60000
/// @endcode
/// Every field is optional. Omitted fields keep the preset default (or the
/// CircuitBreakerConfig default for `none`). The section name becomes the
/// breaker name.

#include <cstddef>
#include <string_view>

#include "tripwire/foundation/call_result.hpp"
#include "tripwire/foundation/config_manager.hpp"
#include "tripwire/resilience/circuit_breaker_presets.hpp"
#include "tripwire/resilience/circuit_breaker_registry.hpp"

namespace tripwire::resilience {

/// Read the numeric fields of the section at @p prefix into overrides.
/// @return ConfigTypeMismatch if a present field has the wrong type.
foundation::CallResult<CircuitBreakerOverrides> overridesFromConfig(
    const foundation::ConfigManager& config, std::string_view prefix);

/// Build the configuration for the section at @p prefix.
///
/// Precedence, lowest first: preset defaults, @p common, the section's
/// fields. The breaker name is the last component of @p prefix.
/// @return InvalidArgument for an unknown preset, or a config read error.
foundation::CallResult<CircuitBreakerConfig> breakerConfigFromSection(
    const foundation::ConfigManager& config, std::string_view prefix,
    const CircuitBreakerOverrides& common = {});

/// Register one breaker per section under @p root.
///
/// Stops at the first invalid section; breakers registered before it stay
/// registered.
/// @return Number of breakers registered.
foundation::CallResult<std::size_t> loadCircuitBreakers(
    const foundation::ConfigManager& config, CircuitBreakerRegistry& registry,
    const CircuitBreakerOverrides& common = {}, std::string_view root = "circuit_breakers");

}  // namespace tripwire::resilience
