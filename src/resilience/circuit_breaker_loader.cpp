/// @file circuit_breaker_loader.cpp
/// @brief YAML configuration loading for circuit breakers.

#include "tripwire/resilience/circuit_breaker_loader.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "tripwire/foundation/logger.hpp"

namespace tripwire::resilience {

using foundation::CallResult;
using foundation::ConfigManager;
using foundation::Error;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

std::string joinKey(std::string_view prefix, std::string_view leaf) {
    std::string key(prefix);
    key += '.';
    key += leaf;
    return key;
}

/// Read an optional key into @p out. Missing keys leave @p out untouched.
template <typename T, typename Out>
CallResult<void> readOptional(const ConfigManager& config, const std::string& key, Out& out) {
    if (!config.hasKey(key)) {
        return CallResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (value.hasError()) {
        return CallResult<void>::err(value.error());
    }
    out = Out(value.value());
    return CallResult<void>::ok();
}

std::string_view lastComponent(std::string_view prefix) {
    auto dot = prefix.rfind('.');
    return dot == std::string_view::npos ? prefix : prefix.substr(dot + 1);
}

}  // namespace

CallResult<CircuitBreakerOverrides> overridesFromConfig(const ConfigManager& config,
                                                        std::string_view prefix) {
    CircuitBreakerOverrides overrides;

    std::optional<int64_t> recoveryMs;
    std::optional<int64_t> monitoringMs;

    auto threshold = readOptional<uint32_t>(config, joinKey(prefix, "failure_threshold"),
                                            overrides.failureThreshold);
    if (threshold.hasError()) {
        return CallResult<CircuitBreakerOverrides>::err(threshold.error());
    }
    auto recovery = readOptional<int64_t>(config, joinKey(prefix, "recovery_timeout_ms"),
                                          recoveryMs);
    if (recovery.hasError()) {
        return CallResult<CircuitBreakerOverrides>::err(recovery.error());
    }
    auto monitoring = readOptional<int64_t>(config, joinKey(prefix, "monitoring_period_ms"),
                                            monitoringMs);
    if (monitoring.hasError()) {
        return CallResult<CircuitBreakerOverrides>::err(monitoring.error());
    }

    if (recoveryMs) {
        if (*recoveryMs < 0) {
            return CallResult<CircuitBreakerOverrides>::err(
                Error(ErrorCode::InvalidArgument,
                      "negative recovery_timeout_ms in " + std::string(prefix)));
        }
        overrides.recoveryTimeout = std::chrono::milliseconds(*recoveryMs);
    }
    if (monitoringMs) {
        if (*monitoringMs < 0) {
            return CallResult<CircuitBreakerOverrides>::err(
                Error(ErrorCode::InvalidArgument,
                      "negative monitoring_period_ms in " + std::string(prefix)));
        }
        overrides.monitoringPeriod = std::chrono::milliseconds(*monitoringMs);
    }
    return CallResult<CircuitBreakerOverrides>::ok(std::move(overrides));
}

CallResult<CircuitBreakerConfig> breakerConfigFromSection(const ConfigManager& config,
                                                          std::string_view prefix,
                                                          const CircuitBreakerOverrides& common) {
    std::string preset = "none";
    auto presetRead = readOptional<std::string>(config, joinKey(prefix, "preset"), preset);
    if (presetRead.hasError()) {
        return CallResult<CircuitBreakerConfig>::err(presetRead.error());
    }

    CircuitBreakerConfig base;
    if (preset == "api") {
        base = presets::apiConfig();
    } else if (preset == "database") {
        base = presets::databaseConfig();
    } else if (preset == "external_service") {
        base = presets::externalServiceConfig();
    } else if (preset != "none") {
        return CallResult<CircuitBreakerConfig>::err(
            Error(ErrorCode::InvalidArgument,
                  "unknown circuit breaker preset '" + preset + "' in " + std::string(prefix)));
    }

    auto section = overridesFromConfig(config, prefix);
    if (section.hasError()) {
        return CallResult<CircuitBreakerConfig>::err(section.error());
    }
    section.value().name = std::string(lastComponent(prefix));

    auto merged = applyOverrides(applyOverrides(std::move(base), common), section.value());
    return CallResult<CircuitBreakerConfig>::ok(std::move(merged));
}

CallResult<std::size_t> loadCircuitBreakers(const ConfigManager& config,
                                            CircuitBreakerRegistry& registry,
                                            const CircuitBreakerOverrides& common,
                                            std::string_view root) {
    std::size_t count = 0;
    for (const auto& name : config.keysUnder(root)) {
        auto breakerConfig = breakerConfigFromSection(config, joinKey(root, name), common);
        if (breakerConfig.hasError()) {
            TRIPWIRE_LOG_ERROR(LogCategory::Config,
                               "invalid circuit breaker section '" + name + "': " +
                                   std::string(breakerConfig.error().message()));
            return CallResult<std::size_t>::err(breakerConfig.error());
        }

        auto added = registry.add(
            name, std::make_shared<CircuitBreaker>(std::move(breakerConfig).value()));
        if (added.hasError()) {
            return CallResult<std::size_t>::err(added.error());
        }
        ++count;
    }

    TRIPWIRE_LOG_INFO(LogCategory::Config,
                      "loaded " + std::to_string(count) + " circuit breaker(s) from '" +
                          std::string(root) + "'");
    return CallResult<std::size_t>::ok(count);
}

}  // namespace tripwire::resilience
