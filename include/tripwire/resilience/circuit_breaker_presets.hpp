#pragma once

/// @file circuit_breaker_presets.hpp
/// @brief Pre-configured breakers for common dependency classes.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "tripwire/resilience/circuit_breaker.hpp"

namespace tripwire::resilience {

/// Partial configuration. Every set field replaces the preset default.
struct CircuitBreakerOverrides {
    std::optional<std::string> name;
    std::optional<uint32_t> failureThreshold;
    std::optional<std::chrono::milliseconds> recoveryTimeout;
    std::optional<std::chrono::milliseconds> monitoringPeriod;
    std::optional<ExpectedErrorPredicate> expectedErrors;
    std::optional<std::function<void(const StateChangeEvent&)>> onStateChange;
    std::optional<std::function<void(const foundation::Error&)>> onFailure;
    std::optional<std::function<void()>> onSuccess;
    std::optional<std::function<TimePoint()>> clock;
};

/// Apply @p overrides on top of @p base.
[[nodiscard]] CircuitBreakerConfig applyOverrides(CircuitBreakerConfig base,
                                                  const CircuitBreakerOverrides& overrides);

namespace presets {

/// Remote HTTP APIs.
///
/// | Field            | Default |
/// |------------------|---------|
/// | name             | api     |
/// | failureThreshold | 5       |
/// | recoveryTimeout  | 30 s    |
/// | monitoringPeriod | 5 min   |
///
/// HTTP 4xx responses are client-caused and do not count as failures.
[[nodiscard]] CircuitBreakerConfig apiConfig(const CircuitBreakerOverrides& overrides = {});

/// Databases: trips faster (3 failures), recovers after 60 s, monitoring
/// period 10 min. ErrorCode::ValidationFailed does not count as a failure.
[[nodiscard]] CircuitBreakerConfig databaseConfig(const CircuitBreakerOverrides& overrides = {});

/// Third-party services: tolerates 10 failures, recovers after 120 s,
/// monitoring period 15 min. HTTP 429 (rate limited) does not count.
[[nodiscard]] CircuitBreakerConfig externalServiceConfig(
    const CircuitBreakerOverrides& overrides = {});

[[nodiscard]] std::shared_ptr<CircuitBreaker> forApi(const CircuitBreakerOverrides& overrides = {});

[[nodiscard]] std::shared_ptr<CircuitBreaker> forDatabase(
    const CircuitBreakerOverrides& overrides = {});

[[nodiscard]] std::shared_ptr<CircuitBreaker> forExternalService(
    const CircuitBreakerOverrides& overrides = {});

}  // namespace presets

}  // namespace tripwire::resilience
