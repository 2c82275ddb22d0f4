/// @file circuit_breaker_presets.cpp
/// @brief Preset configurations for API, database and external service breakers.

#include "tripwire/resilience/circuit_breaker_presets.hpp"

namespace tripwire::resilience {

using namespace std::chrono_literals;
using foundation::Error;
using foundation::ErrorCode;

CircuitBreakerConfig applyOverrides(CircuitBreakerConfig base,
                                    const CircuitBreakerOverrides& overrides) {
    if (overrides.name) {
        base.name = *overrides.name;
    }
    if (overrides.failureThreshold) {
        base.failureThreshold = *overrides.failureThreshold;
    }
    if (overrides.recoveryTimeout) {
        base.recoveryTimeout = *overrides.recoveryTimeout;
    }
    if (overrides.monitoringPeriod) {
        base.monitoringPeriod = *overrides.monitoringPeriod;
    }
    if (overrides.expectedErrors) {
        base.expectedErrors = *overrides.expectedErrors;
    }
    if (overrides.onStateChange) {
        base.onStateChange = *overrides.onStateChange;
    }
    if (overrides.onFailure) {
        base.onFailure = *overrides.onFailure;
    }
    if (overrides.onSuccess) {
        base.onSuccess = *overrides.onSuccess;
    }
    if (overrides.clock) {
        base.clock = *overrides.clock;
    }
    return base;
}

namespace presets {

CircuitBreakerConfig apiConfig(const CircuitBreakerOverrides& overrides) {
    CircuitBreakerConfig config;
    config.name = "api";
    config.failureThreshold = 5;
    config.recoveryTimeout = 30s;
    config.monitoringPeriod = 5min;
    config.expectedErrors = [](const Error& error) {
        const auto* status = error.context<foundation::HttpStatus>();
        return status != nullptr && status->isClientError();
    };
    return applyOverrides(std::move(config), overrides);
}

CircuitBreakerConfig databaseConfig(const CircuitBreakerOverrides& overrides) {
    CircuitBreakerConfig config;
    config.name = "database";
    config.failureThreshold = 3;
    config.recoveryTimeout = 60s;
    config.monitoringPeriod = 10min;
    config.expectedErrors = [](const Error& error) {
        return error.code() == ErrorCode::ValidationFailed;
    };
    return applyOverrides(std::move(config), overrides);
}

CircuitBreakerConfig externalServiceConfig(const CircuitBreakerOverrides& overrides) {
    CircuitBreakerConfig config;
    config.name = "external-service";
    config.failureThreshold = 10;
    config.recoveryTimeout = 120s;
    config.monitoringPeriod = 15min;
    config.expectedErrors = [](const Error& error) {
        return foundation::httpStatusOf(error) == 429;
    };
    return applyOverrides(std::move(config), overrides);
}

std::shared_ptr<CircuitBreaker> forApi(const CircuitBreakerOverrides& overrides) {
    return std::make_shared<CircuitBreaker>(apiConfig(overrides));
}

std::shared_ptr<CircuitBreaker> forDatabase(const CircuitBreakerOverrides& overrides) {
    return std::make_shared<CircuitBreaker>(databaseConfig(overrides));
}

std::shared_ptr<CircuitBreaker> forExternalService(const CircuitBreakerOverrides& overrides) {
    return std::make_shared<CircuitBreaker>(externalServiceConfig(overrides));
}

}  // namespace presets

}  // namespace tripwire::resilience
