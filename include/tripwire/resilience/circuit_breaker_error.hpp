#pragma once

/// @file circuit_breaker_error.hpp
/// @brief The error returned when a breaker rejects a call without running it.

#include <string>
#include <string_view>
#include <utility>

#include "tripwire/foundation/error.hpp"
#include "tripwire/resilience/circuit_breaker_stats.hpp"

namespace tripwire::resilience {

/// Build the rejection error for breaker @p name.
///
/// The error has ErrorCode::CircuitOpen and carries @p stats as context so
/// callers can inspect the breaker when deciding on a fallback.
[[nodiscard]] inline foundation::Error circuitOpenError(std::string_view name,
                                                       const CircuitBreakerStats& stats) {
    std::string message = "circuit breaker '";
    message += name;
    message += "' is ";
    message += toString(stats.state);
    return foundation::Error(foundation::ErrorCode::CircuitOpen, std::move(message), stats);
}

/// True if @p error is a breaker rejection (the call was never attempted).
[[nodiscard]] inline bool isCircuitOpen(const foundation::Error& error) noexcept {
    return error.code() == foundation::ErrorCode::CircuitOpen;
}

/// Stats snapshot carried by a rejection, or nullptr for any other error.
[[nodiscard]] inline const CircuitBreakerStats* rejectionStats(
    const foundation::Error& error) noexcept {
    if (!isCircuitOpen(error)) {
        return nullptr;
    }
    return error.context<CircuitBreakerStats>();
}

}  // namespace tripwire::resilience
