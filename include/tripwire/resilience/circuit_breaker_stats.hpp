#pragma once

/// @file circuit_breaker_stats.hpp
/// @brief Circuit states, transition events and statistics snapshots.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tripwire::resilience {

/// Time source used for recovery timeouts and statistics.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Circuit breaker states.
enum class CircuitState : uint8_t {
    Closed,   ///< Healthy; calls pass through.
    Open,     ///< Tripped; calls are rejected without being attempted.
    HalfOpen  ///< Probation; a single probe call is admitted.
};

[[nodiscard]] constexpr std::string_view toString(CircuitState s) {
    switch (s) {
        case CircuitState::Closed:
            return "CLOSED";
        case CircuitState::Open:
            return "OPEN";
        case CircuitState::HalfOpen:
            return "HALF_OPEN";
    }
    return "UNKNOWN";
}

/// Published whenever a breaker actually changes state.
struct StateChangeEvent {
    std::string breaker;
    CircuitState from{CircuitState::Closed};
    CircuitState to{CircuitState::Closed};
    TimePoint timestamp{};
};

/// Immutable snapshot of a breaker's counters.
///
/// Counters are cumulative since construction or the last reset().
struct CircuitBreakerStats {
    CircuitState state{CircuitState::Closed};
    uint32_t failures{0};
    uint32_t successes{0};
    uint64_t totalRequests{0};

    /// Calls rejected without being attempted.
    uint64_t rejectedRequests{0};

    std::optional<TimePoint> lastFailureTime;
    std::optional<TimePoint> lastSuccessTime;

    /// Time elapsed since lastSuccessTime; zero if there has been none.
    std::chrono::milliseconds uptime{0};
};

}  // namespace tripwire::resilience
