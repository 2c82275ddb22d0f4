#pragma once

/// @file circuit_breaker_registry.hpp
/// @brief Name-indexed collection of independent circuit breakers.

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tripwire/foundation/call_result.hpp"
#include "tripwire/resilience/circuit_breaker.hpp"

namespace tripwire::resilience {

/// Health of one breaker or of the whole registry.
enum class HealthStatus : uint8_t {
    Healthy,   ///< Closed
    Degraded,  ///< HalfOpen
    Unhealthy  ///< Open
};

[[nodiscard]] constexpr std::string_view toString(HealthStatus s) {
    switch (s) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Unhealthy:
            return "unhealthy";
    }
    return "unknown";
}

[[nodiscard]] constexpr HealthStatus healthOf(CircuitState s) {
    switch (s) {
        case CircuitState::Closed:
            return HealthStatus::Healthy;
        case CircuitState::HalfOpen:
            return HealthStatus::Degraded;
        case CircuitState::Open:
            return HealthStatus::Unhealthy;
    }
    return HealthStatus::Unhealthy;
}

/// Aggregated health of every registered breaker.
///
/// `overall` is the worst component status, Healthy for an empty registry.
struct RegistryHealthReport {
    HealthStatus overall{HealthStatus::Healthy};
    std::map<std::string, HealthStatus> components;
};

/// Registry owning circuit breakers by stable name.
///
/// Callers refer to a dependency by name instead of passing breaker
/// references around. The registry is an ordinary object: construct one
/// where the application wires its dependencies and hand it (or the
/// breakers it holds) to the code that needs them.
///
/// Example:
/// @code
///   CircuitBreakerRegistry registry;
///   registry.add("inventory", presets::forApi({.name = "inventory"}));
///
///   auto stock = registry.execute("inventory", [&] { return client.stock(sku); });
/// @endcode
///
/// Thread-safe. Lookups take a shared lock; the lock is released before a
/// protected operation runs.
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry() = default;

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    /// Insert @p breaker under @p name, replacing any previous entry.
    /// Null breakers are rejected with InvalidArgument.
    foundation::CallResult<void> add(std::string name, std::shared_ptr<CircuitBreaker> breaker);

    /// Remove the breaker registered under @p name.
    /// @return true if an entry was removed.
    bool remove(std::string_view name);

    /// Breaker registered under @p name, or nullptr.
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get(std::string_view name) const;

    /// Run @p operation through the breaker named @p name.
    ///
    /// Unknown names return ErrorCode::CircuitBreakerNotFound without
    /// touching any breaker.
    template <typename Op>
    auto execute(std::string_view name, Op&& operation) -> std::invoke_result_t<Op&>;

    [[nodiscard]] std::map<std::string, CircuitBreakerStats> allStats() const;

    /// isHealthy() of every breaker, by name.
    [[nodiscard]] std::map<std::string, bool> healthStatus() const;

    [[nodiscard]] RegistryHealthReport healthReport() const;

    void resetAll();

    [[nodiscard]] std::size_t size() const;

    /// Registered names, sorted.
    [[nodiscard]] std::vector<std::string> names() const;

private:
    [[nodiscard]] foundation::Error notFound(std::string_view name) const;

    /// Copy of the entries so breakers can be queried without the registry lock.
    [[nodiscard]] std::vector<std::pair<std::string, std::shared_ptr<CircuitBreaker>>>
    entries() const;

    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    mutable std::shared_mutex mutex_;
};

template <typename Op>
auto CircuitBreakerRegistry::execute(std::string_view name, Op&& operation)
    -> std::invoke_result_t<Op&> {
    using R = std::invoke_result_t<Op&>;
    auto breaker = get(name);
    if (!breaker) {
        return R::err(notFound(name));
    }
    return breaker->execute(std::forward<Op>(operation));
}

}  // namespace tripwire::resilience
