/// @file circuit_breaker_registry.cpp
/// @brief CircuitBreakerRegistry implementation.

#include "tripwire/resilience/circuit_breaker_registry.hpp"

#include <algorithm>
#include <mutex>

#include "tripwire/foundation/logger.hpp"

namespace tripwire::resilience {

using foundation::CallResult;
using foundation::Error;
using foundation::ErrorCode;
using foundation::LogCategory;

CallResult<void> CircuitBreakerRegistry::add(std::string name,
                                             std::shared_ptr<CircuitBreaker> breaker) {
    if (!breaker) {
        return CallResult<void>::err(
            Error(ErrorCode::InvalidArgument, "cannot register a null circuit breaker as '" +
                                                  name + "'"));
    }

    bool replaced = false;
    {
        std::unique_lock lock(mutex_);
        auto [it, inserted] = breakers_.insert_or_assign(name, std::move(breaker));
        replaced = !inserted;
    }
    TRIPWIRE_LOG_INFO(LogCategory::Registry,
                      (replaced ? "replaced circuit breaker '" : "registered circuit breaker '") +
                          name + "'");
    return CallResult<void>::ok();
}

bool CircuitBreakerRegistry::remove(std::string_view name) {
    bool removed = false;
    {
        std::unique_lock lock(mutex_);
        removed = breakers_.erase(std::string(name)) > 0;
    }
    if (removed) {
        TRIPWIRE_LOG_INFO(LogCategory::Registry,
                          "removed circuit breaker '" + std::string(name) + "'");
    }
    return removed;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = breakers_.find(std::string(name));
    return it != breakers_.end() ? it->second : nullptr;
}

std::map<std::string, CircuitBreakerStats> CircuitBreakerRegistry::allStats() const {
    std::map<std::string, CircuitBreakerStats> out;
    for (const auto& [name, breaker] : entries()) {
        out.emplace(name, breaker->stats());
    }
    return out;
}

std::map<std::string, bool> CircuitBreakerRegistry::healthStatus() const {
    std::map<std::string, bool> out;
    for (const auto& [name, breaker] : entries()) {
        out.emplace(name, breaker->isHealthy());
    }
    return out;
}

RegistryHealthReport CircuitBreakerRegistry::healthReport() const {
    RegistryHealthReport report;
    for (const auto& [name, breaker] : entries()) {
        auto status = healthOf(breaker->state());
        report.components.emplace(name, status);
        if (static_cast<uint8_t>(status) > static_cast<uint8_t>(report.overall)) {
            report.overall = status;
        }
    }
    return report;
}

void CircuitBreakerRegistry::resetAll() {
    for (const auto& [name, breaker] : entries()) {
        breaker->reset();
    }
}

std::size_t CircuitBreakerRegistry::size() const {
    std::shared_lock lock(mutex_);
    return breakers_.size();
}

std::vector<std::string> CircuitBreakerRegistry::names() const {
    std::vector<std::string> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(breakers_.size());
        for (const auto& [name, breaker] : breakers_) {
            out.push_back(name);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

Error CircuitBreakerRegistry::notFound(std::string_view name) const {
    std::string message = "circuit breaker '" + std::string(name) + "' not found";
    TRIPWIRE_LOG_WARN(LogCategory::Registry, message);
    return Error(ErrorCode::CircuitBreakerNotFound, std::move(message));
}

std::vector<std::pair<std::string, std::shared_ptr<CircuitBreaker>>>
CircuitBreakerRegistry::entries() const {
    std::shared_lock lock(mutex_);
    return {breakers_.begin(), breakers_.end()};
}

}  // namespace tripwire::resilience
