#pragma once

/// @file protected_call.hpp
/// @brief Lift a function into one that always runs through a circuit breaker.

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "tripwire/resilience/circuit_breaker.hpp"

namespace tripwire::resilience {

/// Wrap @p fn so every call goes through @p breaker.
///
/// The returned callable accepts the same arguments as @p fn and returns
/// the same CallResult<T>. It shares ownership of @p breaker.
///
/// Example:
/// @code
///   auto fetchUser = protect(apiBreaker, [&](uint64_t id) { return api.user(id); });
///   auto user = fetchUser(42);  // rejected fast while apiBreaker is open
/// @endcode
template <typename Fn>
[[nodiscard]] auto protect(std::shared_ptr<CircuitBreaker> breaker, Fn fn) {
    return [breaker = std::move(breaker), fn = std::move(fn)](auto&&... args) mutable {
        return breaker->execute([&]() -> decltype(auto) {
            return std::invoke(fn, std::forward<decltype(args)>(args)...);
        });
    };
}

}  // namespace tripwire::resilience
