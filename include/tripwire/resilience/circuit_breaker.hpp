#pragma once

/// @file circuit_breaker.hpp
/// @brief Circuit breaker guarding calls to one unreliable dependency.
///
/// Implements the Closed -> Open -> HalfOpen state machine. Calls made while
/// the circuit is open fail fast with ErrorCode::CircuitOpen; once the
/// recovery timeout has elapsed a single probe call is let through, and its
/// outcome decides whether the circuit closes or re-opens.

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "tripwire/foundation/call_result.hpp"
#include "tripwire/foundation/signal.hpp"
#include "tripwire/resilience/circuit_breaker_error.hpp"
#include "tripwire/resilience/circuit_breaker_stats.hpp"

namespace tripwire::resilience {

/// Returns true for errors that are not the dependency's fault.
using ExpectedErrorPredicate = std::function<bool(const foundation::Error&)>;

/// Exception thrown by a protected operation, or nullptr.
///
/// When an operation throws, the breaker records an OperationAborted error
/// whose context holds the std::exception_ptr, so an ExpectedErrorPredicate
/// can classify exceptions too:
/// @code
///   config.expectedErrors = [](const Error& e) {
///       if (const auto* thrown = thrownException(e)) {
///           try {
///               std::rethrow_exception(*thrown);
///           } catch (const RequestCancelled&) {
///               return true;
///           } catch (const std::exception&) {
///               return false;
///           }
///       }
///       return false;
///   };
/// @endcode
[[nodiscard]] inline const std::exception_ptr* thrownException(
    const foundation::Error& error) noexcept {
    if (error.code() != foundation::ErrorCode::OperationAborted) {
        return nullptr;
    }
    return error.context<std::exception_ptr>();
}

/// Configuration for a CircuitBreaker. Immutable once the breaker exists.
struct CircuitBreakerConfig {
    /// Name used in logs, events and rejection messages.
    std::string name = "default";

    /// Counted failures that trip the circuit from Closed to Open.
    /// Zero is treated as one.
    uint32_t failureThreshold = 5;

    /// How long the circuit stays Open before a probe is allowed.
    std::chrono::milliseconds recoveryTimeout{60'000};

    /// Reserved for a sliding-window policy. Counters are currently
    /// cumulative and this value is only reported.
    std::chrono::milliseconds monitoringPeriod{300'000};

    /// Classifies errors that must not count toward tripping.
    ExpectedErrorPredicate expectedErrors;

    /// Optional observers, connected before any other subscriber.
    std::function<void(const StateChangeEvent&)> onStateChange;
    std::function<void(const foundation::Error&)> onFailure;
    std::function<void()> onSuccess;

    /// Time source; defaults to steady_clock::now. Tests inject a manual clock.
    std::function<TimePoint()> clock;
};

namespace detail {

template <typename R>
struct IsCallResult : std::false_type {};

template <typename T>
struct IsCallResult<foundation::CallResult<T>> : std::true_type {};

}  // namespace detail

/// Circuit breaker wrapping calls to a single dependency.
///
/// Usage:
/// @code
///   CircuitBreaker cb(CircuitBreakerConfig{
///       .name = "billing",
///       .failureThreshold = 3,
///       .recoveryTimeout = std::chrono::seconds(10)});
///
///   auto invoice = cb.execute([&] { return billing.fetchInvoice(id); });
///   if (!invoice && isCircuitOpen(invoice.error())) {
///       // fast-failed; billing was not contacted
///   }
/// @endcode
///
/// Thread-safe: admission and outcome recording each run under one mutex,
/// the protected operation runs outside it. At most one probe is in flight
/// while HalfOpen; concurrent callers are rejected until it completes.
/// Observers are notified after the mutex is released.
class CircuitBreaker {
public:
    explicit CircuitBreaker(CircuitBreakerConfig config = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    /// Run @p operation under breaker protection.
    ///
    /// @p operation takes no arguments and returns CallResult<T>. Its result
    /// is returned unchanged; an error result counts as a failure unless
    /// expectedErrors() accepts it. If the circuit rejects the call, the
    /// operation is not invoked and a CircuitOpen error is returned. An
    /// exception thrown by the operation is recorded as a failure and
    /// rethrown.
    ///
    /// Exceptions thrown by observers or by expectedErrors() propagate to
    /// the caller. The probe slot is released on every exit path, so such
    /// an exception never leaves the breaker stuck in HalfOpen.
    template <typename Op>
    auto execute(Op&& operation) -> std::invoke_result_t<Op&>;

    /// Snapshot of state and counters.
    [[nodiscard]] CircuitBreakerStats stats() const;

    [[nodiscard]] CircuitState state() const;

    /// True while Closed.
    [[nodiscard]] bool isHealthy() const;

    /// failures / totalRequests as a percentage; 0 when nothing was requested.
    [[nodiscard]] double failureRate() const;

    /// Return to Closed and zero every counter and timestamp.
    void reset();

    /// Jump straight to @p newState (tests, manual override).
    /// Forcing Open restarts the recovery timeout.
    void forceState(CircuitState newState);

    [[nodiscard]] std::string_view name() const noexcept { return config_.name; }

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

    // ── Observers ────────────────────────────────────────────────────────

    [[nodiscard]] foundation::Signal<const StateChangeEvent&>& stateChanged() noexcept {
        return stateChanged_;
    }

    /// Fires for every counted (non-expected) failure.
    [[nodiscard]] foundation::Signal<const foundation::Error&>& failed() noexcept {
        return failed_;
    }

    [[nodiscard]] foundation::Signal<>& succeeded() noexcept { return succeeded_; }

private:
    /// Admission granted to one call. A non-zero probe id marks the HalfOpen probe.
    struct Ticket {
        uint64_t probe = 0;
    };

    /// Events gathered under the lock and published after it is released.
    struct Notifications {
        bool success = false;
        std::optional<foundation::Error> failure;
        std::vector<StateChangeEvent> transitions;
    };

    struct Admission {
        Ticket ticket;
        Notifications notes;
    };

    /// Releases the ticket's probe slot when execute() exits.
    class ProbeGuard {
    public:
        ProbeGuard(CircuitBreaker& breaker, Ticket ticket) noexcept
            : breaker_(breaker), ticket_(ticket) {}
        ~ProbeGuard() { breaker_.abandonProbe(ticket_); }

        ProbeGuard(const ProbeGuard&) = delete;
        ProbeGuard& operator=(const ProbeGuard&) = delete;

    private:
        CircuitBreaker& breaker_;
        Ticket ticket_;
    };

    foundation::CallResult<Admission> admit();
    void abandonProbe(Ticket ticket);
    void recordSuccess(Ticket ticket);
    void recordFailure(Ticket ticket, const foundation::Error& error);

    // Callers hold mutex_.
    void transitionTo(CircuitState newState, TimePoint now, Notifications& out);
    void releaseProbe(Ticket ticket);
    [[nodiscard]] CircuitBreakerStats snapshot(TimePoint now) const;

    void publish(const Notifications& notes);
    [[nodiscard]] TimePoint now() const;

    CircuitBreakerConfig config_;

    foundation::Signal<const StateChangeEvent&> stateChanged_;
    foundation::Signal<const foundation::Error&> failed_;
    foundation::Signal<> succeeded_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    uint32_t failures_{0};
    uint32_t successes_{0};
    uint64_t totalRequests_{0};
    uint64_t rejectedRequests_{0};
    std::optional<TimePoint> lastFailureTime_;
    std::optional<TimePoint> lastSuccessTime_;
    TimePoint nextAttempt_{};
    uint64_t activeProbe_{0};
    uint64_t nextProbeId_{1};
};

template <typename Op>
auto CircuitBreaker::execute(Op&& operation) -> std::invoke_result_t<Op&> {
    using R = std::invoke_result_t<Op&>;
    static_assert(detail::IsCallResult<R>::value,
                  "protected operations must return CallResult<T>");

    auto admission = admit();
    if (admission.hasError()) {
        return R::err(std::move(admission).error());
    }
    const Ticket ticket = admission.value().ticket;
    ProbeGuard guard(*this, ticket);
    publish(admission.value().notes);

    // Only exceptions from the operation itself are recorded as failures.
    std::optional<R> result;
    try {
        result.emplace(operation());
    } catch (const std::exception& e) {
        recordFailure(ticket, foundation::Error(foundation::ErrorCode::OperationAborted,
                                                std::string("operation threw: ") + e.what(),
                                                std::current_exception()));
        throw;
    } catch (...) {
        recordFailure(ticket, foundation::Error(foundation::ErrorCode::OperationAborted,
                                                "operation threw a non-standard exception",
                                                std::current_exception()));
        throw;
    }

    if (result->hasValue()) {
        recordSuccess(ticket);
    } else {
        recordFailure(ticket, result->error());
    }
    return std::move(*result);
}

}  // namespace tripwire::resilience
