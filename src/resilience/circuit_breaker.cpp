/// @file circuit_breaker.cpp
/// @brief CircuitBreaker state machine implementation.

#include "tripwire/resilience/circuit_breaker.hpp"

#include "tripwire/foundation/logger.hpp"

namespace tripwire::resilience {

using foundation::CallResult;
using foundation::Error;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::Logger;

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(std::move(config)) {
    if (config_.failureThreshold == 0) {
        config_.failureThreshold = 1;
    }
    if (!config_.clock) {
        config_.clock = [] { return Clock::now(); };
    }
    stateChanged_.connect(config_.onStateChange);
    failed_.connect(config_.onFailure);
    succeeded_.connect(config_.onSuccess);
}

CallResult<CircuitBreaker::Admission> CircuitBreaker::admit() {
    Admission admission;
    std::optional<Error> rejection;
    {
        std::lock_guard lock(mutex_);
        ++totalRequests_;

        const auto current = now();
        switch (state_) {
            case CircuitState::Closed:
                break;

            case CircuitState::Open:
                if (current < nextAttempt_) {
                    ++rejectedRequests_;
                    rejection = circuitOpenError(config_.name, snapshot(current));
                    break;
                }
                transitionTo(CircuitState::HalfOpen, current, admission.notes);
                admission.ticket.probe = activeProbe_ = nextProbeId_++;
                break;

            case CircuitState::HalfOpen:
                if (activeProbe_ != 0) {
                    ++rejectedRequests_;
                    rejection = circuitOpenError(config_.name, snapshot(current));
                    break;
                }
                admission.ticket.probe = activeProbe_ = nextProbeId_++;
                break;
        }
    }

    if (rejection) {
        TRIPWIRE_LOG_DEBUG(LogCategory::Breaker,
                           std::string(rejection->message()) + ", call rejected");
        return CallResult<Admission>::err(std::move(*rejection));
    }
    return CallResult<Admission>::ok(std::move(admission));
}

void CircuitBreaker::abandonProbe(Ticket ticket) {
    if (ticket.probe == 0) {
        return;
    }
    std::lock_guard lock(mutex_);
    releaseProbe(ticket);
}

void CircuitBreaker::recordSuccess(Ticket ticket) {
    Notifications notes;
    {
        std::lock_guard lock(mutex_);
        const auto current = now();
        releaseProbe(ticket);

        ++successes_;
        lastSuccessTime_ = current;
        notes.success = true;

        if (state_ == CircuitState::HalfOpen) {
            failures_ = 0;
            transitionTo(CircuitState::Closed, current, notes);
        }
    }
    publish(notes);
}

void CircuitBreaker::recordFailure(Ticket ticket, const Error& error) {
    const bool expected = config_.expectedErrors && config_.expectedErrors(error);

    Notifications notes;
    {
        std::lock_guard lock(mutex_);
        releaseProbe(ticket);
        if (expected) {
            return;
        }

        const auto current = now();
        ++failures_;
        lastFailureTime_ = current;
        notes.failure = error;

        if (state_ == CircuitState::HalfOpen || failures_ >= config_.failureThreshold) {
            transitionTo(CircuitState::Open, current, notes);
            nextAttempt_ = current + config_.recoveryTimeout;
        }
    }
    publish(notes);
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::lock_guard lock(mutex_);
    return snapshot(now());
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

bool CircuitBreaker::isHealthy() const {
    return state() == CircuitState::Closed;
}

double CircuitBreaker::failureRate() const {
    std::lock_guard lock(mutex_);
    if (totalRequests_ == 0) {
        return 0.0;
    }
    return static_cast<double>(failures_) / static_cast<double>(totalRequests_) * 100.0;
}

void CircuitBreaker::reset() {
    {
        std::lock_guard lock(mutex_);
        state_ = CircuitState::Closed;
        failures_ = 0;
        successes_ = 0;
        totalRequests_ = 0;
        rejectedRequests_ = 0;
        lastFailureTime_.reset();
        lastSuccessTime_.reset();
        nextAttempt_ = {};
        activeProbe_ = 0;
    }
    LogContext ctx;
    ctx.breaker = config_.name;
    Logger::instance().logWithContext(LogLevel::Info, LogCategory::Breaker,
                                      "circuit breaker reset", ctx);
}

void CircuitBreaker::forceState(CircuitState newState) {
    Notifications notes;
    {
        std::lock_guard lock(mutex_);
        const auto current = now();
        activeProbe_ = 0;
        transitionTo(newState, current, notes);
        if (newState == CircuitState::Open) {
            nextAttempt_ = current + config_.recoveryTimeout;
        }
    }
    publish(notes);
}

void CircuitBreaker::transitionTo(CircuitState newState, TimePoint now, Notifications& out) {
    if (state_ == newState) {
        return;
    }
    out.transitions.push_back(StateChangeEvent{config_.name, state_, newState, now});
    state_ = newState;
}

void CircuitBreaker::releaseProbe(Ticket ticket) {
    // A reset or forced transition may have already retired this probe.
    if (ticket.probe != 0 && ticket.probe == activeProbe_) {
        activeProbe_ = 0;
    }
}

CircuitBreakerStats CircuitBreaker::snapshot(TimePoint now) const {
    CircuitBreakerStats s;
    s.state = state_;
    s.failures = failures_;
    s.successes = successes_;
    s.totalRequests = totalRequests_;
    s.rejectedRequests = rejectedRequests_;
    s.lastFailureTime = lastFailureTime_;
    s.lastSuccessTime = lastSuccessTime_;
    if (lastSuccessTime_ && now > *lastSuccessTime_) {
        s.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(now - *lastSuccessTime_);
    }
    return s;
}

void CircuitBreaker::publish(const Notifications& notes) {
    if (notes.success) {
        succeeded_.emit();
    }
    if (notes.failure) {
        failed_.emit(*notes.failure);
    }

    for (const auto& event : notes.transitions) {
        auto& logger = Logger::instance();
        const auto level = event.to == CircuitState::Open ? LogLevel::Warning : LogLevel::Info;
        if (logger.isEnabled(level, LogCategory::Breaker)) {
            LogContext ctx;
            ctx.breaker = event.breaker;
            ctx.extra["from"] = std::string(toString(event.from));
            ctx.extra["to"] = std::string(toString(event.to));
            logger.logWithContext(level, LogCategory::Breaker, "circuit state changed", ctx);
        }
        stateChanged_.emit(event);
    }
}

TimePoint CircuitBreaker::now() const {
    return config_.clock();
}

}  // namespace tripwire::resilience
