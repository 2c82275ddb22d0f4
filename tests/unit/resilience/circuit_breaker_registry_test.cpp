/// @file circuit_breaker_registry_test.cpp
/// @brief Unit tests for CircuitBreakerRegistry.

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "tripwire/resilience/circuit_breaker_presets.hpp"
#include "tripwire/resilience/circuit_breaker_registry.hpp"

using namespace tripwire::resilience;
using namespace tripwire::foundation;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<CircuitBreaker> makeBreaker(std::string name, uint32_t threshold = 2) {
    return std::make_shared<CircuitBreaker>(CircuitBreakerConfig{
        .name = std::move(name),
        .failureThreshold = threshold,
        .recoveryTimeout = 60s,
    });
}

CallResult<std::string> unavailable() {
    return CallResult<std::string>::err(Error(ErrorCode::ConnectionLost, "peer reset"));
}

}  // namespace

class CircuitBreakerRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(registry_.add("orders", makeBreaker("orders")).hasValue());
        ASSERT_TRUE(registry_.add("ledger", makeBreaker("ledger")).hasValue());
    }

    void tripOrders() {
        for (int i = 0; i < 2; ++i) {
            (void)registry_.execute("orders", [] { return unavailable(); });
        }
        ASSERT_EQ(registry_.get("orders")->state(), CircuitState::Open);
    }

    CircuitBreakerRegistry registry_;
};

// ===========================================================================
// Registration and lookup
// ===========================================================================

TEST_F(CircuitBreakerRegistryTest, GetReturnsRegisteredBreaker) {
    auto orders = registry_.get("orders");
    ASSERT_NE(orders, nullptr);
    EXPECT_EQ(orders->name(), "orders");
    EXPECT_EQ(registry_.size(), 2u);
}

TEST_F(CircuitBreakerRegistryTest, GetUnknownReturnsNull) {
    EXPECT_EQ(registry_.get("shipping"), nullptr);
}

TEST_F(CircuitBreakerRegistryTest, AddReplacesExistingEntry) {
    auto replacement = makeBreaker("orders-v2");
    ASSERT_TRUE(registry_.add("orders", replacement).hasValue());

    EXPECT_EQ(registry_.get("orders"), replacement);
    EXPECT_EQ(registry_.size(), 2u);
}

TEST_F(CircuitBreakerRegistryTest, AddRejectsNullBreaker) {
    auto result = registry_.add("ghost", nullptr);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(registry_.get("ghost"), nullptr);
}

TEST_F(CircuitBreakerRegistryTest, RemoveDropsEntry) {
    EXPECT_TRUE(registry_.remove("ledger"));
    EXPECT_FALSE(registry_.remove("ledger"));
    EXPECT_EQ(registry_.get("ledger"), nullptr);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(CircuitBreakerRegistryTest, NamesAreSorted) {
    ASSERT_TRUE(registry_.add("accounts", makeBreaker("accounts")).hasValue());
    const std::vector<std::string> expected = {"accounts", "ledger", "orders"};
    EXPECT_EQ(registry_.names(), expected);
}

TEST_F(CircuitBreakerRegistryTest, RemovedBreakerOutlivesRegistryEntry) {
    auto ledger = registry_.get("ledger");
    ASSERT_TRUE(registry_.remove("ledger"));
    EXPECT_TRUE(ledger->execute([] { return CallResult<int>::ok(1); }).hasValue());
}

// ===========================================================================
// execute by name
// ===========================================================================

TEST_F(CircuitBreakerRegistryTest, ExecuteRunsThroughNamedBreaker) {
    auto result = registry_.execute("ledger", [] { return CallResult<int>::ok(99); });
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 99);
    EXPECT_EQ(registry_.get("ledger")->stats().successes, 1u);
    EXPECT_EQ(registry_.get("orders")->stats().totalRequests, 0u);
}

TEST_F(CircuitBreakerRegistryTest, ExecuteUnknownNameReturnsNotFound) {
    bool invoked = false;
    auto result = registry_.execute("shipping", [&] {
        invoked = true;
        return CallResult<int>::ok(1);
    });

    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CircuitBreakerNotFound);
    EXPECT_EQ(result.error().message(), "circuit breaker 'shipping' not found");
    EXPECT_FALSE(isCircuitOpen(result.error()));
    EXPECT_FALSE(invoked);

    // A miss is not charged to any registered breaker.
    EXPECT_EQ(registry_.get("orders")->stats().totalRequests, 0u);
    EXPECT_EQ(registry_.get("ledger")->stats().totalRequests, 0u);
}

TEST_F(CircuitBreakerRegistryTest, BreakersAreIndependent) {
    tripOrders();

    auto rejected = registry_.execute("orders", [] { return CallResult<int>::ok(1); });
    ASSERT_TRUE(rejected.hasError());
    EXPECT_TRUE(isCircuitOpen(rejected.error()));

    auto passed = registry_.execute("ledger", [] { return CallResult<int>::ok(2); });
    EXPECT_TRUE(passed.hasValue());
}

// ===========================================================================
// Aggregate views
// ===========================================================================

TEST_F(CircuitBreakerRegistryTest, AllStatsCoversEveryBreaker) {
    (void)registry_.execute("ledger", [] { return CallResult<int>::ok(1); });

    auto stats = registry_.allStats();
    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats.at("ledger").successes, 1u);
    EXPECT_EQ(stats.at("orders").totalRequests, 0u);
}

TEST_F(CircuitBreakerRegistryTest, HealthStatusReflectsOpenBreakers) {
    tripOrders();

    auto health = registry_.healthStatus();
    ASSERT_EQ(health.size(), 2u);
    EXPECT_FALSE(health.at("orders"));
    EXPECT_TRUE(health.at("ledger"));
}

TEST_F(CircuitBreakerRegistryTest, HealthReportUsesWorstComponent) {
    EXPECT_EQ(registry_.healthReport().overall, HealthStatus::Healthy);

    registry_.get("ledger")->forceState(CircuitState::HalfOpen);
    auto degraded = registry_.healthReport();
    EXPECT_EQ(degraded.overall, HealthStatus::Degraded);
    EXPECT_EQ(degraded.components.at("ledger"), HealthStatus::Degraded);
    EXPECT_EQ(degraded.components.at("orders"), HealthStatus::Healthy);

    tripOrders();
    auto unhealthy = registry_.healthReport();
    EXPECT_EQ(unhealthy.overall, HealthStatus::Unhealthy);
    EXPECT_EQ(unhealthy.components.at("orders"), HealthStatus::Unhealthy);
}

TEST(CircuitBreakerRegistryEmptyTest, EmptyRegistryIsHealthy) {
    CircuitBreakerRegistry registry;
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.allStats().empty());
    EXPECT_TRUE(registry.healthStatus().empty());
    EXPECT_EQ(registry.healthReport().overall, HealthStatus::Healthy);
    EXPECT_NO_THROW(registry.resetAll());
}

TEST_F(CircuitBreakerRegistryTest, ResetAllClosesEveryBreaker) {
    tripOrders();
    registry_.get("ledger")->forceState(CircuitState::Open);

    registry_.resetAll();

    for (const auto& [name, stats] : registry_.allStats()) {
        EXPECT_EQ(stats.state, CircuitState::Closed) << name;
        EXPECT_EQ(stats.totalRequests, 0u) << name;
    }
}

TEST(HealthStatusTest, MapsCircuitStates) {
    EXPECT_EQ(healthOf(CircuitState::Closed), HealthStatus::Healthy);
    EXPECT_EQ(healthOf(CircuitState::HalfOpen), HealthStatus::Degraded);
    EXPECT_EQ(healthOf(CircuitState::Open), HealthStatus::Unhealthy);
    EXPECT_EQ(toString(HealthStatus::Degraded), "degraded");
}

// ===========================================================================
// Presets in a registry
// ===========================================================================

TEST(CircuitBreakerRegistryPresetTest, HoldsPresetBreakers) {
    CircuitBreakerRegistry registry;
    ASSERT_TRUE(registry.add("catalog", presets::forApi({.name = "catalog"})).hasValue());
    ASSERT_TRUE(registry.add("primary-db", presets::forDatabase({.name = "primary-db"})).hasValue());
    ASSERT_TRUE(
        registry.add("geocoder", presets::forExternalService({.name = "geocoder"})).hasValue());

    EXPECT_EQ(registry.get("catalog")->config().failureThreshold, 5u);
    EXPECT_EQ(registry.get("primary-db")->config().failureThreshold, 3u);
    EXPECT_EQ(registry.get("geocoder")->config().failureThreshold, 10u);
}

// ===========================================================================
// Thread safety
// ===========================================================================

TEST(CircuitBreakerRegistryConcurrencyTest, ConcurrentAddAndExecute) {
    CircuitBreakerRegistry registry;
    ASSERT_TRUE(registry.add("shared", makeBreaker("shared", 1000)).hasValue());

    constexpr int kWriters = 2;
    constexpr int kReaders = 4;
    constexpr int kIterations = 500;
    std::atomic<int> served{0};

    std::vector<std::thread> threads;
    for (int w = 0; w < kWriters; ++w) {
        threads.emplace_back([&registry, w] {
            for (int i = 0; i < kIterations; ++i) {
                auto name = "dyn-" + std::to_string(w) + "-" + std::to_string(i % 10);
                (void)registry.add(name, makeBreaker(name));
                (void)registry.healthReport();
            }
        });
    }
    for (int r = 0; r < kReaders; ++r) {
        threads.emplace_back([&registry, &served] {
            for (int i = 0; i < kIterations; ++i) {
                auto result = registry.execute("shared", [] { return CallResult<int>::ok(1); });
                if (result.hasValue()) {
                    served.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(served.load(), kReaders * kIterations);
    EXPECT_EQ(registry.size(), 1u + kWriters * 10u);
}
