#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "tripwire/foundation/error_code.hpp"
#include "tripwire/foundation/logger.hpp"
#include "tripwire/resilience/circuit_breaker_registry.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace tripwire::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                   const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    /// Records whose message contains @p needle.
    std::vector<LogRecord> matching(std::string_view needle) const {
        std::vector<LogRecord> out;
        for (auto& r : records()) {
            if (r.message.find(needle) != std::string::npos) {
                out.push_back(r);
            }
        }
        return out;
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);

        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            Logger::instance().setCategoryLevel(static_cast<LogCategory>(i), LogLevel::Info);
        }
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// ErrorCode: Logger subsystem lookup
// ---------------------------------------------------------------------------

TEST(LoggerErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerError), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::CircuitOpen), "Resilience");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigTypeMismatch), "Config");
}

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Breaker), "Breaker");
    EXPECT_EQ(logCategoryName(LogCategory::Registry), "Registry");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(200)), "Unknown");
}

TEST(LogLevelTest, AllLevelNamesAreValid) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(logLevelName(LogLevel::Info), "INFO");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Error), "ERROR");
    EXPECT_EQ(logLevelName(LogLevel::Critical), "CRITICAL");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

// ---------------------------------------------------------------------------
// Level filtering (no sink needed)
// ---------------------------------------------------------------------------

TEST(LoggerBasicTest, DefaultCategoryLevels) {
    Logger logger;
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        EXPECT_EQ(logger.getCategoryLevel(static_cast<LogCategory>(i)), LogLevel::Info);
    }
}

TEST(LoggerBasicTest, SetCategoryLevelChangesFiltering) {
    Logger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Breaker));

    logger.setCategoryLevel(LogCategory::Breaker, LogLevel::Debug);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Breaker));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Registry));

    logger.setCategoryLevel(LogCategory::Breaker, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Breaker));
}

TEST(LoggerBasicTest, InvalidCategoryReturnsOff) {
    Logger logger;
    auto invalid = static_cast<LogCategory>(kLogCategoryCount);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

TEST(LoggerBasicTest, MoveConstruction) {
    Logger a;
    a.setCategoryLevel(LogCategory::Config, LogLevel::Error);
    Logger b(std::move(a));
    EXPECT_EQ(b.getCategoryLevel(LogCategory::Config), LogLevel::Error);
}

TEST(LoggerSingletonTest, InstanceReturnsSameObject) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

// ---------------------------------------------------------------------------
// Output formatting
// ---------------------------------------------------------------------------

TEST_F(LoggerTest, LogFormatsMessageWithCategory) {
    Logger logger;
    logger.log(LogLevel::Warning, LogCategory::Registry, "registry ready");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message, "[Registry] registry ready");
}

TEST_F(LoggerTest, LogFiltersMessagesBelowLevel) {
    Logger logger;
    logger.log(LogLevel::Debug, LogCategory::Core, "hidden");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(LoggerTest, LogWithContextIncludesFields) {
    Logger logger;
    LogContext ctx;
    ctx.breaker = "payments";
    ctx.extra["failures"] = "5";

    logger.logWithContext(LogLevel::Warning, LogCategory::Breaker, "circuit opened", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Breaker] circuit opened {breaker=payments, failures=5}");
}

TEST_F(LoggerTest, LogWithEmptyContextOmitsBraces) {
    Logger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "no context", LogContext{});

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] no context");
}

TEST_F(LoggerTest, FlushDelegatesToLogger) {
    Logger logger;
    EXPECT_TRUE(logger.flush().hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

// ---------------------------------------------------------------------------
// TRIPWIRE_LOG macros
// ---------------------------------------------------------------------------

TEST_F(LoggerTest, MacroLogsWhenEnabled) {
    Logger::instance().setCategoryLevel(LogCategory::Config, LogLevel::Debug);

    TRIPWIRE_LOG_DEBUG(LogCategory::Config, "macro test");

    ASSERT_EQ(mockLogger_->matching("macro test").size(), 1u);
}

TEST_F(LoggerTest, MacroSkipsWhenDisabled) {
    Logger::instance().setCategoryLevel(LogCategory::Config, LogLevel::Error);

    TRIPWIRE_LOG_WARN(LogCategory::Config, "should not appear");

    EXPECT_TRUE(mockLogger_->records().empty());
}

// ---------------------------------------------------------------------------
// Library log output
// ---------------------------------------------------------------------------

using namespace tripwire::resilience;

TEST_F(LoggerTest, BreakerTransitionsAreLogged) {
    CircuitBreaker cb(CircuitBreakerConfig{.name = "billing", .failureThreshold = 1});

    (void)cb.execute([] {
        return CallResult<int>::err(Error(ErrorCode::ConnectionFailed, "refused"));
    });

    auto opened = mockLogger_->matching("circuit state changed");
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_EQ(opened[0].level, log_level::warning);
    EXPECT_NE(opened[0].message.find("[Breaker]"), std::string::npos);
    EXPECT_NE(opened[0].message.find("breaker=billing"), std::string::npos);
    EXPECT_NE(opened[0].message.find("to=OPEN"), std::string::npos);
    EXPECT_NE(opened[0].message.find("from=CLOSED"), std::string::npos);
}

TEST_F(LoggerTest, ClosingTransitionLogsAtInfo) {
    CircuitBreaker cb(CircuitBreakerConfig{.name = "billing"});
    cb.forceState(CircuitState::HalfOpen);

    (void)cb.execute([] { return CallResult<int>::ok(1); });

    auto records = mockLogger_->matching("to=CLOSED");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
}

TEST_F(LoggerTest, RejectionsLogAtDebugOnly) {
    CircuitBreaker cb(CircuitBreakerConfig{.name = "billing"});
    cb.forceState(CircuitState::Open);

    (void)cb.execute([] { return CallResult<int>::ok(1); });
    EXPECT_TRUE(mockLogger_->matching("call rejected").empty());

    Logger::instance().setCategoryLevel(LogCategory::Breaker, LogLevel::Debug);
    (void)cb.execute([] { return CallResult<int>::ok(1); });
    auto rejected = mockLogger_->matching("call rejected");
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].level, log_level::debug);
}

TEST_F(LoggerTest, RegistryLogsMissingBreaker) {
    CircuitBreakerRegistry registry;
    (void)registry.execute("nowhere", [] { return CallResult<int>::ok(1); });

    auto records = mockLogger_->matching("circuit breaker 'nowhere' not found");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message.rfind("[Registry]", 0), 0u);
}

TEST_F(LoggerTest, ResetIsLogged) {
    CircuitBreaker cb(CircuitBreakerConfig{.name = "billing"});
    cb.reset();
    EXPECT_EQ(mockLogger_->matching("circuit breaker reset {breaker=billing}").size(), 1u);
}

// ---------------------------------------------------------------------------
// Thread safety: concurrent logging from multiple threads
// ---------------------------------------------------------------------------

TEST_F(LoggerTest, ConcurrentLoggingIsSafe) {
    Logger logger;
    constexpr int kThreads = 4;
    constexpr int kMessages = 250;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < kMessages; ++i) {
                logger.log(LogLevel::Info, static_cast<LogCategory>(t % kLogCategoryCount),
                           "message " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mockLogger_->records().size(), static_cast<std::size_t>(kThreads * kMessages));
}
