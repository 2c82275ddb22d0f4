/// @file logger.cpp
/// @brief Logger implementation on top of kcenon common_system.

#include "tripwire/foundation/logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <sstream>
#include <string>

namespace tripwire::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.breaker && !ctx.breaker->empty()) {
        append("breaker", *ctx.breaker);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }
    return oss.str();
}

std::string formatLine(LogCategory cat, std::string_view msg, std::string_view ctx) {
    // [Category] message {ctx}
    std::string line;
    line.reserve(msg.size() + ctx.size() + 20);
    line += '[';
    line += logCategoryName(cat);
    line += "] ";
    line += msg;
    if (!ctx.empty()) {
        line += " {";
        line += ctx;
        line += '}';
    }
    return line;
}

}  // namespace

struct Logger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(LogLevel::Info, std::memory_order_relaxed);
            loggerNames[i] = std::string("tripwire.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto idx = static_cast<std::size_t>(cat);
        if (idx < kLogCategoryCount) {
            // Unregistered names resolve to the shared null logger.
            auto named = registry.get_logger(loggerNames[idx]);
            if (named && named != kci::GlobalLoggerRegistry::null_logger()) {
                return named;
            }
        }
        return registry.get_default_logger();
    }

    void write(LogLevel level, LogCategory cat, const std::string& line) const {
        auto logger = getLogger(cat);
        if (logger) {
            // A failing sink must not disturb the caller's control flow.
            (void)logger->log(mapLevel(level), line);
        }
    }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger::Logger(Logger&&) noexcept = default;
Logger& Logger::operator=(Logger&&) noexcept = default;

void Logger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, formatLine(cat, msg, {}));
}

void Logger::logWithContext(LogLevel level, LogCategory cat,
                            std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, formatLine(cat, msg, formatContext(ctx)));
}

void Logger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel Logger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool Logger::isEnabled(LogLevel level, LogCategory cat) const {
    if (level == LogLevel::Off) {
        return false;
    }
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

CallResult<void> Logger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    if (!logger) {
        return CallResult<void>::ok();
    }
    auto result = logger->flush();
    if (result.is_err()) {
        return CallResult<void>::err(
            Error(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return CallResult<void>::ok();
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

}  // namespace tripwire::foundation
