#pragma once

/// @file logger.hpp
/// @brief Logger wrapping kcenon common_system's logger registry.
///
/// Provides category-based filtering, structured key-value context and
/// per-category runtime log level control for the tripwire library.

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tripwire/foundation/call_result.hpp"

namespace tripwire::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per library area.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Library-wide messages
    Breaker  = 1, ///< Circuit breaker state machine
    Registry = 2, ///< Named breaker registry
    Config   = 3  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 4;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Breaker", "Registry", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context appended to a log line as `{key=value, ...}`.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.breaker = "payments";
///   ctx.extra["failures"] = "5";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Breaker,
///                         "circuit opened", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> breaker;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger forwarding to kcenon's GlobalLoggerRegistry.
///
/// Each category resolves to a named logger `tripwire.<Category>`; when that
/// name is not registered the registry's default logger is used. PIMPL keeps
/// kcenon headers out of the public API.
///
/// Default levels: Core Info, Breaker Info, Registry Info, Config Info.
class Logger {
public:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    CallResult<void> flush();

    /// Process-wide logger used by the TRIPWIRE_LOG macros.
    static Logger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tripwire::foundation

/// @name TRIPWIRE_LOG Macros
/// TRIPWIRE_MIN_LOG_LEVEL may be defined before including this header to
/// compile out calls below the threshold (0=Trace ... 6=Off).
/// @{

#ifndef TRIPWIRE_MIN_LOG_LEVEL
    #define TRIPWIRE_MIN_LOG_LEVEL 0
#endif

#define TRIPWIRE_LOG(level, cat, msg)                                                   \
    do {                                                                                \
        _Pragma("GCC diagnostic push")                                                  \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                             \
        if (static_cast<int>(level) >= TRIPWIRE_MIN_LOG_LEVEL &&                        \
            ::tripwire::foundation::Logger::instance().isEnabled((level), (cat)))       \
        {                                                                               \
            ::tripwire::foundation::Logger::instance().log((level), (cat), (msg));      \
        }                                                                               \
        _Pragma("GCC diagnostic pop")                                                   \
    } while (0)

#define TRIPWIRE_LOG_DEBUG(cat, msg) \
    TRIPWIRE_LOG(::tripwire::foundation::LogLevel::Debug, (cat), (msg))

#define TRIPWIRE_LOG_INFO(cat, msg) \
    TRIPWIRE_LOG(::tripwire::foundation::LogLevel::Info, (cat), (msg))

#define TRIPWIRE_LOG_WARN(cat, msg) \
    TRIPWIRE_LOG(::tripwire::foundation::LogLevel::Warning, (cat), (msg))

#define TRIPWIRE_LOG_ERROR(cat, msg) \
    TRIPWIRE_LOG(::tripwire::foundation::LogLevel::Error, (cat), (msg))

/// @}
