#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with flattened, typed key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "tripwire/foundation/call_result.hpp"

namespace tripwire::foundation {

/// YAML configuration store addressed by dotted keys.
///
/// The YAML tree is flattened into a key-value map on load, so
/// `circuit_breakers.payments.failure_threshold` addresses a single scalar.
///
/// Example:
/// @code
///   ConfigManager config;
///   if (auto loaded = config.load("resilience.yaml"); !loaded) {
///       return loaded.error();
///   }
///   auto threshold = config.get<uint32_t>("circuit_breakers.db.failure_threshold");
/// @endcode
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    CallResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    /// @return Success or ConfigLoadFailed.
    CallResult<void> loadFromString(std::string_view yaml);

    /// Typed value for a dotted key.
    /// @return The value, or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    CallResult<T> get(std::string_view key) const;

    /// Set a value by dotted key, overwriting any existing entry.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Distinct child names directly below @p prefix, sorted.
    ///
    /// With keys `a.x.k` and `a.y.k`, keysUnder("a") returns {"x", "y"}.
    [[nodiscard]] std::vector<std::string> keysUnder(std::string_view prefix) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

template <typename T>
CallResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return CallResult<T>::err(
            Error(ErrorCode::ConfigKeyNotFound,
                  std::string("config key not found: ") + std::string(key)));
    }
    try {
        return CallResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return CallResult<T>::err(
            Error(ErrorCode::ConfigTypeMismatch,
                  std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

}  // namespace tripwire::foundation
