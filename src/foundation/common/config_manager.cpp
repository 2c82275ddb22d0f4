#include "tripwire/foundation/config_manager.hpp"

#include <set>

namespace tripwire::foundation {

CallResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return CallResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return CallResult<void>::err(
            Error(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return CallResult<void>::err(
            Error(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

CallResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return CallResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return CallResult<void>::err(
            Error(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keysUnder(std::string_view prefix) const {
    std::string head(prefix);
    if (!head.empty()) {
        head += '.';
    }

    std::set<std::string> children;
    std::lock_guard lock(mutex_);
    for (const auto& [key, node] : entries_) {
        if (key.size() <= head.size() || key.compare(0, head.size(), head) != 0) {
            continue;
        }
        auto rest = key.substr(head.size());
        children.insert(rest.substr(0, rest.find('.')));
    }
    return {children.begin(), children.end()};
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace tripwire::foundation
