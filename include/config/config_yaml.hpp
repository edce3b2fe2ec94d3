#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace dl::config;

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = std::filesystem::path(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<PluginConfig> {
    static Node encode(const PluginConfig& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["set_read_only"] = rhs.set_read_only;
        node["lockable_extensions"] = rhs.lockable_extensions;
        return node;
    }

    static bool decode(const Node& node, PluginConfig& rhs) {
        if (!node.IsMap()) return false;
        const PluginConfig defaults;
        rhs.name = node["name"].as<std::string>(defaults.name);
        rhs.set_read_only = node["set_read_only"].as<bool>(false);
        rhs.lockable_extensions = node["lockable_extensions"].as<std::vector<std::string>>(defaults.lockable_extensions);
        return true;
    }
};

template<>
struct convert<DriveConfig> {
    static Node encode(const DriveConfig& rhs) {
        Node node;
        for (const auto& root : rhs.roots) node["roots"].push_back(root.string());
        node["lock_dir"] = rhs.lock_dir;
        node["owner"] = rhs.owner;
        return node;
    }

    static bool decode(const Node& node, DriveConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.roots = node["roots"].as<std::vector<std::filesystem::path>>(std::vector<std::filesystem::path>{});
        rhs.lock_dir = node["lock_dir"].as<std::string>(".drivelock");
        rhs.owner = node["owner"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<ConcurrencyConfig> {
    static Node encode(const ConcurrencyConfig& rhs) {
        Node node;
        node["worker_threads"] = rhs.worker_threads;
        return node;
    }

    static bool decode(const Node& node, ConcurrencyConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(2);
        if (rhs.worker_threads == 0) rhs.worker_threads = 1;
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["drivelock"] = to_std_string(spdlog::level::to_string_view(rhs.drivelock));
        node["lock"]      = to_std_string(spdlog::level::to_string_view(rhs.lock));
        node["drive"]     = to_std_string(spdlog::level::to_string_view(rhs.drive));
        node["host"]      = to_std_string(spdlog::level::to_string_view(rhs.host));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.drivelock = spdlog::level::from_str(node["drivelock"].as<std::string>("info"));
        rhs.lock = spdlog::level::from_str(node["lock"].as<std::string>("info"));
        rhs.drive = spdlog::level::from_str(node["drive"].as<std::string>("warn"));
        rhs.host = spdlog::level::from_str(node["host"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
