#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace dl::config {

struct PluginConfig {
    std::string name = "Drive File Locker";
    bool set_read_only = false;  // mark files locked by someone else read-only while open
    std::vector<std::string> lockable_extensions = {".3dm", ".gh", ".ghx"};
};

struct DriveConfig {
    std::vector<std::filesystem::path> roots;
    std::string lock_dir = ".drivelock";
    std::string owner;  // empty: taken from $USER
};

struct ConcurrencyConfig {
    unsigned int worker_threads = 2;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum drivelock = spdlog::level::info;   // Plugin load/shutdown
    spdlog::level::level_enum lock      = spdlog::level::info;   // Lock/unlock decisions and failures
    spdlog::level::level_enum drive     = spdlog::level::warn;   // Lock records, fsync, attributes
    spdlog::level::level_enum host      = spdlog::level::warn;   // Event routing
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    PluginConfig plugin;
    DriveConfig drive;
    ConcurrencyConfig concurrency;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

} // namespace dl::config
