#pragma once

#include "config/Config.hpp"

#include <mutex>

namespace dl::config {

class ConfigRegistry {
public:
    static constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/drivelock/config.yaml";

    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);
    static void init(Config config);
    static const Config& get();

    [[nodiscard]] static bool isInitialized() { return initialized_; }

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace dl::config
