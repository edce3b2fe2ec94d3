#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace dl::config {

namespace {

template<typename T>
void decodeSection(const YAML::Node& root, const std::string& key, T& out) {
    const auto node = root[key];
    if (!node || node.IsNull()) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error("Config section '" + key + "' must be a map");
}

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a map");

    decodeSection(root, "plugin", cfg.plugin);
    decodeSection(root, "drive", cfg.drive);
    decodeSection(root, "concurrency", cfg.concurrency);
    decodeSection(root, "logging", cfg.logging);

    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    return fromRoot(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

} // namespace dl::config
