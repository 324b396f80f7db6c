#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace pfs::config {

Config loadConfig(const std::string& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path);

    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config file " + path + " must contain a YAML mapping");

    if (const auto node = root["fuse"]; node && !YAML::convert<FuseConfig>::decode(node, cfg.fuse))
        throw std::runtime_error("Config section 'fuse' must be a mapping");
    if (const auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
        throw std::runtime_error("Config section 'logging' must be a mapping");

    if (cfg.fuse.allow_root && cfg.fuse.allow_other)
        throw std::runtime_error("fuse.allow_root and fuse.allow_other are mutually exclusive");
    if (cfg.fuse.worker_threads == 0)
        throw std::runtime_error("fuse.worker_threads must be at least 1");

    return cfg;
}

} // namespace pfs::config
