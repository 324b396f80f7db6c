#pragma once

#include "config/Config.hpp"
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace pfs::config;

template<>
struct convert<FuseConfig> {
    static bool decode(const Node& node, FuseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.allow_other = node["allow_other"].as<bool>(false);
        rhs.allow_root = node["allow_root"].as<bool>(!rhs.allow_other);
        rhs.default_permissions = node["default_permissions"].as<bool>(false);
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(1);
        rhs.attr_timeout = node["attr_timeout"].as<double>(1.0);
        rhs.entry_timeout = node["entry_timeout"].as<double>(1.0);
        return true;
    }
};

// from_str() maps any unknown name to "off"; only an explicit "off" may disable a logger.
inline spdlog::level::level_enum levelOrDefault(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;

    const auto name = node.as<std::string>();
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off")
        throw std::runtime_error("Unknown log level '" + name + "'");
    return level;
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.permfs = levelOrDefault(node["permfs"], spdlog::level::info);
        rhs.fuse = levelOrDefault(node["fuse"], spdlog::level::warn);
        rhs.perms = levelOrDefault(node["perms"], spdlog::level::info);
        rhs.filesystem = levelOrDefault(node["filesystem"], spdlog::level::warn);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.levels.console_log_level = levelOrDefault(node["console_log_level"], spdlog::level::info);
        rhs.levels.file_log_level = levelOrDefault(node["file_log_level"], spdlog::level::debug);
        if (const auto sub = node["subsystem_levels"]) rhs.levels.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

}
