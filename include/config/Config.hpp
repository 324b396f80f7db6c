#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace pfs::config {

struct FuseConfig {
    bool allow_root = true;
    bool allow_other = false;
    bool default_permissions = false;   // Kernel-side enforcement of the emulated mode bits
    unsigned int worker_threads = 1;    // 1 = serve requests inline on the session loop
    double attr_timeout = 1.0;
    double entry_timeout = 1.0;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum permfs     = spdlog::level::info;   // Mount/unmount lifecycle
    spdlog::level::level_enum fuse       = spdlog::level::warn;   // Per-request tracing lives at debug
    spdlog::level::level_enum perms      = spdlog::level::info;   // Sidecar load/persist
    spdlog::level::level_enum filesystem = spdlog::level::warn;   // Underlying I/O failures
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{};    // Empty: console only
    LogLevelsConfig levels;
};

struct Config {
    FuseConfig fuse;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);

} // namespace pfs::config
