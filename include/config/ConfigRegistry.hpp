#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace pfs::config {

class ConfigRegistry {
public:
    // Loads the file when it exists, otherwise keeps the built-in defaults.
    static void init(const std::filesystem::path& path);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace pfs::config
