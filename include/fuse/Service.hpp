#pragma once

#define FUSE_USE_VERSION 35

#include "config/Config.hpp"
#include "fuse/Bridge.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <fuse3/fuse_lowlevel.h>

namespace pfs::fs {
class Filesystem;
}

namespace pfs::fuse {

/// Owns the FUSE session for one mount. run() blocks on the calling thread so the
/// signal handlers libfuse installs end the loop on SIGINT/SIGTERM/SIGHUP.
class Service {
public:
    Service(fs::Filesystem& filesystem, std::filesystem::path mountPoint, config::FuseConfig cfg);

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    /// Mounts, serves requests until unmounted or signalled, then tears the session down.
    /// Returns false when the mount failed or the permission store could not be persisted.
    bool run();

    [[nodiscard]] std::vector<std::string> mountArgs() const;

private:
    fs::Filesystem& filesystem_;
    std::filesystem::path mountPoint_;
    config::FuseConfig cfg_;
    Context context_;
    fuse_session* session_{nullptr};

    void serveInline();
    void servePooled();
};

}
