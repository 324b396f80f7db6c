#pragma once

#include <optional>
#include <string>
#include <sys/stat.h>

namespace pfs::perms {
class Store;
}

namespace pfs::fs {

class PathTranslator;

/// Builds the attributes reported for a virtual path: ownership and mode from the
/// permission store, everything else from lstat() of the real path.
class AttributeResolver {
public:
    AttributeResolver(const PathTranslator& paths, perms::Store& store);

    /// Seeds a {0, 0, real mode} record the first time a path is seen, so this call
    /// mutates the store. Throws std::system_error (ENOENT for a missing real path).
    [[nodiscard]] struct stat seedAndResolve(const std::string& virtualPath) const;

    /// Attributes through an open descriptor, for files that may already be unlinked.
    /// A record is only seeded while virtualPath still names a file.
    [[nodiscard]] struct stat resolveOpen(const std::string& virtualPath, int fd) const;

    /// Real lstat() of the translated path. Throws std::system_error.
    [[nodiscard]] struct stat realStat(const std::string& virtualPath) const;

    [[nodiscard]] struct stat realStat(int fd) const;

    /// Current real mode, or std::nullopt when the path no longer exists.
    [[nodiscard]] std::optional<mode_t> realMode(const std::string& virtualPath) const;

private:
    const PathTranslator& paths_;
    perms::Store& store_;
};

}
