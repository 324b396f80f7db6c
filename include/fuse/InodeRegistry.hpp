#pragma once

#define FUSE_USE_VERSION 35

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <fuse3/fuse_lowlevel.h>

namespace pfs::fuse {

/// FUSE inode number <-> virtual path, with the kernel's lookup reference counts.
/// FUSE_ROOT_ID is pinned to "/" and never evicted.
class InodeRegistry {
public:
    InodeRegistry();

    /// Inode for the path, assigning a fresh one if needed, and takes one kernel lookup
    /// reference. Call exactly once per successful entry reply.
    fuse_ino_t getOrAssignInode(const std::string& path);

    /// Throws std::system_error(ENOENT) for an inode the kernel should no longer hold.
    [[nodiscard]] std::string resolvePath(fuse_ino_t ino) const;

    /// Current path of the inode; std::nullopt once it is unknown or unlinked.
    [[nodiscard]] std::optional<std::string> findPath(fuse_ino_t ino) const;

    /// Drops nlookup references; the inode is forgotten when none remain.
    void forget(fuse_ino_t ino, uint64_t nlookup);

    /// Re-points `from` and everything below it to `to`. An inode already mapped at `to`
    /// (replaced by the rename) loses its path.
    void rename(const std::string& from, const std::string& to);

    /// Swaps the paths of two entries (RENAME_EXCHANGE).
    void exchange(const std::string& a, const std::string& b);

    /// The path no longer names the inode; pending kernel references keep the number alive.
    void unlinkPath(const std::string& path);

    [[nodiscard]] std::size_t size() const;

private:
    struct Node {
        std::string path;
        uint64_t lookups = 0;
    };

    mutable std::shared_mutex mutex_;
    fuse_ino_t nextInode_ = FUSE_ROOT_ID + 1;
    std::unordered_map<fuse_ino_t, Node> inodes_;
    std::unordered_map<std::string, fuse_ino_t> pathToInode_;

    void detachLocked(const std::string& path);
};

}
