#pragma once

#include "fs/PathTranslator.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>

namespace pfs::perms {
class Store;
}

namespace pfs::fs {

class AttributeResolver;

struct DirEntry {
    std::string name;
    ino_t ino = 0;
    mode_t type = 0;   // S_IFMT bits only; 0 when the underlying filesystem does not report it
};

/// One mounted overlay: the source root, its permission store and the operations served on
/// virtual paths. Failures are thrown as std::system_error carrying the POSIX errno so the
/// FUSE bridge can forward them verbatim.
class Filesystem {
public:
    explicit Filesystem(const std::filesystem::path& sourceRoot);
    ~Filesystem();

    Filesystem(const Filesystem&) = delete;
    Filesystem& operator=(const Filesystem&) = delete;

    // Lifecycle

    /// Loads the permission store from the sidecar. Throws perms::CorruptMetadataError.
    void init();

    /// Persists the pruned store. Runs at most once per mount; later calls are no-ops.
    void destroy();

    [[nodiscard]] bool isInitialized() const noexcept { return static_cast<bool>(store_); }

    [[nodiscard]] const PathTranslator& paths() const noexcept { return paths_; }
    [[nodiscard]] perms::Store& store() const;
    [[nodiscard]] std::filesystem::path sidecarPath() const;

    // Emulated attributes

    // With an open descriptor the real attributes come from fstat(), so these keep working on a
    // file unlinked while open; the emulated attributes stay keyed by path.

    /// Seeds a default permission record on first observation (see AttributeResolver).
    [[nodiscard]] struct stat getattr(const std::string& path, std::optional<int> fd = std::nullopt) const;
    void chmod(const std::string& path, mode_t mode, std::optional<int> fd = std::nullopt) const;

    /// (uid_t)-1 / (gid_t)-1 keep the current emulated value.
    void chown(const std::string& path, uid_t uid, gid_t gid, std::optional<int> fd = std::nullopt) const;

    // Namespace

    [[nodiscard]] std::vector<DirEntry> readdir(const std::string& path) const;
    void access(const std::string& path, int mask) const;
    [[nodiscard]] std::string readlink(const std::string& path) const;
    void mknod(const std::string& path, mode_t mode, dev_t rdev) const;
    void mkdir(const std::string& path, mode_t mode) const;
    void rmdir(const std::string& path) const;
    void unlink(const std::string& path) const;
    void symlink(const std::string& linkBody, const std::string& path) const;
    void rename(const std::string& from, const std::string& to, unsigned int flags = 0) const;
    void link(const std::string& existing, const std::string& newPath) const;
    void utimens(const std::string& path, const timespec tv[2], std::optional<int> fd = std::nullopt) const;
    void truncate(const std::string& path, off_t size, std::optional<int> fd = std::nullopt) const;
    [[nodiscard]] struct statvfs statfs(const std::string& path) const;

    // File I/O on descriptors handed out by open()/create()

    [[nodiscard]] int open(const std::string& path, int flags) const;
    [[nodiscard]] int create(const std::string& path, int flags, mode_t mode) const;
    [[nodiscard]] std::size_t read(int fd, char* buf, std::size_t size, off_t off) const;
    [[nodiscard]] std::size_t write(int fd, const char* buf, std::size_t size, off_t off) const;
    void flush(int fd) const;
    void release(int fd) const;
    void fsync(int fd, bool datasync) const;

private:
    PathTranslator paths_;
    std::unique_ptr<perms::Store> store_;
    std::unique_ptr<AttributeResolver> resolver_;
    std::atomic<bool> destroyed_{false};

    [[nodiscard]] const AttributeResolver& resolver() const;
};

}
