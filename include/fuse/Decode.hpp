#pragma once

#define FUSE_USE_VERSION 35

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <sys/stat.h>
#include <sys/types.h>
#include <fuse3/fuse_lowlevel.h>

namespace pfs::fuse {

// The operations a SETATTR request asks for, in the order they are applied.
struct AttrUpdate {
    std::optional<mode_t> mode;
    std::optional<std::pair<uid_t, gid_t>> owner;   // (uid_t)-1 / (gid_t)-1 for the half left unchanged
    std::optional<off_t> size;
    std::optional<std::array<timespec, 2>> times;   // UTIME_OMIT / UTIME_NOW as for utimensat()

    [[nodiscard]] bool empty() const { return !mode && !owner && !size && !times; }
};

AttrUpdate decodeSetattr(const struct stat& attr, int toSet);

// Half-open index range [first, last) of directory entries for one READDIR reply.
struct DirWindow {
    std::size_t first = 0;
    std::size_t last = 0;

    [[nodiscard]] std::size_t size() const { return last - first; }
};

/// Entry i is packed with next-offset i + 1, so a request at offset `off` resumes at entry `off`.
/// Stops before the first entry whose packed size would overflow `capacity`.
DirWindow direntWindow(std::size_t count, off_t off, std::size_t capacity,
                       const std::function<std::size_t(std::size_t index)>& entrySize);

}
