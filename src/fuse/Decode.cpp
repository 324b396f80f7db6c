#include "fuse/Decode.hpp"

#include <algorithm>

namespace pfs::fuse {

AttrUpdate decodeSetattr(const struct stat& attr, const int toSet) {
    AttrUpdate update;

    if (toSet & FUSE_SET_ATTR_MODE) update.mode = attr.st_mode;

    if (toSet & (FUSE_SET_ATTR_UID | FUSE_SET_ATTR_GID)) {
        const uid_t uid = (toSet & FUSE_SET_ATTR_UID) ? attr.st_uid : static_cast<uid_t>(-1);
        const gid_t gid = (toSet & FUSE_SET_ATTR_GID) ? attr.st_gid : static_cast<gid_t>(-1);
        update.owner = std::make_pair(uid, gid);
    }

    if (toSet & FUSE_SET_ATTR_SIZE) update.size = attr.st_size;

    if (toSet & (FUSE_SET_ATTR_ATIME | FUSE_SET_ATTR_MTIME | FUSE_SET_ATTR_ATIME_NOW | FUSE_SET_ATTR_MTIME_NOW)) {
        std::array<timespec, 2> times{};
        times[0].tv_nsec = times[1].tv_nsec = UTIME_OMIT;

        if (toSet & FUSE_SET_ATTR_ATIME_NOW) times[0].tv_nsec = UTIME_NOW;
        else if (toSet & FUSE_SET_ATTR_ATIME) times[0] = attr.st_atim;

        if (toSet & FUSE_SET_ATTR_MTIME_NOW) times[1].tv_nsec = UTIME_NOW;
        else if (toSet & FUSE_SET_ATTR_MTIME) times[1] = attr.st_mtim;

        update.times = times;
    }

    return update;
}

DirWindow direntWindow(const std::size_t count, const off_t off, const std::size_t capacity,
                       const std::function<std::size_t(std::size_t index)>& entrySize) {
    DirWindow window;
    window.first = off <= 0 ? 0 : std::min(static_cast<std::size_t>(off), count);
    window.last = window.first;

    std::size_t used = 0;
    while (window.last < count) {
        const std::size_t next = entrySize(window.last);
        if (used + next > capacity) break;
        used += next;
        ++window.last;
    }

    return window;
}

}
