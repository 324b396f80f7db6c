#include "fuse/Bridge.hpp"
#include "fuse/Decode.hpp"
#include "fs/Filesystem.hpp"
#include "fs/PathTranslator.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <unistd.h>
#include <vector>

using pfs::fs::PathTranslator;

namespace pfs::fuse {

namespace {

Context& context(const fuse_req_t req) {
    return *static_cast<Context*>(fuse_req_userdata(req));
}

FileHandle* handle(const fuse_file_info* fi) {
    return reinterpret_cast<FileHandle*>(fi->fh);
}

std::string childPath(Context& ctx, const fuse_ino_t parent, const char* name) {
    return PathTranslator::join(ctx.inodes.resolvePath(parent), name);
}

// errno from the underlying filesystem goes back to the kernel untouched
void replyErrno(const fuse_req_t req, const char* op, const std::system_error& e) {
    log::Registry::fuse()->debug("[{}] {}", op, e.what());
    fuse_reply_err(req, e.code().value());
}

void replyFailure(const fuse_req_t req, const char* op, const std::exception& e) {
    log::Registry::fuse()->error("[{}] Unexpected failure: {}", op, e.what());
    fuse_reply_err(req, EIO);
}

// Attribute requests reach unlinked inodes through an open handle; the handle's fd stands in for the path.
struct AttrTarget {
    std::string path;
    std::optional<int> fd;
};

AttrTarget attrTarget(Context& ctx, const fuse_ino_t ino, const fuse_file_info* fi) {
    const auto* fh = fi ? handle(fi) : nullptr;

    AttrTarget target;
    if (fh) target.fd = fh->fd;

    if (auto live = ctx.inodes.findPath(ino)) target.path = std::move(*live);
    else if (fh) target.path = fh->path.string();
    else throw std::system_error(ENOENT, std::generic_category(), "inode " + std::to_string(ino));

    return target;
}

void replyEntry(const fuse_req_t req, Context& ctx, const std::string& path) {
    fuse_entry_param e{};
    e.attr = ctx.filesystem.getattr(path);
    e.attr_timeout = ctx.attrTimeout;
    e.entry_timeout = ctx.entryTimeout;
    e.ino = ctx.inodes.getOrAssignInode(path);

    // Interrupted request: the kernel never took the reference
    if (fuse_reply_entry(req, &e) == -ENOENT) ctx.inodes.forget(e.ino, 1);
}

}

// --- Lifecycle ---

void init(void* userdata, fuse_conn_info* conn) {
    (void)conn;
    const auto& ctx = *static_cast<Context*>(userdata);
    log::Registry::permfs()->info("FS mounted (source {})", ctx.filesystem.paths().root().string());
}

void destroy(void* userdata) {
    auto& ctx = *static_cast<Context*>(userdata);
    try {
        ctx.filesystem.destroy();
    } catch (const std::exception& e) {
        ctx.persistFailed.store(true);
        log::Registry::permfs()->critical("[destroy] Failed to persist permission store: {}", e.what());
    }
}

// --- Inodes ---

void lookup(const fuse_req_t req, const fuse_ino_t parent, const char* name) {
    log::Registry::fuse()->debug("[lookup] parent: {}, name: {}", parent, name);
    auto& ctx = context(req);

    try {
        replyEntry(req, ctx, childPath(ctx, parent, name));
    } catch (const std::system_error& e) {
        replyErrno(req, "lookup", e);
    } catch (const std::exception& e) {
        replyFailure(req, "lookup", e);
    }
}

void forget(const fuse_req_t req, const fuse_ino_t ino, const uint64_t nlookup) {
    log::Registry::fuse()->debug("[forget] inode: {}, nlookup: {}", ino, nlookup);
    context(req).inodes.forget(ino, nlookup);
    fuse_reply_none(req);
}

void forgetMulti(const fuse_req_t req, const size_t count, fuse_forget_data* forgets) {
    auto& ctx = context(req);
    for (size_t i = 0; i < count; ++i) ctx.inodes.forget(forgets[i].ino, forgets[i].nlookup);
    fuse_reply_none(req);
}

// --- Attributes ---

void getattr(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    log::Registry::fuse()->debug("[getattr] inode: {}", ino);
    auto& ctx = context(req);

    try {
        const auto target = attrTarget(ctx, ino, fi);
        const auto st = ctx.filesystem.getattr(target.path, target.fd);
        fuse_reply_attr(req, &st, ctx.attrTimeout);
    } catch (const std::system_error& e) {
        replyErrno(req, "getattr", e);
    } catch (const std::exception& e) {
        replyFailure(req, "getattr", e);
    }
}

void setattr(const fuse_req_t req, const fuse_ino_t ino, struct stat* attr, const int to_set, fuse_file_info* fi) {
    log::Registry::fuse()->debug("[setattr] inode: {}, to_set: {:#x}", ino, to_set);
    auto& ctx = context(req);

    try {
        const auto target = attrTarget(ctx, ino, fi);
        const auto update = decodeSetattr(*attr, to_set);

        if (update.mode) ctx.filesystem.chmod(target.path, *update.mode, target.fd);
        if (update.owner) ctx.filesystem.chown(target.path, update.owner->first, update.owner->second, target.fd);
        if (update.size) ctx.filesystem.truncate(target.path, *update.size, target.fd);
        if (update.times) ctx.filesystem.utimens(target.path, update.times->data(), target.fd);

        // Re-stat so the kernel caches the emulated view
        const auto st = ctx.filesystem.getattr(target.path, target.fd);
        fuse_reply_attr(req, &st, ctx.attrTimeout);
    } catch (const std::system_error& e) {
        replyErrno(req, "setattr", e);
    } catch (const std::exception& e) {
        replyFailure(req, "setattr", e);
    }
}

// --- Namespace ---

void readlink(const fuse_req_t req, const fuse_ino_t ino) {
    log::Registry::fuse()->debug("[readlink] inode: {}", ino);
    auto& ctx = context(req);

    try {
        const auto target = ctx.filesystem.readlink(ctx.inodes.resolvePath(ino));
        fuse_reply_readlink(req, target.c_str());
    } catch (const std::system_error& e) {
        replyErrno(req, "readlink", e);
    } catch (const std::exception& e) {
        replyFailure(req, "readlink", e);
    }
}

void mknod(const fuse_req_t req, const fuse_ino_t parent, const char* name, const mode_t mode, const dev_t rdev) {
    log::Registry::fuse()->debug("[mknod] parent: {}, name: {}, mode: {:o}", parent, name, mode);
    auto& ctx = context(req);

    try {
        const auto path = childPath(ctx, parent, name);
        ctx.filesystem.mknod(path, mode, rdev);
        replyEntry(req, ctx, path);
    } catch (const std::system_error& e) {
        replyErrno(req, "mknod", e);
    } catch (const std::exception& e) {
        replyFailure(req, "mknod", e);
    }
}

void mkdir(const fuse_req_t req, const fuse_ino_t parent, const char* name, const mode_t mode) {
    log::Registry::fuse()->debug("[mkdir] parent: {}, name: {}, mode: {:o}", parent, name, mode);
    auto& ctx = context(req);

    try {
        const auto path = childPath(ctx, parent, name);
        ctx.filesystem.mkdir(path, mode);
        replyEntry(req, ctx, path);
    } catch (const std::system_error& e) {
        replyErrno(req, "mkdir", e);
    } catch (const std::exception& e) {
        replyFailure(req, "mkdir", e);
    }
}

void unlink(const fuse_req_t req, const fuse_ino_t parent, const char* name) {
    log::Registry::fuse()->debug("[unlink] parent: {}, name: {}", parent, name);
    auto& ctx = context(req);

    try {
        const auto path = childPath(ctx, parent, name);
        ctx.filesystem.unlink(path);
        ctx.inodes.unlinkPath(path);
        fuse_reply_err(req, 0);
    } catch (const std::system_error& e) {
        replyErrno(req, "unlink", e);
    } catch (const std::exception& e) {
        replyFailure(req, "unlink", e);
    }
}

void rmdir(const fuse_req_t req, const fuse_ino_t parent, const char* name) {
    log::Registry::fuse()->debug("[rmdir] parent: {}, name: {}", parent, name);
    auto& ctx = context(req);

    try {
        const auto path = childPath(ctx, parent, name);
        ctx.filesystem.rmdir(path);
        ctx.inodes.unlinkPath(path);
        fuse_reply_err(req, 0);
    } catch (const std::system_error& e) {
        replyErrno(req, "rmdir", e);
    } catch (const std::exception& e) {
        replyFailure(req, "rmdir", e);
    }
}

void symlink(const fuse_req_t req, const char* link, const fuse_ino_t parent, const char* name) {
    log::Registry::fuse()->debug("[symlink] parent: {}, name: {}, target: {}", parent, name, link);
    auto& ctx = context(req);

    try {
        const auto path = childPath(ctx, parent, name);
        ctx.filesystem.symlink(link, path);
        replyEntry(req, ctx, path);
    } catch (const std::system_error& e) {
        replyErrno(req, "symlink", e);
    } catch (const std::exception& e) {
        replyFailure(req, "symlink", e);
    }
}

void rename(const fuse_req_t req, const fuse_ino_t parent, const char* name,
            const fuse_ino_t newparent, const char* newname, const unsigned int flags) {
    log::Registry::fuse()->debug("[rename] {}:{} -> {}:{}, flags: {}", parent, name, newparent, newname, flags);
    auto& ctx = context(req);

    try {
        const auto from = childPath(ctx, parent, name);
        const auto to = childPath(ctx, newparent, newname);

        ctx.filesystem.rename(from, to, flags);

        if (flags & RENAME_EXCHANGE) ctx.inodes.exchange(from, to);
        else ctx.inodes.rename(from, to);

        fuse_reply_err(req, 0);
    } catch (const std::system_error& e) {
        replyErrno(req, "rename", e);
    } catch (const std::exception& e) {
        replyFailure(req, "rename", e);
    }
}

void link(const fuse_req_t req, const fuse_ino_t ino, const fuse_ino_t newparent, const char* newname) {
    log::Registry::fuse()->debug("[link] inode: {} -> {}:{}", ino, newparent, newname);
    auto& ctx = context(req);

    try {
        const auto existing = ctx.inodes.resolvePath(ino);
        const auto path = childPath(ctx, newparent, newname);
        ctx.filesystem.link(existing, path);
        replyEntry(req, ctx, path);
    } catch (const std::system_error& e) {
        replyErrno(req, "link", e);
    } catch (const std::exception& e) {
        replyFailure(req, "link", e);
    }
}

void readdir(const fuse_req_t req, const fuse_ino_t ino, const size_t size, const off_t off, fuse_file_info* fi) {
    log::Registry::fuse()->debug("[readdir] inode: {}, size: {}, offset: {}", ino, size, off);
    (void)fi;
    auto& ctx = context(req);

    std::vector<fs::DirEntry> entries;
    try {
        entries = ctx.filesystem.readdir(ctx.inodes.resolvePath(ino));
    } catch (const std::system_error& e) {
        replyErrno(req, "readdir", e);
        return;
    } catch (const std::exception& e) {
        replyFailure(req, "readdir", e);
        return;
    }

    const auto direntSize = [&](const size_t i) {
        return fuse_add_direntry(req, nullptr, 0, entries[i].name.c_str(), nullptr, 0);
    };
    const auto window = direntWindow(entries.size(), off, size, direntSize);

    std::vector<char> buf(size);
    size_t buf_used = 0;

    for (size_t i = window.first; i < window.last; ++i) {
        struct stat st{};
        st.st_ino = entries[i].ino;
        st.st_mode = entries[i].type;
        const size_t entry_size = direntSize(i);
        fuse_add_direntry(req, buf.data() + buf_used, entry_size, entries[i].name.c_str(), &st, static_cast<off_t>(i + 1));
        buf_used += entry_size;
    }

    fuse_reply_buf(req, buf.data(), buf_used);
}

void statfs(const fuse_req_t req, const fuse_ino_t ino) {
    log::Registry::fuse()->debug("[statfs] inode: {}", ino);
    auto& ctx = context(req);

    try {
        const auto st = ctx.filesystem.statfs(ctx.inodes.resolvePath(ino));
        fuse_reply_statfs(req, &st);
    } catch (const std::system_error& e) {
        replyErrno(req, "statfs", e);
    } catch (const std::exception& e) {
        replyFailure(req, "statfs", e);
    }
}

void access(const fuse_req_t req, const fuse_ino_t ino, const int mask) {
    log::Registry::fuse()->debug("[access] inode: {}, mask: {}", ino, mask);
    auto& ctx = context(req);

    try {
        ctx.filesystem.access(ctx.inodes.resolvePath(ino), mask);
        fuse_reply_err(req, 0);
    } catch (const std::system_error& e) {
        replyErrno(req, "access", e);
    } catch (const std::exception& e) {
        replyFailure(req, "access", e);
    }
}

// --- File I/O ---

void open(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    log::Registry::fuse()->debug("[open] inode: {}, flags: {:#o}", ino, fi->flags);
    auto& ctx = context(req);

    try {
        const auto path = ctx.inodes.resolvePath(ino);
        const int fd = ctx.filesystem.open(path, fi->flags);

        auto fh = std::make_unique<FileHandle>(FileHandle{path, fd});
        fi->fh = reinterpret_cast<uint64_t>(fh.get());

        if (fuse_reply_open(req, fi) != 0) {
            ::close(fd);
            return;
        }
        (void)fh.release();
    } catch (const std::system_error& e) {
        replyErrno(req, "open", e);
    } catch (const std::exception& e) {
        replyFailure(req, "open", e);
    }
}

void create(const fuse_req_t req, const fuse_ino_t parent, const char* name, const mode_t mode, fuse_file_info* fi) {
    log::Registry::fuse()->debug("[create] parent: {}, name: {}, mode: {:o}", parent, name, mode);
    auto& ctx = context(req);

    try {
        const auto path = childPath(ctx, parent, name);
        const int fd = ctx.filesystem.create(path, fi->flags, mode);
        auto fh = std::make_unique<FileHandle>(FileHandle{path, fd});

        fuse_entry_param e{};
        try {
            e.attr = ctx.filesystem.getattr(path);
        } catch (const std::exception&) {
            ::close(fd);
            throw;
        }
        e.attr_timeout = ctx.attrTimeout;
        e.entry_timeout = ctx.entryTimeout;
        e.ino = ctx.inodes.getOrAssignInode(path);

        fi->fh = reinterpret_cast<uint64_t>(fh.get());

        if (fuse_reply_create(req, &e, fi) != 0) {
            ctx.inodes.forget(e.ino, 1);
            ::close(fd);
            return;
        }
        (void)fh.release();
    } catch (const std::system_error& e) {
        replyErrno(req, "create", e);
    } catch (const std::exception& e) {
        replyFailure(req, "create", e);
    }
}

void read(const fuse_req_t req, const fuse_ino_t ino, const size_t size, const off_t off, fuse_file_info* fi) {
    log::Registry::fuse()->debug("[read] inode: {}, size: {}, offset: {}", ino, size, off);
    auto& ctx = context(req);
    const auto* fh = handle(fi);

    try {
        std::vector<char> buf(size);
        const auto n = ctx.filesystem.read(fh->fd, buf.data(), size, off);
        fuse_reply_buf(req, buf.data(), n);
    } catch (const std::system_error& e) {
        replyErrno(req, "read", e);
    } catch (const std::exception& e) {
        replyFailure(req, "read", e);
    }
}

void write(const fuse_req_t req, const fuse_ino_t ino, const char* buf,
           const size_t size, const off_t off, fuse_file_info* fi) {
    log::Registry::fuse()->debug("[write] inode: {}, size: {}, offset: {}", ino, size, off);
    auto& ctx = context(req);
    const auto* fh = handle(fi);

    try {
        const auto n = ctx.filesystem.write(fh->fd, buf, size, off);
        fuse_reply_write(req, n);
    } catch (const std::system_error& e) {
        replyErrno(req, "write", e);
    } catch (const std::exception& e) {
        replyFailure(req, "write", e);
    }
}

void flush(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    log::Registry::fuse()->debug("[flush] inode: {}", ino);
    auto& ctx = context(req);

    try {
        ctx.filesystem.flush(handle(fi)->fd);
        fuse_reply_err(req, 0);
    } catch (const std::system_error& e) {
        replyErrno(req, "flush", e);
    } catch (const std::exception& e) {
        replyFailure(req, "flush", e);
    }
}

void release(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    log::Registry::fuse()->debug("[release] inode: {}", ino);
    auto& ctx = context(req);

    // The handle is gone after this call whatever close() reports
    const std::unique_ptr<FileHandle> fh(handle(fi));
    fi->fh = 0;

    try {
        ctx.filesystem.release(fh->fd);
        fuse_reply_err(req, 0);
    } catch (const std::system_error& e) {
        replyErrno(req, "release", e);
    } catch (const std::exception& e) {
        replyFailure(req, "release", e);
    }
}

void fsync(const fuse_req_t req, const fuse_ino_t ino, const int datasync, fuse_file_info* fi) {
    log::Registry::fuse()->debug("[fsync] inode: {}, datasync: {}", ino, datasync);
    auto& ctx = context(req);

    try {
        ctx.filesystem.fsync(handle(fi)->fd, datasync != 0);
        fuse_reply_err(req, 0);
    } catch (const std::system_error& e) {
        replyErrno(req, "fsync", e);
    } catch (const std::exception& e) {
        replyFailure(req, "fsync", e);
    }
}

fuse_lowlevel_ops getOperations() {
    fuse_lowlevel_ops ops{};
    ops.init = init;
    ops.destroy = destroy;
    ops.lookup = lookup;
    ops.forget = forget;
    ops.forget_multi = forgetMulti;
    ops.getattr = getattr;
    ops.setattr = setattr;
    ops.readlink = readlink;
    ops.mknod = mknod;
    ops.mkdir = mkdir;
    ops.unlink = unlink;
    ops.rmdir = rmdir;
    ops.symlink = symlink;
    ops.rename = rename;
    ops.link = link;
    ops.open = open;
    ops.read = read;
    ops.write = write;
    ops.flush = flush;
    ops.release = release;
    ops.fsync = fsync;
    ops.readdir = readdir;
    ops.statfs = statfs;
    ops.access = access;
    ops.create = create;
    return ops;
}

}
