#pragma once

#define FUSE_USE_VERSION 35

#include "fuse/InodeRegistry.hpp"

#include <atomic>
#include <filesystem>
#include <fuse3/fuse_lowlevel.h>

namespace pfs::fs {
class Filesystem;
}

namespace pfs::fuse {

struct FileHandle {
    std::filesystem::path path;
    int fd;
};

// Session userdata handed to fuse_session_new(); every callback reaches it through fuse_req_userdata().
struct Context {
    explicit Context(fs::Filesystem& filesystem) : filesystem(filesystem) {}

    fs::Filesystem& filesystem;
    InodeRegistry inodes;
    double attrTimeout = 1.0;
    double entryTimeout = 1.0;
    std::atomic<bool> persistFailed{false};
};

void init(void* userdata, fuse_conn_info* conn);

void destroy(void* userdata);

void lookup(fuse_req_t req, fuse_ino_t parent, const char* name);

void forget(fuse_req_t req, fuse_ino_t ino, uint64_t nlookup);

void forgetMulti(fuse_req_t req, size_t count, fuse_forget_data* forgets);

void getattr(fuse_req_t req, fuse_ino_t ino, fuse_file_info* fi);

void setattr(fuse_req_t req, fuse_ino_t ino, struct stat* attr, int to_set, fuse_file_info* fi);

void readlink(fuse_req_t req, fuse_ino_t ino);

void mknod(fuse_req_t req, fuse_ino_t parent, const char* name, mode_t mode, dev_t rdev);

void mkdir(fuse_req_t req, fuse_ino_t parent, const char* name, mode_t mode);

void unlink(fuse_req_t req, fuse_ino_t parent, const char* name);

void rmdir(fuse_req_t req, fuse_ino_t parent, const char* name);

void symlink(fuse_req_t req, const char* link, fuse_ino_t parent, const char* name);

void rename(fuse_req_t req, fuse_ino_t parent, const char* name, fuse_ino_t newparent, const char* newname, unsigned int flags);

void link(fuse_req_t req, fuse_ino_t ino, fuse_ino_t newparent, const char* newname);

void open(fuse_req_t req, fuse_ino_t ino, fuse_file_info* fi);

void create(fuse_req_t req, fuse_ino_t parent, const char* name, mode_t mode, fuse_file_info* fi);

void read(fuse_req_t req, fuse_ino_t ino, size_t size, off_t off, fuse_file_info* fi);

void write(fuse_req_t req, fuse_ino_t ino, const char* buf, size_t size, off_t off, fuse_file_info* fi);

void flush(fuse_req_t req, fuse_ino_t ino, fuse_file_info* fi);

void release(fuse_req_t req, fuse_ino_t ino, fuse_file_info* fi);

void fsync(fuse_req_t req, fuse_ino_t ino, int datasync, fuse_file_info* fi);

void readdir(fuse_req_t req, fuse_ino_t ino, size_t size, off_t off, fuse_file_info* fi);

void statfs(fuse_req_t req, fuse_ino_t ino);

void access(fuse_req_t req, fuse_ino_t ino, int mask);

fuse_lowlevel_ops getOperations();

}
