#include "fs/Filesystem.hpp"
#include "fs/AttributeResolver.hpp"
#include "perms/Store.hpp"
#include "util/sysCall.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <fcntl.h>
#include <dirent.h>
#include <stdexcept>
#include <unistd.h>

namespace pfs::fs {

using util::checkSys;

Filesystem::Filesystem(const std::filesystem::path& sourceRoot) : paths_(sourceRoot) {}

Filesystem::~Filesystem() = default;

void Filesystem::init() {
    if (store_) {
        log::Registry::permfs()->warn("[Filesystem] init() called twice for {}, keeping the loaded store", paths_.root().string());
        return;
    }

    store_ = perms::Store::load(sidecarPath());
    resolver_ = std::make_unique<AttributeResolver>(paths_, *store_);
    destroyed_.store(false);
}

void Filesystem::destroy() {
    if (!store_) throw std::logic_error("Filesystem::destroy() called before init()");

    if (destroyed_.exchange(true)) {
        log::Registry::permfs()->warn("[Filesystem] destroy() already ran for {}, ignoring", paths_.root().string());
        return;
    }

    const auto& res = resolver();
    store_->persist(sidecarPath(), [&res](const std::string& path) { return res.realMode(path); });
}

perms::Store& Filesystem::store() const {
    if (!store_) throw std::logic_error("Permission store accessed before Filesystem::init()");
    return *store_;
}

const AttributeResolver& Filesystem::resolver() const {
    if (!resolver_) throw std::logic_error("Attribute resolver accessed before Filesystem::init()");
    return *resolver_;
}

std::filesystem::path Filesystem::sidecarPath() const {
    return paths_.root() / perms::SIDECAR_FILENAME;
}

// --- Emulated attributes ---

struct stat Filesystem::getattr(const std::string& path, const std::optional<int> fd) const {
    if (fd) return resolver().resolveOpen(path, *fd);
    return resolver().seedAndResolve(path);
}

void Filesystem::chmod(const std::string& path, const mode_t mode, const std::optional<int> fd) const {
    const auto st = fd ? resolver().realStat(*fd) : resolver().realStat(path);

    // Permission bits alone keep the real file type
    const mode_t effective = (mode & S_IFMT) ? mode : ((st.st_mode & S_IFMT) | (mode & 07777));
    store().setChmod(path, effective);

    log::Registry::fs()->debug("[chmod] {} -> {:o}", path, effective);
}

void Filesystem::chown(const std::string& path, uid_t uid, gid_t gid, const std::optional<int> fd) const {
    const auto st = fd ? resolver().realStat(*fd) : resolver().realStat(path);

    if (uid == static_cast<uid_t>(-1) || gid == static_cast<gid_t>(-1)) {
        const auto current = store().find(path);
        if (uid == static_cast<uid_t>(-1)) uid = current ? current->uid : 0;
        if (gid == static_cast<gid_t>(-1)) gid = current ? current->gid : 0;
    }

    store().setChown(path, uid, gid, st.st_mode);

    log::Registry::fs()->debug("[chown] {} -> {}:{}", path, uid, gid);
}

// --- Namespace ---

std::vector<DirEntry> Filesystem::readdir(const std::string& path) const {
    const auto real = paths_.toReal(path);

    const std::unique_ptr<DIR, decltype(&::closedir)> dir(::opendir(real.c_str()), &::closedir);
    if (!dir) checkSys(-1, "opendir", real);

    std::vector<DirEntry> entries;
    entries.push_back({".", 0, S_IFDIR});
    entries.push_back({"..", 0, S_IFDIR});

    const bool isRoot = path == "/";

    for (;;) {
        errno = 0;
        const dirent* ent = ::readdir(dir.get());
        if (!ent) {
            if (errno != 0) checkSys(-1, "readdir", real);
            break;
        }

        const std::string name = ent->d_name;
        if (name == "." || name == "..") continue;
        if (isRoot && name == perms::SIDECAR_FILENAME) continue;

        entries.push_back({name, ent->d_ino, DTTOIF(ent->d_type)});
    }

    return entries;
}

void Filesystem::access(const std::string& path, const int mask) const {
    const auto real = paths_.toReal(path);
    checkSys(::access(real.c_str(), mask), "access", real);
}

std::string Filesystem::readlink(const std::string& path) const {
    const auto real = paths_.toReal(path);

    std::vector<char> buf(PATH_MAX + 1);
    const auto res = checkSys(::readlink(real.c_str(), buf.data(), buf.size()), "readlink", real);
    if (static_cast<std::size_t>(res) == buf.size())
        throw std::system_error(ENAMETOOLONG, std::generic_category(), "readlink " + real.string());

    return paths_.rescopeLinkTarget(std::string(buf.data(), static_cast<std::size_t>(res)));
}

void Filesystem::mknod(const std::string& path, const mode_t mode, const dev_t rdev) const {
    const auto real = paths_.toReal(path);
    checkSys(::mknod(real.c_str(), mode, rdev), "mknod", real);
}

void Filesystem::mkdir(const std::string& path, const mode_t mode) const {
    const auto real = paths_.toReal(path);
    checkSys(::mkdir(real.c_str(), mode), "mkdir", real);
}

void Filesystem::rmdir(const std::string& path) const {
    const auto real = paths_.toReal(path);
    checkSys(::rmdir(real.c_str()), "rmdir", real);
}

void Filesystem::unlink(const std::string& path) const {
    const auto real = paths_.toReal(path);
    checkSys(::unlink(real.c_str()), "unlink", real);
}

void Filesystem::symlink(const std::string& linkBody, const std::string& path) const {
    const auto real = paths_.toReal(path);

    // Absolute bodies are virtual paths; store them under the source root so readlink() maps them back
    const auto body = !linkBody.empty() && linkBody.front() == '/' ? paths_.toReal(linkBody).string() : linkBody;
    checkSys(::symlink(body.c_str(), real.c_str()), "symlink", real);
}

void Filesystem::rename(const std::string& from, const std::string& to, const unsigned int flags) const {
    const auto realFrom = paths_.toReal(from);
    const auto realTo = paths_.toReal(to);

    if (flags == 0) checkSys(::rename(realFrom.c_str(), realTo.c_str()), "rename", realFrom);
    else checkSys(::renameat2(AT_FDCWD, realFrom.c_str(), AT_FDCWD, realTo.c_str(), flags), "renameat2", realFrom);
}

void Filesystem::link(const std::string& existing, const std::string& newPath) const {
    const auto realExisting = paths_.toReal(existing);
    const auto realNew = paths_.toReal(newPath);
    checkSys(::link(realExisting.c_str(), realNew.c_str()), "link", realNew);
}

void Filesystem::utimens(const std::string& path, const timespec tv[2], const std::optional<int> fd) const {
    const auto real = paths_.toReal(path);
    if (fd) checkSys(::futimens(*fd, tv), "futimens", real);
    else checkSys(::utimensat(AT_FDCWD, real.c_str(), tv, AT_SYMLINK_NOFOLLOW), "utimensat", real);
}

void Filesystem::truncate(const std::string& path, const off_t size, const std::optional<int> fd) const {
    const auto real = paths_.toReal(path);
    if (fd) checkSys(::ftruncate(*fd, size), "ftruncate", real);
    else checkSys(::truncate(real.c_str(), size), "truncate", real);
}

struct statvfs Filesystem::statfs(const std::string& path) const {
    const auto real = paths_.toReal(path);

    struct statvfs st{};
    checkSys(::statvfs(real.c_str(), &st), "statvfs", real);
    return st;
}

// --- File I/O ---

int Filesystem::open(const std::string& path, const int flags) const {
    const auto real = paths_.toReal(path);
    return checkSys(::open(real.c_str(), flags), "open", real);
}

int Filesystem::create(const std::string& path, const int flags, const mode_t mode) const {
    const auto real = paths_.toReal(path);
    return checkSys(::open(real.c_str(), flags | O_CREAT, mode), "create", real);
}

std::size_t Filesystem::read(const int fd, char* buf, const std::size_t size, const off_t off) const {
    return static_cast<std::size_t>(checkSys(::pread(fd, buf, size, off), "pread", fd));
}

std::size_t Filesystem::write(const int fd, const char* buf, const std::size_t size, const off_t off) const {
    return static_cast<std::size_t>(checkSys(::pwrite(fd, buf, size, off), "pwrite", fd));
}

void Filesystem::flush(const int fd) const {
    // close() of a duplicate reports deferred write errors without releasing the handle
    const int dup = checkSys(::dup(fd), "dup", fd);
    checkSys(::close(dup), "close", fd);
}

void Filesystem::release(const int fd) const {
    checkSys(::close(fd), "close", fd);
}

void Filesystem::fsync(const int fd, const bool datasync) const {
    if (datasync) checkSys(::fdatasync(fd), "fdatasync", fd);
    else checkSys(::fsync(fd), "fsync", fd);
}

}
