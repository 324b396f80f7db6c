#include "fs/AttributeResolver.hpp"
#include "fs/PathTranslator.hpp"
#include "perms/Store.hpp"
#include "util/sysCall.hpp"

#include <cerrno>
#include <system_error>

namespace pfs::fs {

AttributeResolver::AttributeResolver(const PathTranslator& paths, perms::Store& store)
    : paths_(paths), store_(store) {}

struct stat AttributeResolver::realStat(const std::string& virtualPath) const {
    const auto real = paths_.toReal(virtualPath);

    struct stat st{};
    util::checkSys(::lstat(real.c_str(), &st), "lstat", real);
    return st;
}

struct stat AttributeResolver::realStat(const int fd) const {
    struct stat st{};
    util::checkSys(::fstat(fd, &st), "fstat", fd);
    return st;
}

struct stat AttributeResolver::resolveOpen(const std::string& virtualPath, const int fd) const {
    struct stat st = realStat(fd);

    const auto record = realMode(virtualPath)
        ? store_.lookupOrInit(virtualPath, st.st_mode)
        : store_.find(virtualPath).value_or(perms::Record{0, 0, st.st_mode});

    st.st_mode = record.mode;
    st.st_uid = record.uid;
    st.st_gid = record.gid;
    return st;
}

struct stat AttributeResolver::seedAndResolve(const std::string& virtualPath) const {
    struct stat st = realStat(virtualPath);

    const auto record = store_.lookupOrInit(virtualPath, st.st_mode);
    st.st_mode = record.mode;
    st.st_uid = record.uid;
    st.st_gid = record.gid;
    return st;
}

std::optional<mode_t> AttributeResolver::realMode(const std::string& virtualPath) const {
    const auto real = paths_.toReal(virtualPath);

    struct stat st{};
    if (::lstat(real.c_str(), &st) < 0) {
        const int err = errno;
        if (err == ENOENT || err == ENOTDIR) return std::nullopt;
        throw std::system_error(err, std::generic_category(), "lstat " + real.string());
    }
    return st.st_mode;
}

}
