#pragma once

#include <cerrno>
#include <filesystem>
#include <string>
#include <system_error>

namespace pfs::util {

// Throws std::system_error carrying errno when a POSIX call reported failure (-1), otherwise passes the result through.
template <typename T>
T checkSys(const T res, const char* op, const std::filesystem::path& path) {
    if (res < 0) {
        const int err = errno;
        throw std::system_error(err, std::generic_category(), std::string(op) + " " + path.string());
    }
    return res;
}

template <typename T>
T checkSys(const T res, const char* op, const int fd) {
    if (res < 0) {
        const int err = errno;
        throw std::system_error(err, std::generic_category(), std::string(op) + " fd " + std::to_string(fd));
    }
    return res;
}

}
