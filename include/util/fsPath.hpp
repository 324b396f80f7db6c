#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <stdexcept>

namespace pfs::util {

inline std::filesystem::path stripLeadingSlash(const std::string_view path) {
    std::size_t start = 0;
    while (start < path.size() && path[start] == '/') ++start;
    return {std::string(path.substr(start))};
}

inline std::filesystem::path stripTrailingSlash(const std::filesystem::path& path) {
    auto norm = path.lexically_normal();
    if (norm.has_relative_path() && !norm.has_filename()) return norm.parent_path();
    return norm;
}

// True when `path` equals `base` or lies below it, compared as '/'-separated virtual paths.
inline bool isSameOrBelow(const std::string_view base, const std::string_view path) {
    if (base == "/") return !path.empty() && path.front() == '/';
    if (!path.starts_with(base)) return false;
    return path.size() == base.size() || path[base.size()] == '/';
}

// Rewrites the `oldBase` prefix of `input` to `newBase`; `input` must satisfy isSameOrBelow(oldBase, input).
inline std::string updateSubdirPath(const std::string_view oldBase, const std::string_view newBase, const std::string_view input) {
    if (!isSameOrBelow(oldBase, input))
        throw std::invalid_argument("Input path does not start with old base path");

    const auto suffix = oldBase == "/" ? input.substr(1) : input.substr(oldBase.size());
    if (suffix.empty()) return std::string(newBase);
    if (newBase == "/") return suffix.front() == '/' ? std::string(suffix) : "/" + std::string(suffix);
    return std::string(newBase) + (suffix.front() == '/' ? "" : "/") + std::string(suffix);
}

}
