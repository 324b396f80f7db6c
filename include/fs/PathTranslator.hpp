#pragma once

#include <filesystem>
#include <string>

namespace pfs::fs {

/// Maps virtual paths ('/'-rooted, as seen through the mount point) onto the source
/// directory and back. Holds no state beyond the normalized source root.
class PathTranslator {
public:
    explicit PathTranslator(const std::filesystem::path& sourceRoot);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /// "/" maps to the root itself, "/a/b" to root/a/b. Throws std::invalid_argument on an empty path.
    [[nodiscard]] std::filesystem::path toReal(const std::string& virtualPath) const;

    /// Inverse of toReal(). Throws std::invalid_argument when realPath is not under the root.
    [[nodiscard]] std::string toVirtual(const std::filesystem::path& realPath) const;

    /// Absolute symlink targets are rewritten relative to the source root ("." for the root
    /// itself) so they stay scoped to the mount; relative targets are returned unchanged.
    [[nodiscard]] std::string rescopeLinkTarget(const std::string& target) const;

    [[nodiscard]] bool contains(const std::filesystem::path& realPath) const;

    [[nodiscard]] static std::string join(const std::string& parent, const std::string& name);

private:
    std::filesystem::path root_;
};

}
