#include "fs/PathTranslator.hpp"
#include "util/fsPath.hpp"

#include <stdexcept>

using namespace pfs::fs;
using namespace pfs::util;

PathTranslator::PathTranslator(const std::filesystem::path& sourceRoot)
    : root_(stripTrailingSlash(std::filesystem::absolute(sourceRoot))) {}

std::filesystem::path PathTranslator::toReal(const std::string& virtualPath) const {
    if (virtualPath.empty()) throw std::invalid_argument("Cannot translate an empty virtual path");

    const auto rel = stripLeadingSlash(virtualPath);
    if (rel.empty()) return root_;
    return root_ / rel;
}

std::string PathTranslator::toVirtual(const std::filesystem::path& realPath) const {
    if (!contains(realPath))
        throw std::invalid_argument("Path is outside of the source root: " + realPath.string());

    const auto rel = realPath.lexically_normal().lexically_relative(root_);
    if (rel.empty() || rel == ".") return "/";
    return "/" + stripTrailingSlash(rel).string();
}

std::string PathTranslator::rescopeLinkTarget(const std::string& target) const {
    if (target.empty() || target.front() != '/') return target;

    const std::filesystem::path abs(target);
    if (contains(abs)) {
        const auto virt = toVirtual(abs);
        return virt == "/" ? "." : virt.substr(1);
    }

    // Outside the root: express it as a climb out of the root, like the root-relative form above.
    const auto rel = abs.lexically_normal().lexically_relative(root_);
    return rel.empty() ? target : rel.string();
}

bool PathTranslator::contains(const std::filesystem::path& realPath) const {
    const auto rel = realPath.lexically_normal().lexically_relative(root_);
    if (rel.empty()) return false;
    return *rel.begin() != "..";
}

std::string PathTranslator::join(const std::string& parent, const std::string& name) {
    if (parent.empty() || parent == "/") return "/" + name;
    if (parent.back() == '/') return parent + name;
    return parent + "/" + name;
}
