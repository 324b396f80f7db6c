#include "fuse/InodeRegistry.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <mutex>
#include <system_error>
#include <utility>
#include <vector>

using namespace pfs::util;

namespace pfs::fuse {

InodeRegistry::InodeRegistry() {
    // Seed hard root mapping for FUSE
    inodes_[FUSE_ROOT_ID] = Node{"/", 1};
    pathToInode_["/"] = FUSE_ROOT_ID;
}

fuse_ino_t InodeRegistry::getOrAssignInode(const std::string& path) {
    std::unique_lock lock(mutex_);

    if (const auto it = pathToInode_.find(path); it != pathToInode_.end()) {
        ++inodes_[it->second].lookups;
        return it->second;
    }

    const fuse_ino_t ino = nextInode_++;
    inodes_[ino] = Node{path, 1};
    pathToInode_[path] = ino;
    return ino;
}

std::string InodeRegistry::resolvePath(const fuse_ino_t ino) const {
    std::shared_lock lock(mutex_);

    const auto it = inodes_.find(ino);
    if (it == inodes_.end() || it->second.path.empty())
        throw std::system_error(ENOENT, std::generic_category(), "Unknown inode " + std::to_string(ino));
    return it->second.path;
}

std::optional<std::string> InodeRegistry::findPath(const fuse_ino_t ino) const {
    std::shared_lock lock(mutex_);

    const auto it = inodes_.find(ino);
    if (it == inodes_.end() || it->second.path.empty()) return std::nullopt;
    return it->second.path;
}

void InodeRegistry::forget(const fuse_ino_t ino, const uint64_t nlookup) {
    if (ino == FUSE_ROOT_ID) return;

    std::unique_lock lock(mutex_);

    const auto it = inodes_.find(ino);
    if (it == inodes_.end()) {
        log::Registry::fuse()->warn("[InodeRegistry] forget for unknown inode {}", ino);
        return;
    }

    auto& node = it->second;
    node.lookups = nlookup >= node.lookups ? 0 : node.lookups - nlookup;
    if (node.lookups > 0) return;

    if (!node.path.empty()) {
        if (const auto p = pathToInode_.find(node.path); p != pathToInode_.end() && p->second == ino)
            pathToInode_.erase(p);
    }
    inodes_.erase(it);
}

void InodeRegistry::detachLocked(const std::string& path) {
    const auto it = pathToInode_.find(path);
    if (it == pathToInode_.end()) return;

    if (const auto node = inodes_.find(it->second); node != inodes_.end()) node->second.path.clear();
    pathToInode_.erase(it);
}

void InodeRegistry::rename(const std::string& from, const std::string& to) {
    if (from == to) return;

    std::unique_lock lock(mutex_);

    detachLocked(to);

    std::vector<std::pair<std::string, fuse_ino_t>> moved;
    for (const auto& [path, ino] : pathToInode_)
        if (isSameOrBelow(from, path)) moved.emplace_back(path, ino);

    for (const auto& [path, ino] : moved) {
        pathToInode_.erase(path);
        const auto updated = updateSubdirPath(from, to, path);
        pathToInode_[updated] = ino;
        inodes_[ino].path = updated;
    }
}

void InodeRegistry::exchange(const std::string& a, const std::string& b) {
    if (a == b) return;

    std::unique_lock lock(mutex_);

    std::vector<std::pair<std::string, fuse_ino_t>> moved;
    for (const auto& [path, ino] : pathToInode_) {
        if (isSameOrBelow(a, path)) moved.emplace_back(updateSubdirPath(a, b, path), ino);
        else if (isSameOrBelow(b, path)) moved.emplace_back(updateSubdirPath(b, a, path), ino);
    }

    for (const auto& [path, ino] : moved) pathToInode_.erase(inodes_[ino].path);
    for (const auto& [path, ino] : moved) {
        pathToInode_[path] = ino;
        inodes_[ino].path = path;
    }
}

void InodeRegistry::unlinkPath(const std::string& path) {
    std::unique_lock lock(mutex_);
    detachLocked(path);
}

std::size_t InodeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return inodes_.size();
}

}
