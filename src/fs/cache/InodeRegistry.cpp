#include "fs/cache/InodeRegistry.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <mutex>

using namespace gm::fs::cache;
using namespace gm::types;
using namespace gm::log;

InodeRegistry::InodeRegistry() {
    inodeToPath_[ROOT_INODE] = "/";
    pathToInode_["/"] = ROOT_INODE;
}

Inode InodeRegistry::getOrAssignInode(const std::string& path) {
    {
        std::shared_lock lock(mutex_);
        if (const auto it = pathToInode_.find(path); it != pathToInode_.end()) return it->second;
    }

    std::unique_lock lock(mutex_);
    if (const auto it = pathToInode_.find(path); it != pathToInode_.end()) return it->second;

    const Inode ino = nextInode_++;
    pathToInode_[path] = ino;
    inodeToPath_[ino] = path;
    Registry::fs()->trace("[InodeRegistry] Assigned inode {} to {}", ino, path);
    return ino;
}

std::string InodeRegistry::resolvePath(const Inode ino) const {
    std::shared_lock lock(mutex_);
    if (const auto it = inodeToPath_.find(ino); it != inodeToPath_.end()) return it->second;
    throw Error(ErrorKind::Stale, fmt::format("inode {} was never assigned", ino));
}

void InodeRegistry::incrementLookup(const Inode ino) {
    std::unique_lock lock(mutex_);
    if (!inodeToPath_.contains(ino)) throw Error(ErrorKind::Stale, fmt::format("inode {} was never assigned", ino));
    ++lookups_[ino];
}

void InodeRegistry::decrementInodeRef(const Inode ino, const uint64_t nlookup) {
    std::unique_lock lock(mutex_);
    const auto it = lookups_.find(ino);
    if (it == lookups_.end()) return;

    // The mapping itself stays: numbers are not recycled during a mount
    if (nlookup >= it->second) lookups_.erase(it);
    else it->second -= nlookup;
}

uint64_t InodeRegistry::lookupCount(const Inode ino) const {
    std::shared_lock lock(mutex_);
    const auto it = lookups_.find(ino);
    return it == lookups_.end() ? 0 : it->second;
}

std::size_t InodeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return inodeToPath_.size();
}
