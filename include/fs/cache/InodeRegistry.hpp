#pragma once

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace gm::fs::cache {

using Inode = uint64_t;

constexpr Inode ROOT_INODE = 1;

// Path <-> inode mapping for one mount. Numbers grow monotonically and are
// never handed out twice; rows live until the registry is destroyed.
class InodeRegistry {
public:
    InodeRegistry();

    Inode getOrAssignInode(const std::string& path);

    // Throws Stale for a number this registry never issued.
    [[nodiscard]] std::string resolvePath(Inode ino) const;

    // Kernel lookup reference counting (lookup increments, forget decrements).
    void incrementLookup(Inode ino);
    void decrementInodeRef(Inode ino, uint64_t nlookup);
    [[nodiscard]] uint64_t lookupCount(Inode ino) const;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    Inode nextInode_ = ROOT_INODE + 1;
    std::unordered_map<Inode, std::string> inodeToPath_;
    std::unordered_map<std::string, Inode> pathToInode_;
    std::unordered_map<Inode, uint64_t> lookups_;
};

}
