#pragma once

#include "git/Object.hpp"
#include "git/Oid.hpp"

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace gm::fs::model {

// The mount target, resolved once at startup and immutable afterwards.
struct CommitRef {
    git::Oid commit{};
    git::Oid rootTree{};
    std::time_t commitTime{0};
    std::string reference{};
};

enum class NodeKind { File, Directory, Symlink, Submodule };

struct PathNode {
    std::string path;  // "/" for the root, otherwise "/a/b" without a trailing slash
    git::Oid id{};
    uint32_t mode{git::MODE_TREE};
    NodeKind kind{NodeKind::Directory};

    [[nodiscard]] bool isDirectory() const noexcept { return kind == NodeKind::Directory || kind == NodeKind::Submodule; }
    [[nodiscard]] bool executable() const noexcept { return kind == NodeKind::File && (mode & 0111) != 0; }
};

struct TreeNode {
    git::Oid id{};
    std::vector<git::TreeEntry> entries; // stored order, never re-sorted
};

// 100644/100755 (and legacy 100664) → File, 040000 → Directory, 120000 → Symlink,
// 160000 → Submodule. Anything else is StoreCorruption.
NodeKind kindFromMode(uint32_t mode);

std::string joinPath(const std::string& parent, const std::string& name);

std::string to_string(NodeKind kind);

}
