#include "fs/PathIndex.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <mutex>

using namespace gm::fs;
using namespace gm::fs::model;
using namespace gm::git;
using namespace gm::types;
using namespace gm::log;

PathIndex::PathIndex(const ObjectStore& store, CommitRef commit)
    : store_(store), commit_(std::move(commit)) {}

std::vector<std::string> PathIndex::splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= path.size()) {
        const auto slash = path.find('/', start);
        const auto end = slash == std::string::npos ? path.size() : slash;
        if (end > start) parts.emplace_back(path.substr(start, end - start));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return parts;
}

std::shared_ptr<const TreeNode> PathIndex::tree(const Oid& id) const {
    auto& shard = shardFor(id);
    {
        std::shared_lock lock(shard.mutex);
        if (const auto it = shard.trees.find(id); it != shard.trees.end()) return it->second;
    }

    // Decode outside the lock; two threads racing on one tree both produce the same value
    const auto obj = store_.getObject(id);
    if (obj.kind != ObjectKind::Tree)
        throw Error(ErrorKind::StoreCorruption, fmt::format("object {} is a {}, expected a tree", toHex(id), to_string(obj.kind)));

    auto node = std::make_shared<TreeNode>();
    node->id = id;
    node->entries = parseTree(obj.payload);

    std::unique_lock lock(shard.mutex);
    const auto [it, inserted] = shard.trees.emplace(id, std::move(node));
    if (inserted) Registry::fs()->trace("[PathIndex] Cached tree {} ({} entries)", toHex(id), it->second->entries.size());
    return it->second;
}

PathNode PathIndex::root() const {
    return {"/", commit_.rootTree, MODE_TREE, NodeKind::Directory};
}

PathNode PathIndex::lookup(const std::string& path) const {
    PathNode current = root();

    for (const auto& name : splitPath(path)) {
        if (name == "." || name == "..")
            throw Error(ErrorKind::NotFound, fmt::format("'{}' is not a valid component of {}", name, path));

        if (!current.isDirectory())
            throw Error(ErrorKind::NotADirectory, fmt::format("{} is not a directory", current.path));

        // Submodules are exposed as empty directories
        if (current.kind == NodeKind::Submodule)
            throw Error(ErrorKind::NotFound, fmt::format("{} not found", joinPath(current.path, name)));

        const auto dir = tree(current.id);
        const TreeEntry* match = nullptr;
        for (const auto& entry : dir->entries) {
            if (entry.name == name) {
                match = &entry;
                break;
            }
        }

        if (!match) throw Error(ErrorKind::NotFound, fmt::format("{} not found", joinPath(current.path, name)));

        current = {joinPath(current.path, name), match->id, match->mode, kindFromMode(match->mode)};
    }

    return current;
}

std::vector<PathNode> PathIndex::childrenOf(const PathNode& dir) const {
    if (dir.kind == NodeKind::Submodule) return {};

    const auto node = tree(dir.id);
    std::vector<PathNode> children;
    children.reserve(node->entries.size());
    for (const auto& entry : node->entries)
        children.push_back({joinPath(dir.path, entry.name), entry.id, entry.mode, kindFromMode(entry.mode)});
    return children;
}

std::vector<PathNode> PathIndex::listChildren(const std::string& path) const {
    const auto node = lookup(path);
    if (!node.isDirectory()) throw Error(ErrorKind::NotADirectory, fmt::format("{} is not a directory", node.path));
    return childrenOf(node);
}

std::size_t PathIndex::cachedTrees() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard.mutex);
        total += shard.trees.size();
    }
    return total;
}
