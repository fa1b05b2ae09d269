#pragma once

#include "fs/model/Node.hpp"
#include "git/ObjectStore.hpp"

#include <array>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gm::fs {

// Maps paths under the mounted commit to git objects. Trees are decoded on
// first use and cached for the life of the index; the cache is split into
// shards so unrelated traversals never contend on one lock.
class PathIndex {
public:
    PathIndex(const git::ObjectStore& store, model::CommitRef commit);

    // Throws NotFound, NotADirectory (a non-directory mid-path) or StoreCorruption.
    [[nodiscard]] model::PathNode lookup(const std::string& path) const;

    // Children in the tree's stored order. Throws NotADirectory for files and symlinks.
    [[nodiscard]] std::vector<model::PathNode> listChildren(const std::string& path) const;

    [[nodiscard]] std::shared_ptr<const model::TreeNode> tree(const git::Oid& id) const;

    [[nodiscard]] model::PathNode root() const;
    [[nodiscard]] const model::CommitRef& commit() const noexcept { return commit_; }
    [[nodiscard]] std::size_t cachedTrees() const;

    static std::vector<std::string> splitPath(const std::string& path);

private:
    static constexpr std::size_t SHARD_COUNT = 16;

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<git::Oid, std::shared_ptr<const model::TreeNode>, git::OidHash> trees;
    };

    const git::ObjectStore& store_;
    model::CommitRef commit_;
    mutable std::array<Shard, SHARD_COUNT> shards_;

    [[nodiscard]] Shard& shardFor(const git::Oid& id) const { return shards_[id[0] % SHARD_COUNT]; }
    [[nodiscard]] std::vector<model::PathNode> childrenOf(const model::PathNode& dir) const;
};

}
