#pragma once

#include "fs/model/Node.hpp"
#include "git/ObjectStore.hpp"

#include <string>
#include <vector>

namespace gm::fs {

class RefResolver {
public:
    explicit RefResolver(const git::ObjectStore& store) : store_(store) {}

    // Reference names first, in git's short-name order, then a literal 40-hex id.
    // Throws NotFound, NotACommit, or StoreCorruption.
    [[nodiscard]] model::CommitRef resolve(const std::string& reference) const;

    // Names git tries, in order, when a user types a short name.
    [[nodiscard]] static std::vector<std::string> candidates(const std::string& shortName);

private:
    static constexpr int MAX_TAG_DEPTH = 16;

    const git::ObjectStore& store_;

    [[nodiscard]] git::Oid lookupName(const std::string& reference) const;
};

}
