#include "fs/RefResolver.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

using namespace gm::fs;
using namespace gm::fs::model;
using namespace gm::git;
using namespace gm::types;
using namespace gm::log;

std::vector<std::string> RefResolver::candidates(const std::string& shortName) {
    return {
        shortName,
        "refs/" + shortName,
        "refs/tags/" + shortName,
        "refs/heads/" + shortName,
        "refs/remotes/" + shortName,
        "refs/remotes/" + shortName + "/HEAD"
    };
}

Oid RefResolver::lookupName(const std::string& reference) const {
    if (reference.empty()) throw Error(ErrorKind::NotFound, "empty reference");

    for (const auto& candidate : candidates(reference)) {
        try {
            const auto id = store_.resolveRef(candidate);
            Registry::fs()->debug("[RefResolver] '{}' matched {} -> {}", reference, candidate, toHex(id));
            return id;
        } catch (const Error& e) {
            if (e.kind() != ErrorKind::NotFound) throw;
        }
    }

    if (const auto id = parseOid(reference)) {
        if (!store_.hasObject(*id))
            throw Error(ErrorKind::NotFound, fmt::format("object {} does not exist", reference));
        return *id;
    }

    throw Error(ErrorKind::NotFound, fmt::format("reference '{}' not found", reference));
}

CommitRef RefResolver::resolve(const std::string& reference) const {
    Oid id = lookupName(reference);

    // Annotated tags point at another object, possibly another tag
    for (int depth = 0;; ++depth) {
        if (depth > MAX_TAG_DEPTH)
            throw Error(ErrorKind::StoreCorruption, fmt::format("tag chain for '{}' too deep", reference));

        auto obj = store_.getObject(id);
        if (obj.kind == ObjectKind::Tag) {
            id = parseTag(obj.payload).object;
            continue;
        }

        if (obj.kind != ObjectKind::Commit)
            throw Error(ErrorKind::NotACommit,
                        fmt::format("'{}' resolves to a {}, not a commit", reference, to_string(obj.kind)));

        const auto commit = parseCommit(obj.payload);

        CommitRef ref;
        ref.commit = id;
        ref.rootTree = commit.tree;
        ref.commitTime = commit.commitTime;
        ref.reference = reference;

        Registry::fs()->info("[RefResolver] '{}' resolved to commit {} (tree {})", reference, toHex(ref.commit),
                             toHex(ref.rootTree));
        return ref;
    }
}
