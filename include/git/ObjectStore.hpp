#pragma once

#include "git/Object.hpp"
#include "git/Oid.hpp"

#include <string>

namespace gm::git {

// Content-addressable object access. Implementations must be safe to call
// from many threads at once; objects never change once written.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Throws NotFound for an unknown id, StoreCorruption for undecodable bytes.
    [[nodiscard]] virtual Object getObject(const Oid& id) const = 0;

    // Kind and payload length, without materialising the payload where the storage format allows.
    [[nodiscard]] virtual ObjectInfo stat(const Oid& id) const = 0;

    [[nodiscard]] virtual bool hasObject(const Oid& id) const = 0;

    // Exact reference name ("HEAD", "refs/heads/main"); symbolic refs are followed. Throws NotFound.
    [[nodiscard]] virtual Oid resolveRef(const std::string& name) const = 0;
};

}
