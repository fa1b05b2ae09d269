#include "git/Repository.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

#include <cstring>
#include <fmt/core.h>
#include <git2.h>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>

using namespace gm::git;
using namespace gm::types;
using namespace gm::log;

namespace {

git_oid toGitOid(const Oid& id) {
    git_oid out;
    git_oid_fromraw(&out, id.data());
    return out;
}

Oid fromGitOid(const git_oid& id) {
    Oid out{};
    std::memcpy(out.data(), id.id, OID_RAW_LEN);
    return out;
}

std::optional<ObjectKind> kindFromGit(const git_object_t type) noexcept {
    switch (type) {
        case GIT_OBJECT_COMMIT: return ObjectKind::Commit;
        case GIT_OBJECT_TREE:   return ObjectKind::Tree;
        case GIT_OBJECT_BLOB:   return ObjectKind::Blob;
        case GIT_OBJECT_TAG:    return ObjectKind::Tag;
        default:                return std::nullopt;
    }
}

git_object_t toGitType(const ObjectKind kind) noexcept {
    switch (kind) {
        case ObjectKind::Commit: return GIT_OBJECT_COMMIT;
        case ObjectKind::Tree:   return GIT_OBJECT_TREE;
        case ObjectKind::Blob:   return GIT_OBJECT_BLOB;
        case ObjectKind::Tag:    return GIT_OBJECT_TAG;
    }
    return GIT_OBJECT_INVALID;
}

// GIT_ENOTFOUND and GIT_EINVALIDSPEC mean the name or id is simply not there;
// every other failure comes from bytes libgit2 could not decode.
[[noreturn]] void throwGit(const int rc, const std::string& ctx) {
    std::string msg = ctx;
    if (const git_error* e = git_error_last(); e && e->message) {
        msg += ": ";
        msg += e->message;
    }

    if (rc == GIT_ENOTFOUND || rc == GIT_EINVALIDSPEC) throw Error(ErrorKind::NotFound, msg);
    throw Error(ErrorKind::StoreCorruption, msg);
}

ObjectKind requireKind(const git_object_t type, const Oid& id) {
    const auto kind = kindFromGit(type);
    if (!kind)
        throw Error(ErrorKind::StoreCorruption,
                    fmt::format("object {} has unknown type {}", toHex(id), static_cast<int>(type)));
    return *kind;
}

}

Repository::Library::Library() {
    if (git_libgit2_init() < 0) throw std::runtime_error("libgit2 initialisation failed");

    // Decoded trees and blob sizes are cached above this layer, and hashes are
    // checked here when verification is configured.
    if (git_libgit2_opts(GIT_OPT_ENABLE_CACHING, 0) < 0 ||
        git_libgit2_opts(GIT_OPT_ENABLE_STRICT_HASH_VERIFICATION, 0) < 0) {
        git_libgit2_shutdown();
        throw std::runtime_error("libgit2 rejected its runtime options");
    }
}

Repository::Library::~Library() { git_libgit2_shutdown(); }

Repository::Repository(const std::filesystem::path& path, const bool verifyObjects)
    : path_(path.string()), verify_(verifyObjects) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        throw Error(ErrorKind::NotFound, fmt::format("repository path {} does not exist", path_));

    const auto first = openHandle();
    idle_.push_back(first);
    Registry::git()->info("[Repository] Opened {} (verify={})", git_repository_path(first.repo), verify_);
}

Repository::~Repository() {
    for (const auto& handle : idle_) closeHandle(handle);
}

Repository::Handle Repository::openHandle() const {
    Handle handle;
    if (const int rc = git_repository_open_ext(&handle.repo, path_.c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH, nullptr);
        rc != 0) {
        if (rc == GIT_ENOTFOUND) throw Error(ErrorKind::NotFound, fmt::format("{} is not a git repository", path_));
        throwGit(rc, fmt::format("cannot open repository {}", path_));
    }

    if (const int rc = git_repository_odb(&handle.odb, handle.repo); rc != 0) {
        git_repository_free(handle.repo);
        throwGit(rc, fmt::format("cannot open object database of {}", path_));
    }

    return handle;
}

void Repository::closeHandle(const Handle handle) noexcept {
    git_odb_free(handle.odb);
    git_repository_free(handle.repo);
}

Repository::Lease Repository::acquire() const {
    {
        std::scoped_lock lock(poolMutex_);
        if (!idle_.empty()) {
            const auto handle = idle_.back();
            idle_.pop_back();
            return Lease(*this, handle);
        }
    }

    Registry::git()->debug("[Repository] Opening another handle on {}", path_);
    return Lease(*this, openHandle());
}

void Repository::release(const Handle handle) const {
    std::scoped_lock lock(poolMutex_);
    try {
        idle_.push_back(handle);
    } catch (const std::bad_alloc&) {
        closeHandle(handle);
    }
}

void Repository::verify(const Oid& id, const Object& obj) const {
    git_oid actual;
    if (const int rc = git_odb_hash(&actual, obj.payload.data(), obj.payload.size(), toGitType(obj.kind)); rc != 0)
        throwGit(rc, fmt::format("cannot hash object {}", toHex(id)));

    if (fromGitOid(actual) != id)
        throw Error(ErrorKind::StoreCorruption,
                    fmt::format("object {} fails hash verification (content hashes to {})", toHex(id),
                                toHex(fromGitOid(actual))));
}

Object Repository::getObject(const Oid& id) const {
    const auto lease = acquire();
    const auto oid = toGitOid(id);

    git_odb_object* raw = nullptr;
    if (const int rc = git_odb_read(&raw, lease.odb(), &oid); rc != 0)
        throwGit(rc, fmt::format("cannot read object {}", toHex(id)));
    const std::unique_ptr<git_odb_object, decltype(&git_odb_object_free)> odbObject(raw, &git_odb_object_free);

    const auto* data = static_cast<const uint8_t*>(git_odb_object_data(odbObject.get()));
    const auto size = git_odb_object_size(odbObject.get());

    Object obj;
    obj.kind = requireKind(git_odb_object_type(odbObject.get()), id);
    if (size > 0) obj.payload.assign(data, data + size);

    if (verify_) verify(id, obj);
    return obj;
}

ObjectInfo Repository::stat(const Oid& id) const {
    const auto lease = acquire();
    const auto oid = toGitOid(id);

    std::size_t size = 0;
    git_object_t type = GIT_OBJECT_INVALID;
    if (const int rc = git_odb_read_header(&size, &type, lease.odb(), &oid); rc != 0)
        throwGit(rc, fmt::format("cannot read header of object {}", toHex(id)));

    return ObjectInfo{requireKind(type, id), size};
}

bool Repository::hasObject(const Oid& id) const {
    const auto lease = acquire();
    const auto oid = toGitOid(id);
    return git_odb_exists(lease.odb(), &oid) == 1;
}

bool Repository::isRefName(const std::string& name) {
    if (name.empty()) return false;
    if (name.starts_with("refs/")) return true;

    for (const char c : name)
        if (!((c >= 'A' && c <= 'Z') || c == '_')) return false;
    return true;
}

Oid Repository::resolveRef(const std::string& name) const {
    if (!isRefName(name)) throw Error(ErrorKind::NotFound, fmt::format("invalid reference name '{}'", name));

    const auto lease = acquire();
    git_oid out;
    // Symbolic refs are followed; a loop fails inside libgit2 and surfaces as corruption
    if (const int rc = git_reference_name_to_id(&out, lease.repo(), name.c_str()); rc != 0)
        throwGit(rc, fmt::format("reference '{}'", name));

    return fromGitOid(out);
}
