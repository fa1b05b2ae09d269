#pragma once

#include "git/ObjectStore.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

struct git_repository;
struct git_odb;

namespace gm::git {

// A repository on local disk, read through libgit2. libgit2 handles are not
// shared between threads: each concurrent caller borrows its own from a pool.
class Repository final : public ObjectStore {
public:
    // `<path>/.git`, a "gitdir:" file, or `<path>` itself when bare. Throws NotFound.
    explicit Repository(const std::filesystem::path& path, bool verifyObjects = false);
    ~Repository() override;

    Repository(const Repository&) = delete;
    Repository& operator=(const Repository&) = delete;

    [[nodiscard]] Object getObject(const Oid& id) const override;
    [[nodiscard]] ObjectInfo stat(const Oid& id) const override;
    [[nodiscard]] bool hasObject(const Oid& id) const override;
    [[nodiscard]] Oid resolveRef(const std::string& name) const override;

private:
    struct Library {
        Library();
        ~Library();
    };

    struct Handle {
        git_repository* repo{nullptr};
        git_odb* odb{nullptr};
    };

    class Lease {
    public:
        Lease(const Repository& owner, Handle handle) : owner_(owner), handle_(handle) {}
        ~Lease() { owner_.release(handle_); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        [[nodiscard]] git_repository* repo() const noexcept { return handle_.repo; }
        [[nodiscard]] git_odb* odb() const noexcept { return handle_.odb; }

    private:
        const Repository& owner_;
        Handle handle_;
    };

    Library library_;
    std::string path_;
    bool verify_;

    mutable std::mutex poolMutex_;
    mutable std::vector<Handle> idle_;

    [[nodiscard]] Handle openHandle() const;
    static void closeHandle(Handle handle) noexcept;

    [[nodiscard]] Lease acquire() const;
    void release(Handle handle) const;

    void verify(const Oid& id, const Object& obj) const;

    // Outside refs/ git only knows pseudo refs such as HEAD or ORIG_HEAD
    [[nodiscard]] static bool isRefName(const std::string& name);
};

}
