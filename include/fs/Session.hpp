#pragma once

#include "fs/BlobReader.hpp"
#include "fs/PathIndex.hpp"
#include "fs/cache/InodeRegistry.hpp"
#include "fs/model/Node.hpp"
#include "git/ObjectStore.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <unordered_map>

namespace gm::fs {

enum class MountState { Unmounted, Mounting, Mounted, Unmounting };

std::string to_string(MountState state);

// Everything one mount owns. Sessions share nothing with each other, so
// several can live in one process.
class Session {
public:
    Session(std::shared_ptr<const git::ObjectStore> store, model::CommitRef commit, bool shareBlobBuffers = true);

    // Opens the repository and resolves `reference`. Every failure is rethrown as MountFailure.
    static std::unique_ptr<Session> open(const std::filesystem::path& repoPath, const std::string& reference,
                                         bool verifyObjects = false, bool shareBlobBuffers = true);

    [[nodiscard]] MountState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool isMounted() const noexcept { return state() == MountState::Mounted; }

    void beginMount();
    void markMounted();
    void beginUnmount();
    void markUnmounted();
    // Mounting -> Unmounted when the kernel mount never came up
    void abortMount();

    [[nodiscard]] PathIndex& index() noexcept { return index_; }
    [[nodiscard]] cache::InodeRegistry& inodes() noexcept { return inodes_; }
    [[nodiscard]] BlobReader& blobs() noexcept { return blobs_; }
    [[nodiscard]] const model::CommitRef& commit() const noexcept { return index_.commit(); }

    uint64_t addHandle(BlobHandle handle);
    // Throws BadHandle for an unknown file handle.
    [[nodiscard]] BlobHandle handle(uint64_t fh) const;
    [[nodiscard]] BlobHandle takeHandle(uint64_t fh);
    [[nodiscard]] std::size_t openHandles() const;

    [[nodiscard]] uid_t uid() const noexcept { return uid_; }
    [[nodiscard]] gid_t gid() const noexcept { return gid_; }

private:
    std::shared_ptr<const git::ObjectStore> store_;
    PathIndex index_;
    cache::InodeRegistry inodes_;
    BlobReader blobs_;

    std::atomic<MountState> state_{MountState::Unmounted};

    mutable std::mutex handlesMutex_;
    uint64_t nextHandle_ = 1;
    std::unordered_map<uint64_t, BlobHandle> handles_;

    uid_t uid_;
    gid_t gid_;

    void transition(MountState from, MountState to);
};

}
