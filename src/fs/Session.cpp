#include "fs/Session.hpp"
#include "fs/RefResolver.hpp"
#include "git/Repository.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <unistd.h>

using namespace gm::fs;
using namespace gm::fs::model;
using namespace gm::git;
using namespace gm::types;
using namespace gm::log;

std::string gm::fs::to_string(const MountState state) {
    switch (state) {
        case MountState::Unmounted:  return "unmounted";
        case MountState::Mounting:   return "mounting";
        case MountState::Mounted:    return "mounted";
        case MountState::Unmounting: return "unmounting";
    }
    return "unknown";
}

Session::Session(std::shared_ptr<const ObjectStore> store, CommitRef commit, const bool shareBlobBuffers)
    : store_(std::move(store)),
      index_(*store_, std::move(commit)),
      blobs_(*store_, shareBlobBuffers),
      uid_(::getuid()),
      gid_(::getgid()) {}

std::unique_ptr<Session> Session::open(const std::filesystem::path& repoPath, const std::string& reference,
                                       const bool verifyObjects, const bool shareBlobBuffers) {
    try {
        auto repo = std::make_shared<Repository>(repoPath, verifyObjects);
        auto commit = RefResolver(*repo).resolve(reference);
        return std::make_unique<Session>(std::move(repo), std::move(commit), shareBlobBuffers);
    } catch (const Error& e) {
        throw Error(ErrorKind::MountFailure,
                    fmt::format("cannot mount '{}' at {}: {}", reference, repoPath.string(), e.what()));
    } catch (const std::exception& e) {
        throw Error(ErrorKind::MountFailure, fmt::format("cannot open repository {}: {}", repoPath.string(), e.what()));
    }
}

void Session::transition(const MountState from, const MountState to) {
    auto expected = from;
    if (!state_.compare_exchange_strong(expected, to, std::memory_order_acq_rel))
        throw Error(to == MountState::Mounting ? ErrorKind::MountFailure : ErrorKind::NotMounted,
                    fmt::format("cannot move session from {} to {}", to_string(expected), to_string(to)));
    Registry::gitmount()->debug("[Session] {} -> {}", to_string(from), to_string(to));
}

void Session::beginMount() { transition(MountState::Unmounted, MountState::Mounting); }
void Session::markMounted() { transition(MountState::Mounting, MountState::Mounted); }
void Session::beginUnmount() { transition(MountState::Mounted, MountState::Unmounting); }
void Session::markUnmounted() { transition(MountState::Unmounting, MountState::Unmounted); }
void Session::abortMount() { transition(MountState::Mounting, MountState::Unmounted); }

uint64_t Session::addHandle(BlobHandle handle) {
    std::scoped_lock lock(handlesMutex_);
    const auto fh = nextHandle_++;
    handles_.emplace(fh, std::move(handle));
    return fh;
}

BlobHandle Session::handle(const uint64_t fh) const {
    std::scoped_lock lock(handlesMutex_);
    if (const auto it = handles_.find(fh); it != handles_.end()) return it->second;
    throw Error(ErrorKind::BadHandle, fmt::format("unknown file handle {}", fh));
}

BlobHandle Session::takeHandle(const uint64_t fh) {
    std::scoped_lock lock(handlesMutex_);
    const auto it = handles_.find(fh);
    if (it == handles_.end()) throw Error(ErrorKind::BadHandle, fmt::format("unknown file handle {}", fh));
    auto handle = std::move(it->second);
    handles_.erase(it);
    return handle;
}

std::size_t Session::openHandles() const {
    std::scoped_lock lock(handlesMutex_);
    return handles_.size();
}
