#pragma once

#include "git/ObjectStore.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <unordered_map>
#include <vector>

namespace gm::fs {

using BlobBuffer = std::vector<uint8_t>;

struct BlobHandle {
    git::Oid id{};
    uint64_t totalSize{0};
    std::shared_ptr<const BlobBuffer> data;
};

// Byte-range access to blobs. A blob is decoded whole on open; with sharing
// enabled, concurrent handles on the same blob hold one immutable buffer
// that is freed when the last handle closes.
class BlobReader {
public:
    explicit BlobReader(const git::ObjectStore& store, bool shareBuffers = true);

    // Throws NotFound, or StoreCorruption when `id` does not name a decodable blob.
    [[nodiscard]] BlobHandle open(const git::Oid& id);

    // At most `length` bytes from `offset`; empty at or past end of blob.
    // The span stays valid while the handle is open. Negative arguments are InvalidArgument.
    [[nodiscard]] std::span<const uint8_t> read(const BlobHandle& handle, int64_t offset, int64_t length) const;

    void close(BlobHandle& handle);

    // Blob length without keeping the payload; cached per id.
    [[nodiscard]] uint64_t size(const git::Oid& id) const;

    [[nodiscard]] std::size_t liveBuffers() const;

private:
    const git::ObjectStore& store_;
    const bool share_;

    mutable std::mutex buffersMutex_;
    std::unordered_map<git::Oid, std::weak_ptr<const BlobBuffer>, git::OidHash> buffers_;

    mutable std::shared_mutex sizesMutex_;
    mutable std::unordered_map<git::Oid, uint64_t, git::OidHash> sizes_;

    [[nodiscard]] std::shared_ptr<const BlobBuffer> decode(const git::Oid& id) const;
};

}
