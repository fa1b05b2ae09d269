#include "fs/BlobReader.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace gm::fs;
using namespace gm::git;
using namespace gm::types;
using namespace gm::log;

BlobReader::BlobReader(const ObjectStore& store, const bool shareBuffers)
    : store_(store), share_(shareBuffers) {}

std::shared_ptr<const BlobBuffer> BlobReader::decode(const Oid& id) const {
    auto obj = store_.getObject(id);
    if (obj.kind != ObjectKind::Blob)
        throw Error(ErrorKind::StoreCorruption, fmt::format("object {} is a {}, not a blob", toHex(id), to_string(obj.kind)));
    return std::make_shared<const BlobBuffer>(std::move(obj.payload));
}

BlobHandle BlobReader::open(const Oid& id) {
    std::shared_ptr<const BlobBuffer> data;

    if (share_) {
        std::scoped_lock lock(buffersMutex_);
        if (const auto it = buffers_.find(id); it != buffers_.end()) data = it->second.lock();
    }

    if (!data) {
        data = decode(id);

        if (share_) {
            std::scoped_lock lock(buffersMutex_);
            auto& slot = buffers_[id];
            if (const auto existing = slot.lock()) data = existing;
            else slot = data;
        }

        Registry::fs()->debug("[BlobReader] Decoded blob {} ({} bytes)", toHex(id), data->size());
    }

    {
        std::unique_lock lock(sizesMutex_);
        sizes_.emplace(id, data->size());
    }

    return {id, data->size(), std::move(data)};
}

std::span<const uint8_t> BlobReader::read(const BlobHandle& handle, const int64_t offset, const int64_t length) const {
    if (offset < 0 || length < 0)
        throw Error(ErrorKind::InvalidArgument, fmt::format("invalid read range offset={} length={}", offset, length));
    if (!handle.data) throw Error(ErrorKind::BadHandle, fmt::format("read on closed handle for {}", toHex(handle.id)));

    const auto total = handle.data->size();
    const auto start = static_cast<uint64_t>(offset);
    if (start >= total) return {};

    const auto count = std::min<uint64_t>(static_cast<uint64_t>(length), total - start);
    return {handle.data->data() + start, static_cast<std::size_t>(count)};
}

void BlobReader::close(BlobHandle& handle) {
    const auto id = handle.id;
    handle.data.reset();

    if (!share_) return;

    std::scoped_lock lock(buffersMutex_);
    if (const auto it = buffers_.find(id); it != buffers_.end() && it->second.expired()) buffers_.erase(it);
}

uint64_t BlobReader::size(const Oid& id) const {
    {
        std::shared_lock lock(sizesMutex_);
        if (const auto it = sizes_.find(id); it != sizes_.end()) return it->second;
    }

    const auto info = store_.stat(id);
    if (info.kind != ObjectKind::Blob)
        throw Error(ErrorKind::StoreCorruption, fmt::format("object {} is a {}, not a blob", toHex(id), to_string(info.kind)));

    std::unique_lock lock(sizesMutex_);
    sizes_.emplace(id, info.size);
    return info.size;
}

std::size_t BlobReader::liveBuffers() const {
    std::scoped_lock lock(buffersMutex_);
    return static_cast<std::size_t>(std::ranges::count_if(buffers_, [](const auto& kv) { return !kv.second.expired(); }));
}
