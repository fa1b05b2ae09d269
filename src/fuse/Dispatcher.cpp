#include "fuse/Dispatcher.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <fcntl.h>
#include <fmt/core.h>
#include <unistd.h>

using namespace gm::fuse;
using namespace gm::fs;
using namespace gm::fs::model;
using namespace gm::types;
using namespace gm::log;

namespace {

constexpr blksize_t BLOCK_SIZE = 4096;
constexpr unsigned long NAME_MAX_LEN = 255;

mode_t typeBits(const NodeKind kind) {
    switch (kind) {
        case NodeKind::File:      return S_IFREG;
        case NodeKind::Symlink:   return S_IFLNK;
        case NodeKind::Directory: return S_IFDIR;
        case NodeKind::Submodule: return S_IFDIR;
    }
    return S_IFDIR;
}

// Write bits never appear; only the exec bit of a file survives from git
mode_t permissionBits(const PathNode& node) {
    if (node.kind == NodeKind::File) return node.executable() ? 0555 : 0444;
    return 0555;
}

std::string parentPath(const std::string& path) {
    const auto slash = path.rfind('/');
    if (slash == std::string::npos || slash == 0) return "/";
    return path.substr(0, slash);
}

}

Dispatcher::Dispatcher(Session& session, const Options options) : session_(session), options_(options) {}

Reply Dispatcher::dispatch(const Request& request) {
    try {
        if (!session_.isMounted())
            throw Error(ErrorKind::NotMounted, fmt::format("session is {}", to_string(session_.state())));

        return std::visit([this](const auto& r) -> Reply { return handle(r); }, request);
    } catch (const Error& e) {
        int errnum = e.errnum();
        if (e.kind() == ErrorKind::NotAFile && std::holds_alternative<request::Open>(request)) errnum = EISDIR;

        if (e.kind() == ErrorKind::StoreCorruption) Registry::fuse()->error("[Dispatcher] {}", e.what());
        else Registry::fuse()->debug("[Dispatcher] {} ({})", e.what(), types::to_string(e.kind()));

        return reply::Error{e.kind(), errnum, e.what()};
    } catch (const std::exception& e) {
        Registry::fuse()->error("[Dispatcher] Unexpected failure: {}", e.what());
        return reply::Error{ErrorKind::StoreCorruption, EIO, e.what()};
    }
}

PathNode Dispatcher::nodeFor(const Inode ino) const {
    return session_.index().lookup(session_.inodes().resolvePath(ino));
}

struct stat Dispatcher::attrFor(const Inode ino, const PathNode& node) const {
    struct stat st{};
    st.st_ino = ino;
    st.st_mode = typeBits(node.kind) | permissionBits(node);
    st.st_nlink = 1;
    st.st_uid = session_.uid();
    st.st_gid = session_.gid();
    st.st_blksize = BLOCK_SIZE;

    if (node.kind == NodeKind::File || node.kind == NodeKind::Symlink)
        st.st_size = static_cast<off_t>(session_.blobs().size(node.id));

    st.st_blocks = (st.st_size + 511) / 512;

    // Git records no per-file times; the commit time stands in for all three
    st.st_mtim.tv_sec = session_.commit().commitTime;
    st.st_atim = st.st_ctim = st.st_mtim;
    return st;
}

reply::Entry Dispatcher::handle(const request::Lookup& r) {
    Registry::fuse()->debug("[lookup] parent: {}, name: {}", r.parent, r.name);

    if (r.name.empty() || r.name.find('/') != std::string::npos)
        throw Error(ErrorKind::InvalidArgument, fmt::format("invalid entry name '{}'", r.name));

    const auto parent = session_.inodes().resolvePath(r.parent);
    const auto node = session_.index().lookup(joinPath(parent, r.name));

    auto& inodes = session_.inodes();
    const auto ino = inodes.getOrAssignInode(node.path);
    inodes.incrementLookup(ino);

    return {ino, attrFor(ino, node), options_.attrTimeout, options_.entryTimeout};
}

reply::Attr Dispatcher::handle(const request::GetAttr& r) {
    Registry::fuse()->debug("[getattr] inode: {}", r.ino);
    return {attrFor(r.ino, nodeFor(r.ino)), options_.attrTimeout};
}

reply::Directory Dispatcher::handle(const request::ReadDir& r) {
    Registry::fuse()->debug("[readdir] inode: {}", r.ino);

    const auto path = session_.inodes().resolvePath(r.ino);
    const auto children = session_.index().listChildren(path);

    auto& inodes = session_.inodes();
    reply::Directory dir;
    dir.entries.reserve(children.size() + 2);
    dir.entries.push_back({".", r.ino, S_IFDIR});
    dir.entries.push_back({"..", inodes.getOrAssignInode(parentPath(path)), S_IFDIR});

    for (const auto& child : children) {
        const auto name = child.path.substr(child.path.rfind('/') + 1);
        dir.entries.push_back({name, inodes.getOrAssignInode(child.path), typeBits(child.kind)});
    }

    return dir;
}

reply::Open Dispatcher::handle(const request::Open& r) {
    Registry::fuse()->debug("[open] inode: {}, flags: {:#o}", r.ino, r.flags);

    if ((r.flags & O_ACCMODE) != O_RDONLY || (r.flags & (O_TRUNC | O_APPEND | O_CREAT)))
        throw Error(ErrorKind::PermissionDenied, fmt::format("open of inode {} with write intent", r.ino));

    const auto node = nodeFor(r.ino);
    if (node.kind != NodeKind::File) throw Error(ErrorKind::NotAFile, fmt::format("{} is a {}", node.path, to_string(node.kind)));

    auto handle = session_.blobs().open(node.id);
    return {session_.addHandle(std::move(handle))};
}

reply::Data Dispatcher::handle(const request::Read& r) {
    Registry::fuse()->trace("[read] inode: {}, fh: {}, offset: {}, length: {}", r.ino, r.fh, r.offset, r.length);

    const auto handle = session_.handle(r.fh);
    const auto bytes = session_.blobs().read(handle, r.offset, r.length);
    return {handle.data, bytes};
}

reply::Link Dispatcher::handle(const request::ReadLink& r) {
    Registry::fuse()->debug("[readlink] inode: {}", r.ino);

    const auto node = nodeFor(r.ino);
    if (node.kind != NodeKind::Symlink) throw Error(ErrorKind::NotAFile, fmt::format("{} is not a symlink", node.path));

    // The target is handed back verbatim, even when it leaves the tree
    auto& blobs = session_.blobs();
    auto handle = blobs.open(node.id);
    std::string target(handle.data->begin(), handle.data->end());
    blobs.close(handle);
    return {std::move(target)};
}

reply::Empty Dispatcher::handle(const request::Release& r) {
    Registry::fuse()->debug("[release] inode: {}, fh: {}", r.ino, r.fh);
    auto handle = session_.takeHandle(r.fh);
    session_.blobs().close(handle);
    return {};
}

reply::Empty Dispatcher::handle(const request::Access& r) {
    Registry::fuse()->debug("[access] inode: {}, mask: {:#o}", r.ino, r.mask);

    const auto node = nodeFor(r.ino);
    if (r.mask & W_OK) throw Error(ErrorKind::PermissionDenied, fmt::format("{} is read-only", node.path));
    if ((r.mask & X_OK) && node.kind == NodeKind::File && !node.executable())
        throw Error(ErrorKind::PermissionDenied, fmt::format("{} is not executable", node.path));
    return {};
}

reply::Empty Dispatcher::handle(const request::Forget& r) {
    session_.inodes().decrementInodeRef(r.ino, r.nlookup);
    return {};
}

reply::StatFs Dispatcher::handle(const request::StatFs& r) {
    Registry::fuse()->debug("[statfs] inode: {}", r.ino);

    reply::StatFs out{};
    out.st.f_bsize = BLOCK_SIZE;
    out.st.f_frsize = BLOCK_SIZE;
    out.st.f_files = session_.inodes().size();
    out.st.f_namemax = NAME_MAX_LEN;
    out.st.f_flag = ST_RDONLY;
    return out;
}

reply::Empty Dispatcher::handle(const request::Modify& r) {
    Registry::fuse()->debug("[{}] inode: {}, name: '{}' rejected on read-only mount", to_string(r.op), r.ino, r.name);
    throw Error(ErrorKind::PermissionDenied, fmt::format("{} is not permitted on a read-only mount", to_string(r.op)));
}
