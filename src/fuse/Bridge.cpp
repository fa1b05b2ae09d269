#include "fuse/Bridge.hpp"
#include "fuse/Dispatcher.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cerrno>
#include <vector>

using namespace gm::config;
using namespace gm::log;

namespace gm::fuse {

namespace {

Dispatcher& dispatcherFor(const fuse_req_t req) {
    return *static_cast<Dispatcher*>(fuse_req_userdata(req));
}

// Reply with the errno of an error reply; a reply of the wrong shape is an I/O error
void replyErr(const fuse_req_t req, const Reply& reply, const char* op) {
    const int err = errnoOf(reply);
    if (err == 0) Registry::fuse()->error("[{}] Unexpected reply type", op);
    fuse_reply_err(req, err == 0 ? EIO : err);
}

void reject(const fuse_req_t req, const request::WriteOp op, const fuse_ino_t ino, const char* name = "") {
    const auto reply = dispatcherFor(req).dispatch(request::Modify{op, ino, name ? name : ""});
    fuse_reply_err(req, errnoOf(reply) ? errnoOf(reply) : EACCES);
}

}

void init(void* userdata, fuse_conn_info* conn) {
    (void)userdata;
    Registry::fuse()->debug("[FUSE] Initializing FUSE connection...");

    constexpr unsigned int KB = 1024;

    conn->want |= FUSE_CAP_ASYNC_READ;
    conn->max_readahead = ConfigRegistry::get().fuse.max_readahead_kb * KB;

    Registry::fuse()->debug("[FUSE] Connection initialized with max_readahead={} bytes", conn->max_readahead);
}

void lookup(const fuse_req_t req, const fuse_ino_t parent, const char* name) {
    const auto reply = dispatcherFor(req).dispatch(request::Lookup{parent, name});

    if (const auto* entry = std::get_if<reply::Entry>(&reply)) {
        fuse_entry_param e{};
        e.ino = entry->ino;
        e.attr = entry->attr;
        e.attr_timeout = entry->attrTimeout;
        e.entry_timeout = entry->entryTimeout;
        fuse_reply_entry(req, &e);
        return;
    }

    // A negative entry with a timeout lets the kernel cache the miss
    if (errnoOf(reply) == ENOENT) {
        fuse_entry_param e{};
        e.ino = 0;
        e.entry_timeout = ConfigRegistry::get().fuse.entry_timeout;
        fuse_reply_entry(req, &e);
        return;
    }

    replyErr(req, reply, "lookup");
}

void forget(const fuse_req_t req, const fuse_ino_t ino, const uint64_t nlookup) {
    (void)dispatcherFor(req).dispatch(request::Forget{ino, nlookup});
    fuse_reply_none(req);
}

void getattr(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    (void)fi;
    const auto reply = dispatcherFor(req).dispatch(request::GetAttr{ino});

    if (const auto* attr = std::get_if<reply::Attr>(&reply)) {
        fuse_reply_attr(req, &attr->attr, attr->timeout);
        return;
    }

    replyErr(req, reply, "getattr");
}

void readlink(const fuse_req_t req, const fuse_ino_t ino) {
    const auto reply = dispatcherFor(req).dispatch(request::ReadLink{ino});

    if (const auto* link = std::get_if<reply::Link>(&reply)) {
        fuse_reply_readlink(req, link->target.c_str());
        return;
    }

    replyErr(req, reply, "readlink");
}

void open(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    const auto reply = dispatcherFor(req).dispatch(request::Open{ino, fi->flags});

    if (const auto* opened = std::get_if<reply::Open>(&reply)) {
        fi->fh = opened->fh;
        fi->keep_cache = 1; // blob content never changes under a mount
        if (fuse_reply_open(req, fi) == -ENOENT) {
            // The opener went away; drop the handle it will never release
            (void)dispatcherFor(req).dispatch(request::Release{ino, opened->fh});
        }
        return;
    }

    replyErr(req, reply, "open");
}

void read(const fuse_req_t req, const fuse_ino_t ino, const size_t size, const off_t off, fuse_file_info* fi) {
    const auto reply = dispatcherFor(req).dispatch(
        request::Read{ino, fi->fh, static_cast<int64_t>(off), static_cast<int64_t>(size)});

    if (const auto* data = std::get_if<reply::Data>(&reply)) {
        fuse_reply_buf(req, reinterpret_cast<const char*>(data->bytes.data()), data->bytes.size());
        return;
    }

    replyErr(req, reply, "read");
}

void release(const fuse_req_t req, const fuse_ino_t ino, fuse_file_info* fi) {
    const auto reply = dispatcherFor(req).dispatch(request::Release{ino, fi->fh});
    fuse_reply_err(req, errnoOf(reply));
}

void readdir(const fuse_req_t req, const fuse_ino_t ino, const size_t size, const off_t off, fuse_file_info* fi) {
    (void)fi;
    const auto reply = dispatcherFor(req).dispatch(request::ReadDir{ino});

    const auto* dir = std::get_if<reply::Directory>(&reply);
    if (!dir) {
        replyErr(req, reply, "readdir");
        return;
    }

    std::vector<char> buf(size);
    size_t buf_used = 0;

    // Offsets are entry positions; the kernel resumes from the last one it consumed
    for (auto i = static_cast<size_t>(std::max<off_t>(off, 0)); i < dir->entries.size(); ++i) {
        const auto& entry = dir->entries[i];

        struct stat st{};
        st.st_ino = entry.ino;
        st.st_mode = entry.type;

        const auto next_off = static_cast<off_t>(i + 1);
        const size_t entry_size = fuse_add_direntry(req, nullptr, 0, entry.name.c_str(), &st, next_off);
        if (buf_used + entry_size > size) break;

        fuse_add_direntry(req, buf.data() + buf_used, entry_size, entry.name.c_str(), &st, next_off);
        buf_used += entry_size;
    }

    fuse_reply_buf(req, buf.data(), buf_used);
}

void statfs(const fuse_req_t req, const fuse_ino_t ino) {
    const auto reply = dispatcherFor(req).dispatch(request::StatFs{ino});

    if (const auto* st = std::get_if<reply::StatFs>(&reply)) {
        fuse_reply_statfs(req, &st->st);
        return;
    }

    replyErr(req, reply, "statfs");
}

void access(const fuse_req_t req, const fuse_ino_t ino, const int mask) {
    const auto reply = dispatcherFor(req).dispatch(request::Access{ino, mask});
    fuse_reply_err(req, errnoOf(reply));
}

void setattr(const fuse_req_t req, const fuse_ino_t ino, struct stat* attr, const int to_set, fuse_file_info* fi) {
    (void)attr;
    (void)fi;
    Registry::fuse()->debug("[setattr] inode: {}, to_set: {}", ino, to_set);
    reject(req, request::WriteOp::SetAttr, ino);
}

void mknod(const fuse_req_t req, const fuse_ino_t parent, const char* name, const mode_t mode, const dev_t rdev) {
    (void)mode;
    (void)rdev;
    reject(req, request::WriteOp::MkNod, parent, name);
}

void mkdir(const fuse_req_t req, const fuse_ino_t parent, const char* name, const mode_t mode) {
    (void)mode;
    reject(req, request::WriteOp::MkDir, parent, name);
}

void unlink(const fuse_req_t req, const fuse_ino_t parent, const char* name) {
    reject(req, request::WriteOp::Unlink, parent, name);
}

void rmdir(const fuse_req_t req, const fuse_ino_t parent, const char* name) {
    reject(req, request::WriteOp::RmDir, parent, name);
}

void symlink(const fuse_req_t req, const char* link, const fuse_ino_t parent, const char* name) {
    (void)link;
    reject(req, request::WriteOp::Symlink, parent, name);
}

void rename(const fuse_req_t req, const fuse_ino_t parent, const char* name, const fuse_ino_t newparent,
            const char* newname, const unsigned int flags) {
    (void)newparent;
    (void)newname;
    (void)flags;
    reject(req, request::WriteOp::Rename, parent, name);
}

void link(const fuse_req_t req, const fuse_ino_t ino, const fuse_ino_t newparent, const char* newname) {
    (void)newparent;
    reject(req, request::WriteOp::Link, ino, newname);
}

void write(const fuse_req_t req, const fuse_ino_t ino, const char* buf, const size_t size, const off_t off,
           fuse_file_info* fi) {
    (void)buf;
    (void)size;
    (void)off;
    (void)fi;
    reject(req, request::WriteOp::Write, ino);
}

void create(const fuse_req_t req, const fuse_ino_t parent, const char* name, const mode_t mode, fuse_file_info* fi) {
    (void)mode;
    (void)fi;
    reject(req, request::WriteOp::Create, parent, name);
}

void setxattr(const fuse_req_t req, const fuse_ino_t ino, const char* name, const char* value, const size_t size,
              const int flags) {
    (void)value;
    (void)size;
    (void)flags;
    reject(req, request::WriteOp::SetXAttr, ino, name);
}

void removexattr(const fuse_req_t req, const fuse_ino_t ino, const char* name) {
    reject(req, request::WriteOp::RemoveXAttr, ino, name);
}

void fallocate(const fuse_req_t req, const fuse_ino_t ino, const int mode, const off_t offset, const off_t length,
               fuse_file_info* fi) {
    (void)mode;
    (void)offset;
    (void)length;
    (void)fi;
    reject(req, request::WriteOp::Fallocate, ino);
}

fuse_lowlevel_ops getOperations() {
    fuse_lowlevel_ops ops = {};
    ops.init = init;
    ops.lookup = lookup;
    ops.forget = forget;
    ops.getattr = getattr;
    ops.readlink = readlink;
    ops.open = open;
    ops.read = read;
    ops.release = release;
    ops.readdir = readdir;
    ops.statfs = statfs;
    ops.access = access;
    ops.setattr = setattr;
    ops.mknod = mknod;
    ops.mkdir = mkdir;
    ops.unlink = unlink;
    ops.rmdir = rmdir;
    ops.symlink = symlink;
    ops.rename = rename;
    ops.link = link;
    ops.write = write;
    ops.create = create;
    ops.setxattr = setxattr;
    ops.removexattr = removexattr;
    ops.fallocate = fallocate;
    return ops;
}

}
