#pragma once

#include "fs/BlobReader.hpp"
#include "fs/cache/InodeRegistry.hpp"
#include "types/Error.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <variant>
#include <vector>

namespace gm::fuse {

using fs::cache::Inode;

namespace request {

struct Lookup { Inode parent; std::string name; };
struct GetAttr { Inode ino; };
struct ReadDir { Inode ino; };
struct Open { Inode ino; int flags; };
struct Read { Inode ino; uint64_t fh; int64_t offset; int64_t length; };
struct ReadLink { Inode ino; };
struct Release { Inode ino; uint64_t fh; };
struct Access { Inode ino; int mask; };
struct Forget { Inode ino; uint64_t nlookup; };
struct StatFs { Inode ino; };

enum class WriteOp {
    SetAttr, MkNod, MkDir, Unlink, RmDir, Symlink, Rename, Link,
    Write, Create, SetXAttr, RemoveXAttr, Fallocate
};

// Any operation that would change the tree
struct Modify { WriteOp op; Inode ino; std::string name; };

}

using Request = std::variant<
    request::Lookup, request::GetAttr, request::ReadDir, request::Open, request::Read,
    request::ReadLink, request::Release, request::Access, request::Forget, request::StatFs,
    request::Modify>;

namespace reply {

struct Empty {};

struct Entry {
    Inode ino;
    struct stat attr;
    double attrTimeout;
    double entryTimeout;
};

struct Attr {
    struct stat attr;
    double timeout;
};

struct DirEntry {
    std::string name;
    Inode ino;
    mode_t type; // S_IF* bits only
};

struct Directory { std::vector<DirEntry> entries; };

struct Open { uint64_t fh; };

// `bytes` points into `owner`, which keeps the buffer alive after the handle closes
struct Data {
    std::shared_ptr<const fs::BlobBuffer> owner;
    std::span<const uint8_t> bytes;
};

struct Link { std::string target; };

struct StatFs { struct statvfs st; };

struct Error {
    types::ErrorKind kind;
    int errnum;
    std::string message;
};

}

using Reply = std::variant<
    reply::Empty, reply::Entry, reply::Attr, reply::Directory, reply::Open,
    reply::Data, reply::Link, reply::StatFs, reply::Error>;

std::string_view to_string(request::WriteOp op) noexcept;

// errno carried by an error reply, 0 for any other reply
int errnoOf(const Reply& reply) noexcept;

}
