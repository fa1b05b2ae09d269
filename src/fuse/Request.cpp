#include "fuse/Request.hpp"

namespace gm::fuse {

std::string_view to_string(const request::WriteOp op) noexcept {
    using request::WriteOp;
    switch (op) {
        case WriteOp::SetAttr:     return "setattr";
        case WriteOp::MkNod:       return "mknod";
        case WriteOp::MkDir:       return "mkdir";
        case WriteOp::Unlink:      return "unlink";
        case WriteOp::RmDir:       return "rmdir";
        case WriteOp::Symlink:     return "symlink";
        case WriteOp::Rename:      return "rename";
        case WriteOp::Link:        return "link";
        case WriteOp::Write:       return "write";
        case WriteOp::Create:      return "create";
        case WriteOp::SetXAttr:    return "setxattr";
        case WriteOp::RemoveXAttr: return "removexattr";
        case WriteOp::Fallocate:   return "fallocate";
    }
    return "unknown";
}

int errnoOf(const Reply& reply) noexcept {
    if (const auto* err = std::get_if<reply::Error>(&reply)) return err->errnum;
    return 0;
}

}
