#include "fs/model/Node.hpp"
#include "types/Error.hpp"

#include <fmt/core.h>
#include <sys/stat.h>

using namespace gm::types;

namespace gm::fs::model {

NodeKind kindFromMode(const uint32_t mode) {
    switch (mode & S_IFMT) {
        case S_IFREG: return NodeKind::File;
        case S_IFDIR: return NodeKind::Directory;
        case S_IFLNK: return NodeKind::Symlink;
        default: break;
    }

    if (mode == git::MODE_GITLINK) return NodeKind::Submodule;
    throw Error(ErrorKind::StoreCorruption, fmt::format("unknown tree entry mode {:o}", mode));
}

std::string joinPath(const std::string& parent, const std::string& name) {
    if (parent.empty() || parent == "/") return "/" + name;
    return parent + "/" + name;
}

std::string to_string(const NodeKind kind) {
    switch (kind) {
        case NodeKind::File:      return "file";
        case NodeKind::Directory: return "directory";
        case NodeKind::Symlink:   return "symlink";
        case NodeKind::Submodule: return "submodule";
    }
    return "unknown";
}

}
