#include "types/Error.hpp"

#include <cerrno>

namespace gm::types {

Error::Error(const ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

int Error::errnum() const noexcept { return toErrno(kind_); }

int toErrno(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound:         return ENOENT;
        case ErrorKind::NotADirectory:    return ENOTDIR;
        case ErrorKind::NotAFile:         return EINVAL;
        case ErrorKind::NotACommit:       return EINVAL;
        case ErrorKind::PermissionDenied: return EACCES;
        case ErrorKind::InvalidArgument:  return EINVAL;
        case ErrorKind::StoreCorruption:  return EIO;
        case ErrorKind::Stale:            return ESTALE;
        case ErrorKind::BadHandle:        return EBADF;
        case ErrorKind::NotMounted:       return ENOTCONN;
        case ErrorKind::MountFailure:     return EIO;
    }
    return EIO;
}

std::string_view to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound:         return "NotFound";
        case ErrorKind::NotADirectory:    return "NotADirectory";
        case ErrorKind::NotAFile:         return "NotAFile";
        case ErrorKind::NotACommit:       return "NotACommit";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::InvalidArgument:  return "InvalidArgument";
        case ErrorKind::StoreCorruption:  return "StoreCorruption";
        case ErrorKind::Stale:            return "Stale";
        case ErrorKind::BadHandle:        return "BadHandle";
        case ErrorKind::NotMounted:       return "NotMounted";
        case ErrorKind::MountFailure:     return "MountFailure";
    }
    return "Unknown";
}

}
