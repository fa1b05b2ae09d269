#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace gm::types {

enum class ErrorKind {
    NotFound,
    NotADirectory,
    NotAFile,
    NotACommit,
    PermissionDenied,
    InvalidArgument,
    StoreCorruption,
    Stale,
    BadHandle,
    NotMounted,
    MountFailure
};

// Every failure inside gitmount is reported through this one exception type.
// The kind decides the errno handed back to the kernel.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] int errnum() const noexcept;

private:
    ErrorKind kind_;
};

[[nodiscard]] int toErrno(ErrorKind kind) noexcept;
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

}
