#pragma once

#include "git/Oid.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gm::git {

enum class ObjectKind { Commit, Tree, Blob, Tag };

// Tree entry modes, octal as stored by git
constexpr uint32_t MODE_TREE       = 0040000;
constexpr uint32_t MODE_FILE       = 0100644;
constexpr uint32_t MODE_EXECUTABLE = 0100755;
constexpr uint32_t MODE_SYMLINK    = 0120000;
constexpr uint32_t MODE_GITLINK    = 0160000;

struct Object {
    ObjectKind kind{ObjectKind::Blob};
    std::vector<uint8_t> payload{};
};

struct ObjectInfo {
    ObjectKind kind{ObjectKind::Blob};
    uint64_t size{0};
};

struct TreeEntry {
    uint32_t mode{};
    std::string name{};
    Oid id{};
};

struct CommitInfo {
    Oid tree{};
    std::vector<Oid> parents{};
    std::string author{}, committer{}, message{};
    std::time_t commitTime{0};
};

struct TagInfo {
    Oid object{};
    ObjectKind targetKind{ObjectKind::Commit};
    std::string name{};
};

[[nodiscard]] std::string_view to_string(ObjectKind kind) noexcept;
[[nodiscard]] std::optional<ObjectKind> kindFromString(std::string_view s) noexcept;

// Tree payloads are validated: entry names must be non-empty, unique, free
// of '/' and NUL, and never "." or "..".
std::vector<TreeEntry> parseTree(std::span<const uint8_t> payload);

CommitInfo parseCommit(std::span<const uint8_t> payload);

TagInfo parseTag(std::span<const uint8_t> payload);

}
