#include "git/Object.hpp"
#include "types/Error.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <fmt/core.h>
#include <unordered_set>

using namespace gm::types;

namespace gm::git {

namespace {

std::string_view asView(const std::span<const uint8_t> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

uint32_t parseOctalMode(const std::string_view s) {
    if (s.empty() || s.size() > 7) throw Error(ErrorKind::StoreCorruption, "tree parse: bad mode");

    uint32_t mode = 0;
    for (const char c : s) {
        if (c < '0' || c > '7') throw Error(ErrorKind::StoreCorruption, fmt::format("tree parse: bad mode '{}'", s));
        mode = (mode << 3) | static_cast<uint32_t>(c - '0');
    }
    return mode;
}

Oid requireOid(const std::string_view hex, const std::string_view what) {
    const auto id = parseOid(hex);
    if (!id) throw Error(ErrorKind::StoreCorruption, fmt::format("{}: malformed object id '{}'", what, hex));
    return *id;
}

// "Name <email> 1714412345 +0300" -> 1714412345
std::time_t signatureTime(const std::string_view sig) {
    const auto gt = sig.rfind('>');
    if (gt == std::string_view::npos) return 0;

    auto rest = sig.substr(gt + 1);
    while (!rest.empty() && rest.front() == ' ') rest.remove_prefix(1);

    long long t = 0;
    const auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), t);
    if (ec != std::errc()) return 0;
    return static_cast<std::time_t>(t);
}

}

std::string_view to_string(const ObjectKind kind) noexcept {
    switch (kind) {
        case ObjectKind::Commit: return "commit";
        case ObjectKind::Tree:   return "tree";
        case ObjectKind::Blob:   return "blob";
        case ObjectKind::Tag:    return "tag";
    }
    return "unknown";
}

std::optional<ObjectKind> kindFromString(const std::string_view s) noexcept {
    if (s == "commit") return ObjectKind::Commit;
    if (s == "tree") return ObjectKind::Tree;
    if (s == "blob") return ObjectKind::Blob;
    if (s == "tag") return ObjectKind::Tag;
    return std::nullopt;
}

std::vector<TreeEntry> parseTree(const std::span<const uint8_t> payload) {
    std::vector<TreeEntry> out;
    std::unordered_set<std::string_view> seen;

    auto p = payload.begin();
    const auto end = payload.end();

    while (p < end) {
        const auto space = std::find(p, end, static_cast<uint8_t>(' '));
        if (space == end) throw Error(ErrorKind::StoreCorruption, "tree parse: expected space");
        const uint32_t mode = parseOctalMode(asView({p, space}));

        p = space + 1;
        const auto nul = std::find(p, end, static_cast<uint8_t>('\0'));
        if (nul == end) throw Error(ErrorKind::StoreCorruption, "tree parse: expected NUL");

        std::string name(p, nul);
        if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos)
            throw Error(ErrorKind::StoreCorruption, fmt::format("tree parse: invalid entry name '{}'", name));

        p = nul + 1;
        if (static_cast<std::size_t>(end - p) < OID_RAW_LEN)
            throw Error(ErrorKind::StoreCorruption, "tree parse: truncated oid");

        TreeEntry e{};
        e.mode = mode;
        e.name = std::move(name);
        std::memcpy(e.id.data(), &*p, OID_RAW_LEN);
        p += OID_RAW_LEN;

        out.push_back(std::move(e));
    }

    // Views into `out` stay valid: the vector is no longer resized.
    for (const auto& e : out)
        if (!seen.insert(e.name).second)
            throw Error(ErrorKind::StoreCorruption, fmt::format("tree parse: duplicate entry '{}'", e.name));

    return out;
}

CommitInfo parseCommit(const std::span<const uint8_t> payload) {
    const auto view = asView(payload);
    CommitInfo info;
    bool haveTree = false;

    std::size_t pos = 0;
    while (pos < view.size()) {
        const auto eol = view.find('\n', pos);
        if (eol == std::string_view::npos) throw Error(ErrorKind::StoreCorruption, "commit parse: unterminated header");

        const auto line = view.substr(pos, eol - pos);
        pos = eol + 1;

        if (line.empty()) {
            info.message = std::string(view.substr(pos));
            break;
        }

        if (line.starts_with("tree ")) {
            info.tree = requireOid(line.substr(5), "commit tree");
            haveTree = true;
        } else if (line.starts_with("parent ")) {
            info.parents.push_back(requireOid(line.substr(7), "commit parent"));
        } else if (line.starts_with("author ")) {
            info.author = std::string(line.substr(7));
        } else if (line.starts_with("committer ")) {
            info.committer = std::string(line.substr(10));
            info.commitTime = signatureTime(line.substr(10));
        }
        // gpgsig, encoding, mergetag and continuation lines are not needed
    }

    if (!haveTree) throw Error(ErrorKind::StoreCorruption, "commit parse: missing tree header");
    return info;
}

TagInfo parseTag(const std::span<const uint8_t> payload) {
    const auto view = asView(payload);
    TagInfo info;
    bool haveObject = false, haveType = false;

    std::size_t pos = 0;
    while (pos < view.size()) {
        const auto eol = view.find('\n', pos);
        const auto line = view.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        if (line.empty()) break;
        pos = eol == std::string_view::npos ? view.size() : eol + 1;

        if (line.starts_with("object ")) {
            info.object = requireOid(line.substr(7), "tag object");
            haveObject = true;
        } else if (line.starts_with("type ")) {
            const auto kind = kindFromString(line.substr(5));
            if (!kind) throw Error(ErrorKind::StoreCorruption, fmt::format("tag parse: unknown type '{}'", line.substr(5)));
            info.targetKind = *kind;
            haveType = true;
        } else if (line.starts_with("tag ")) {
            info.name = std::string(line.substr(4));
        }
    }

    if (!haveObject || !haveType) throw Error(ErrorKind::StoreCorruption, "tag parse: missing object or type header");
    return info;
}

}
