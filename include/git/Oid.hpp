#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gm::git {

constexpr std::size_t OID_RAW_LEN = 20;
constexpr std::size_t OID_HEX_LEN = 40;

// Raw 20-byte SHA-1 object id
using Oid = std::array<std::uint8_t, OID_RAW_LEN>;

struct OidHash {
    std::size_t operator()(const Oid& id) const noexcept;
};

[[nodiscard]] std::string toHex(const Oid& id);

// Accepts exactly 40 hex digits, either case.
[[nodiscard]] std::optional<Oid> parseOid(std::string_view hex);

}
