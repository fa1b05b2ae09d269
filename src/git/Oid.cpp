#include "git/Oid.hpp"

#include <cstring>

namespace gm::git {

std::size_t OidHash::operator()(const Oid& id) const noexcept {
    // SHA-1 output is already uniformly distributed
    std::size_t h;
    std::memcpy(&h, id.data(), sizeof(h));
    return h;
}

std::string toHex(const Oid& id) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string s(OID_HEX_LEN, '0');
    for (std::size_t i = 0; i < OID_RAW_LEN; ++i) {
        s[2 * i] = kHex[(id[i] >> 4) & 0xF];
        s[2 * i + 1] = kHex[id[i] & 0xF];
    }
    return s;
}

std::optional<Oid> parseOid(const std::string_view hex) {
    if (hex.size() != OID_HEX_LEN) return std::nullopt;

    auto nibble = [](const char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    };

    Oid out{};
    for (std::size_t i = 0; i < OID_RAW_LEN; ++i) {
        const int hi = nibble(hex[2 * i]);
        const int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

}
