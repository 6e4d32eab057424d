#pragma once

#include "util/hex.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ngdp {

// 16-byte MD5 identifier. The tag keeps content keys and encoded keys from
// being mixed up at compile time.
template <typename Tag>
class Key16 {
public:
    static constexpr std::size_t kSize = 16;
    using Bytes = std::array<std::uint8_t, kSize>;

    Key16() = default;
    explicit Key16(const Bytes& bytes) : bytes_(bytes) {}

    static Key16 FromSpan(std::span<const std::uint8_t, kSize> in) {
        Key16 k;
        std::memcpy(k.bytes_.data(), in.data(), kSize);
        return k;
    }

    static std::optional<Key16> FromHex(std::string_view hex) {
        Key16 k;
        if (!HexDecodeInto(hex, k.bytes_)) return std::nullopt;
        return k;
    }

    const Bytes& bytes() const { return bytes_; }
    std::span<const std::uint8_t> span() const { return bytes_; }
    std::string Hex() const { return HexEncode(bytes_); }

    bool operator==(const Key16&) const = default;
    auto operator<=>(const Key16&) const = default;

private:
    Bytes bytes_{};
};

struct CKeyTag {};
struct EKeyTag {};

using CKey = Key16<CKeyTag>;
using EKey = Key16<EKeyTag>;

struct KeyHash {
    template <typename Tag>
    std::size_t operator()(const Key16<Tag>& k) const {
        std::uint64_t v = 0;
        std::memcpy(&v, k.bytes().data(), sizeof(v));
        return static_cast<std::size_t>(v);
    }
};

} // namespace ngdp
