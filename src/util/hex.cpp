#include "util/hex.hpp"

namespace ngdp {

namespace {

int Nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

bool HexDecodeInto(std::string_view hex, std::span<std::uint8_t> out) {
    if (hex.size() != out.size() * 2) return false;
    for (size_t i = 0; i < out.size(); ++i) {
        const int hi = Nibble(hex[i * 2]);
        const int lo = Nibble(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return true;
}

std::expected<std::vector<std::uint8_t>, std::string> HexDecode(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::unexpected("odd hex length: " + std::to_string(hex.size()));
    }
    std::vector<std::uint8_t> out(hex.size() / 2);
    if (!HexDecodeInto(hex, out)) {
        return std::unexpected("invalid hex string: " + std::string(hex));
    }
    return out;
}

} // namespace ngdp
