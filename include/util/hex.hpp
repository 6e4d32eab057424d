#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ngdp {

// Lowercase hex, two characters per byte.
std::string HexEncode(std::span<const std::uint8_t> bytes);

// Decodes exactly out.size() bytes; upper and lower case accepted.
bool HexDecodeInto(std::string_view hex, std::span<std::uint8_t> out);

std::expected<std::vector<std::uint8_t>, std::string> HexDecode(std::string_view hex);

} // namespace ngdp
