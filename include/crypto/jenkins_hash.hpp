#pragma once

#include <cstdint>
#include <span>
#include <utility>

namespace ngdp {

// Bob Jenkins' lookup3 hashlittle2. Returns {pc, pb}; pc is the better mixed
// value and equals hashlittle(data, pc) when pb is 0.
std::pair<std::uint32_t, std::uint32_t> HashLittle2(std::span<const std::uint8_t> data,
                                                    std::uint32_t pc,
                                                    std::uint32_t pb);

std::uint32_t HashLittle(std::span<const std::uint8_t> data, std::uint32_t initval);

} // namespace ngdp
