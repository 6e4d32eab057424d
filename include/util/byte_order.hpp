#pragma once

#include <cstdint>

// Fixed-width integer access into byte buffers. BLTE headers are big-endian,
// CASC index and data-file headers are little-endian with one 40-bit
// big-endian field.

namespace ngdp {

inline std::uint32_t ReadBe24(const std::uint8_t* p) {
    return (std::uint32_t(p[0]) << 16) | (std::uint32_t(p[1]) << 8) | std::uint32_t(p[2]);
}

inline std::uint32_t ReadBe32(const std::uint8_t* p) {
    return (std::uint32_t(p[0]) << 24) | (std::uint32_t(p[1]) << 16) |
           (std::uint32_t(p[2]) << 8) | std::uint32_t(p[3]);
}

inline std::uint64_t ReadBe40(const std::uint8_t* p) {
    return (std::uint64_t(p[0]) << 32) | std::uint64_t(ReadBe32(p + 1));
}

inline std::uint16_t ReadLe16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

inline std::uint32_t ReadLe32(const std::uint8_t* p) {
    return std::uint32_t(p[0]) | (std::uint32_t(p[1]) << 8) | (std::uint32_t(p[2]) << 16) |
           (std::uint32_t(p[3]) << 24);
}

inline std::uint64_t ReadLe64(const std::uint8_t* p) {
    return std::uint64_t(ReadLe32(p)) | (std::uint64_t(ReadLe32(p + 4)) << 32);
}

inline void WriteBe24(std::uint8_t* p, std::uint32_t v) {
    p[0] = static_cast<std::uint8_t>(v >> 16);
    p[1] = static_cast<std::uint8_t>(v >> 8);
    p[2] = static_cast<std::uint8_t>(v);
}

inline void WriteBe32(std::uint8_t* p, std::uint32_t v) {
    p[0] = static_cast<std::uint8_t>(v >> 24);
    p[1] = static_cast<std::uint8_t>(v >> 16);
    p[2] = static_cast<std::uint8_t>(v >> 8);
    p[3] = static_cast<std::uint8_t>(v);
}

inline void WriteBe40(std::uint8_t* p, std::uint64_t v) {
    p[0] = static_cast<std::uint8_t>(v >> 32);
    WriteBe32(p + 1, static_cast<std::uint32_t>(v));
}

inline void WriteLe16(std::uint8_t* p, std::uint16_t v) {
    p[0] = static_cast<std::uint8_t>(v);
    p[1] = static_cast<std::uint8_t>(v >> 8);
}

inline void WriteLe32(std::uint8_t* p, std::uint32_t v) {
    p[0] = static_cast<std::uint8_t>(v);
    p[1] = static_cast<std::uint8_t>(v >> 8);
    p[2] = static_cast<std::uint8_t>(v >> 16);
    p[3] = static_cast<std::uint8_t>(v >> 24);
}

inline void WriteLe64(std::uint8_t* p, std::uint64_t v) {
    WriteLe32(p, static_cast<std::uint32_t>(v));
    WriteLe32(p + 4, static_cast<std::uint32_t>(v >> 32));
}

} // namespace ngdp
