#include "crypto/jenkins_hash.hpp"

namespace ngdp {

namespace {

inline std::uint32_t Rot(std::uint32_t x, int k) {
    return (x << k) | (x >> (32 - k));
}

inline void Mix(std::uint32_t& a, std::uint32_t& b, std::uint32_t& c) {
    a -= c; a ^= Rot(c, 4);  c += b;
    b -= a; b ^= Rot(a, 6);  a += c;
    c -= b; c ^= Rot(b, 8);  b += a;
    a -= c; a ^= Rot(c, 16); c += b;
    b -= a; b ^= Rot(a, 19); a += c;
    c -= b; c ^= Rot(b, 4);  b += a;
}

inline void Final(std::uint32_t& a, std::uint32_t& b, std::uint32_t& c) {
    c ^= b; c -= Rot(b, 14);
    a ^= c; a -= Rot(c, 11);
    b ^= a; b -= Rot(a, 25);
    c ^= b; c -= Rot(b, 16);
    a ^= c; a -= Rot(c, 4);
    b ^= a; b -= Rot(a, 14);
    c ^= b; c -= Rot(b, 24);
}

inline std::uint32_t Word(const std::uint8_t* k, size_t n) {
    // Little-endian load of up to 4 bytes.
    std::uint32_t v = 0;
    for (size_t i = 0; i < n; ++i) {
        v |= std::uint32_t(k[i]) << (8 * i);
    }
    return v;
}

} // namespace

std::pair<std::uint32_t, std::uint32_t> HashLittle2(std::span<const std::uint8_t> data,
                                                    std::uint32_t pc,
                                                    std::uint32_t pb) {
    std::uint32_t a = 0xdeadbeef + static_cast<std::uint32_t>(data.size()) + pc;
    std::uint32_t b = a;
    std::uint32_t c = a + pb;

    const std::uint8_t* k = data.data();
    size_t length = data.size();

    while (length > 12) {
        a += Word(k, 4);
        b += Word(k + 4, 4);
        c += Word(k + 8, 4);
        Mix(a, b, c);
        length -= 12;
        k += 12;
    }

    if (length == 0) {
        return {c, b};
    }

    // Tail: 1..12 bytes, zero-padded.
    a += Word(k, length < 4 ? length : 4);
    if (length > 4) b += Word(k + 4, length < 8 ? length - 4 : 4);
    if (length > 8) c += Word(k + 8, length - 8);
    Final(a, b, c);

    return {c, b};
}

std::uint32_t HashLittle(std::span<const std::uint8_t> data, std::uint32_t initval) {
    return HashLittle2(data, initval, 0).first;
}

} // namespace ngdp
