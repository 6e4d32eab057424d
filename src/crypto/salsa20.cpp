#include "crypto/salsa20.hpp"

#include "util/byte_order.hpp"

namespace ngdp {

namespace {

constexpr char kSigma16[] = "expand 16-byte k";

inline std::uint32_t Rol32(std::uint32_t v, int n) {
    return (v << n) | (v >> (32 - n));
}

inline void QuarterRound(std::uint32_t& a, std::uint32_t& b, std::uint32_t& c, std::uint32_t& d) {
    b ^= Rol32(a + d, 7);
    c ^= Rol32(b + a, 9);
    d ^= Rol32(c + b, 13);
    a ^= Rol32(d + c, 18);
}

} // namespace

Salsa20::Salsa20(const Key& key, const Nonce& nonce) {
    const auto* sigma = reinterpret_cast<const std::uint8_t*>(kSigma16);

    state_[0] = ReadLe32(sigma + 0);
    state_[1] = ReadLe32(key.data() + 0);
    state_[2] = ReadLe32(key.data() + 4);
    state_[3] = ReadLe32(key.data() + 8);
    state_[4] = ReadLe32(key.data() + 12);
    state_[5] = ReadLe32(sigma + 4);
    state_[6] = ReadLe32(nonce.data() + 0);
    state_[7] = ReadLe32(nonce.data() + 4);
    state_[8] = 0;
    state_[9] = 0;
    state_[10] = ReadLe32(sigma + 8);
    // 128-bit keys repeat the key in the second half.
    state_[11] = state_[1];
    state_[12] = state_[2];
    state_[13] = state_[3];
    state_[14] = state_[4];
    state_[15] = ReadLe32(sigma + 12);
}

void Salsa20::NextBlock() {
    std::array<std::uint32_t, 16> x = state_;

    for (int i = 0; i < 20; i += 2) {
        // column round
        QuarterRound(x[0], x[4], x[8], x[12]);
        QuarterRound(x[5], x[9], x[13], x[1]);
        QuarterRound(x[10], x[14], x[2], x[6]);
        QuarterRound(x[15], x[3], x[7], x[11]);
        // row round
        QuarterRound(x[0], x[1], x[2], x[3]);
        QuarterRound(x[5], x[6], x[7], x[4]);
        QuarterRound(x[10], x[11], x[8], x[9]);
        QuarterRound(x[15], x[12], x[13], x[14]);
    }

    for (int i = 0; i < 16; ++i) {
        WriteLe32(block_.data() + i * 4, x[i] + state_[i]);
    }

    if (++state_[8] == 0) {
        ++state_[9];
    }
    block_pos_ = 0;
}

void Salsa20::Apply(std::span<std::uint8_t> data) {
    for (auto& b : data) {
        if (block_pos_ == block_.size()) {
            NextBlock();
        }
        b ^= block_[block_pos_++];
    }
}

} // namespace ngdp
