#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace ngdp {

// Salsa20/20 with a 128-bit key ("expand 16-byte k"), as used by BLTE 'E'
// chunks. Encryption and decryption are the same operation.
class Salsa20 {
public:
    using Key = std::array<std::uint8_t, 16>;
    using Nonce = std::array<std::uint8_t, 8>;

    Salsa20(const Key& key, const Nonce& nonce);

    // XORs the keystream into `data`. Successive calls continue the stream.
    void Apply(std::span<std::uint8_t> data);

private:
    void NextBlock();

    std::array<std::uint32_t, 16> state_{};
    std::array<std::uint8_t, 64> block_{};
    std::size_t block_pos_ = 64;
};

} // namespace ngdp
