#pragma once

#include "io/io.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace ngdp {

using Md5Digest = std::array<std::uint8_t, 16>;

Md5Digest Md5(std::span<const std::uint8_t> data);
std::string Md5Hex(std::span<const std::uint8_t> data);

class Md5Hasher {
public:
    Md5Hasher();
    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher& operator=(const Md5Hasher&) = delete;
    Md5Hasher(Md5Hasher&&) noexcept;
    Md5Hasher& operator=(Md5Hasher&&) noexcept;
    ~Md5Hasher();

    void Update(std::span<const std::uint8_t> data);
    // False if the digest context failed at any point.
    bool Final(Md5Digest& out);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ngdp
