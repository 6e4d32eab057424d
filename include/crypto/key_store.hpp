#pragma once

#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ngdp {

using EncryptionKey = std::array<std::uint8_t, 16>;

// Decryption key lookup by 64-bit key name. BLTE stores the name as 8 bytes
// which are read as a little-endian integer.
class IKeyStore {
public:
    virtual ~IKeyStore() = default;
    virtual std::optional<EncryptionKey> Lookup(std::uint64_t key_id) const = 0;
};

class MemoryKeyStore final : public IKeyStore {
public:
    MemoryKeyStore() = default;

    std::optional<EncryptionKey> Lookup(std::uint64_t key_id) const override;

    void Add(std::uint64_t key_id, const EncryptionKey& key);
    std::size_t Size() const;

    // Text format, one key per line: "<16 hex key name> <32 hex key>".
    // Blank lines and lines starting with '#' are skipped; anything after the
    // key is ignored.
    Result LoadFromFile(const std::string& path);
    Result LoadFromString(std::string_view text);

private:
    mutable std::shared_mutex mu_;
    std::unordered_map<std::uint64_t, EncryptionKey> keys_;
};

// Key store that knows no keys.
class EmptyKeyStore final : public IKeyStore {
public:
    std::optional<EncryptionKey> Lookup(std::uint64_t) const override { return std::nullopt; }
};

} // namespace ngdp
