#pragma once

#include "crypto/md5.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace ngdp::blte {

inline constexpr std::uint8_t kMagic[4] = {'B', 'L', 'T', 'E'};
inline constexpr std::size_t kPrefixSize = 8;       // magic + header size
inline constexpr std::size_t kTableHeaderSize = 12; // prefix + flags + u24 count
inline constexpr std::size_t kChunkInfoSize = 24;
inline constexpr std::uint8_t kTableFlags = 0x0F;
inline constexpr std::uint32_t kMaxChunkCount = 0xFFFFFF;

// Encrypted chunk header: name length, 8-byte key name, IV length, IV, cipher.
inline constexpr std::uint8_t kCipherSalsa20 = 'S';

enum class ModeTag : std::uint8_t {
    Raw = 'N',
    Zlib = 'Z',
    Encrypted = 'E',
    Recursive = 'F',
};

struct ChunkInfo {
    std::uint32_t compressed_size = 0;
    std::uint32_t decompressed_size = 0;
    Md5Digest checksum{};
};

struct Header {
    // 0 means no chunk table: the rest of the container is one chunk.
    std::uint32_t header_size = 0;
    std::vector<ChunkInfo> chunks;

    bool HasTable() const { return header_size != 0; }
    std::size_t DataOffset() const { return HasTable() ? header_size : kPrefixSize; }
};

struct ChunkMode;
struct EncodingSpec;

struct RawMode {};

struct ZlibMode {
    int level = 9;
    // 9..15, or 0 to pick per chunk from the input length (MPQ table).
    int window_bits = 15;
};

struct EncryptedMode {
    std::array<std::uint8_t, 8> key_name{};
    std::array<std::uint8_t, 4> iv{};
    std::shared_ptr<const ChunkMode> inner;
};

struct RecursiveMode {
    std::shared_ptr<const EncodingSpec> nested;
};

struct ChunkMode {
    std::variant<RawMode, ZlibMode, EncryptedMode, RecursiveMode> value;

    static ChunkMode Raw() { return {RawMode{}}; }
    static ChunkMode Zlib(int level = 9, int window_bits = 15) {
        return {ZlibMode{level, window_bits}};
    }
    static ChunkMode Encrypted(const std::array<std::uint8_t, 8>& key_name,
                               const std::array<std::uint8_t, 4>& iv,
                               ChunkMode inner) {
        return {EncryptedMode{key_name, iv, std::make_shared<const ChunkMode>(std::move(inner))}};
    }
    static ChunkMode Recursive(EncodingSpec nested);
};

// One run of chunks inside a chunked container.
struct BlockSpec {
    // Chunk size in bytes; 0 together with an empty count takes the whole
    // remaining input as a single chunk.
    std::uint64_t size = 0;
    // Number of chunks; empty repeats until the input is exhausted.
    std::optional<std::uint64_t> count;
    ChunkMode mode;
};

struct EncodingSpec {
    // Without blocks the container has no chunk table.
    std::vector<BlockSpec> blocks;
    ChunkMode mode;

    bool Chunked() const { return !blocks.empty(); }

    static EncodingSpec Single(ChunkMode m) { return {{}, std::move(m)}; }
    static EncodingSpec FixedChunks(std::uint64_t chunk_size, ChunkMode m) {
        EncodingSpec s;
        s.blocks.push_back(BlockSpec{chunk_size, std::nullopt, m});
        s.mode = std::move(m);
        return s;
    }
};

inline ChunkMode ChunkMode::Recursive(EncodingSpec nested) {
    return {RecursiveMode{std::make_shared<const EncodingSpec>(std::move(nested))}};
}

std::uint64_t KeyId(const std::array<std::uint8_t, 8>& key_name);

} // namespace ngdp::blte
