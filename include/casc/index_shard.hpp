#pragma once

#include "util/content_key.hpp"
#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace ngdp::casc {

inline constexpr std::size_t kBucketCount = 16;
inline constexpr std::size_t kIndexKeySize = 9;
inline constexpr std::size_t kShardHeaderSize = 40;
inline constexpr std::size_t kShardEntrySize = 18;
inline constexpr std::uint16_t kShardVersion = 7;
inline constexpr unsigned kOffsetBits = 30;
inline constexpr std::uint32_t kMaxOffset = (1u << kOffsetBits) - 1;
inline constexpr std::uint32_t kMaxArchiveId = 0x3ff;
inline constexpr std::uint64_t kMaxArchiveTotalSize = 0x4000000000ull;
// Size of the per-entry header in data.NNN files; entry sizes include it.
inline constexpr std::uint32_t kEntryHeaderSize = 30;

// Index entries key on the first 9 bytes of the EKey.
using IndexKey = std::array<std::uint8_t, kIndexKeySize>;

struct ArchiveLocation {
    std::uint32_t archive_id = 0;
    std::uint32_t offset = 0;
    // Entry size including the 30-byte data header.
    std::uint32_t size = 0;

    bool operator==(const ArchiveLocation&) const = default;
};

struct IndexEntry {
    IndexKey key{};
    ArchiveLocation location;
};

IndexKey ToIndexKey(const EKey& ekey);

// XOR of the nine key bytes folded to a nibble.
std::uint8_t BucketOf(const IndexKey& key);
inline std::uint8_t BucketOf(const EKey& ekey) { return BucketOf(ToIndexKey(ekey)); }

// Serializes one bucket. `entries` must be sorted by key.
std::vector<std::uint8_t> SerializeShard(std::uint8_t bucket, std::span<const IndexEntry> entries);

// Parses and validates a shard file. Failures are IndexCorrupt. Zero padding
// after the entry block is accepted.
Result ParseShard(std::span<const std::uint8_t> data,
                  std::uint8_t bucket,
                  std::vector<IndexEntry>& out);

} // namespace ngdp::casc
