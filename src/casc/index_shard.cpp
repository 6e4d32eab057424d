#include "casc/index_shard.hpp"

#include "crypto/jenkins_hash.hpp"
#include "util/byte_order.hpp"

#include <cstdio>
#include <cstring>
#include <string>
#include <tuple>

namespace ngdp::casc {

namespace {

constexpr std::uint32_t kHeaderHashSize = 16;
constexpr std::size_t kHeaderHashOffset = 8;

Result Corrupt(std::uint8_t bucket, const std::string& what) {
    char name[8];
    std::snprintf(name, sizeof(name), "%02x", bucket);
    return Result::Fail(ErrorCode::IndexCorrupt, std::string("index shard ") + name + ": " + what);
}

std::uint32_t EntriesHash(std::span<const std::uint8_t> entries) {
    std::uint32_t pc = 0;
    std::uint32_t pb = 0;
    for (std::size_t off = 0; off + kShardEntrySize <= entries.size(); off += kShardEntrySize) {
        std::tie(pc, pb) = HashLittle2(entries.subspan(off, kShardEntrySize), pc, pb);
    }
    return pc;
}

} // namespace

IndexKey ToIndexKey(const EKey& ekey) {
    IndexKey k{};
    std::memcpy(k.data(), ekey.bytes().data(), k.size());
    return k;
}

std::uint8_t BucketOf(const IndexKey& key) {
    std::uint8_t x = 0;
    for (auto b : key) x ^= b;
    return static_cast<std::uint8_t>((x & 0x0f) ^ (x >> 4));
}

std::vector<std::uint8_t> SerializeShard(std::uint8_t bucket, std::span<const IndexEntry> entries) {
    std::vector<std::uint8_t> out(kShardHeaderSize + entries.size() * kShardEntrySize, 0);
    std::uint8_t* h = out.data();

    WriteLe32(h, kHeaderHashSize);
    WriteLe16(h + 8, kShardVersion);
    h[10] = bucket;
    h[11] = 0;
    h[12] = 4;  // size bytes
    h[13] = 5;  // offset bytes
    h[14] = static_cast<std::uint8_t>(kIndexKeySize);
    h[15] = static_cast<std::uint8_t>(kOffsetBits);
    WriteLe64(h + 16, kMaxArchiveTotalSize);
    WriteLe32(h + 32, static_cast<std::uint32_t>(entries.size() * kShardEntrySize));

    std::uint8_t* p = out.data() + kShardHeaderSize;
    for (const auto& e : entries) {
        std::memcpy(p, e.key.data(), kIndexKeySize);
        const std::uint64_t packed =
            (std::uint64_t{e.location.archive_id} << kOffsetBits) | (e.location.offset & kMaxOffset);
        WriteBe40(p + 9, packed);
        WriteLe32(p + 14, e.location.size);
        p += kShardEntrySize;
    }

    const auto header_hash =
        HashLittle2(std::span<const std::uint8_t>(out).subspan(kHeaderHashOffset, kHeaderHashSize), 0, 0);
    WriteLe32(h + 4, header_hash.first);
    WriteLe32(h + 36, EntriesHash(std::span<const std::uint8_t>(out).subspan(kShardHeaderSize)));
    return out;
}

Result ParseShard(std::span<const std::uint8_t> data,
                  std::uint8_t bucket,
                  std::vector<IndexEntry>& out) {
    out.clear();
    if (data.size() < kShardHeaderSize) return Corrupt(bucket, "truncated header");

    const std::uint8_t* h = data.data();
    if (ReadLe32(h) != kHeaderHashSize) return Corrupt(bucket, "unexpected header hash size");
    const auto header_hash = HashLittle2(data.subspan(kHeaderHashOffset, kHeaderHashSize), 0, 0);
    if (header_hash.first != ReadLe32(h + 4)) return Corrupt(bucket, "header hash mismatch");

    if (ReadLe16(h + 8) != kShardVersion) return Corrupt(bucket, "unsupported version");
    if (h[10] != bucket) {
        return Corrupt(bucket, "file belongs to bucket " + std::to_string(h[10]));
    }
    if (h[12] != 4 || h[13] != 5 || h[14] != kIndexKeySize || h[15] != kOffsetBits) {
        return Corrupt(bucket, "unsupported entry layout");
    }

    const std::uint32_t entries_size = ReadLe32(h + 32);
    if (entries_size % kShardEntrySize != 0) return Corrupt(bucket, "entry block not a multiple of 18");
    if (data.size() - kShardHeaderSize < entries_size) return Corrupt(bucket, "truncated entries");

    const auto entries = data.subspan(kShardHeaderSize, entries_size);
    if (EntriesHash(entries) != ReadLe32(h + 36)) return Corrupt(bucket, "entries hash mismatch");

    out.reserve(entries_size / kShardEntrySize);
    for (std::size_t off = 0; off < entries.size(); off += kShardEntrySize) {
        const std::uint8_t* p = entries.data() + off;
        IndexEntry e;
        std::memcpy(e.key.data(), p, kIndexKeySize);
        const std::uint64_t packed = ReadBe40(p + 9);
        e.location.archive_id = static_cast<std::uint32_t>((packed >> kOffsetBits) & kMaxArchiveId);
        e.location.offset = static_cast<std::uint32_t>(packed & kMaxOffset);
        e.location.size = ReadLe32(p + 14);
        out.push_back(e);
    }
    return Result::Ok();
}

} // namespace ngdp::casc
