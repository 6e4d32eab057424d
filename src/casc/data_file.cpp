#include "casc/data_file.hpp"

#include "crypto/jenkins_hash.hpp"
#include "util/byte_order.hpp"

#include <algorithm>
#include <string>

namespace ngdp::casc {

namespace {

constexpr std::size_t kSizeOffset = 16;
constexpr std::size_t kChecksumAOffset = 22;
constexpr std::size_t kChecksumBOffset = 26;
constexpr std::uint32_t kChecksumASeed = 0x3D6BE971;

constexpr std::uint32_t kOffsetTable[16] = {
    0x049396b8, 0x72a82a9b, 0xee626cca, 0x9917754f, 0x15de40b1, 0xf5a8a9b6, 0x421eac7e, 0xa9d55c9a,
    0x317fd40c, 0x04faf80d, 0x3d6be971, 0x52933cfd, 0x27f64b7d, 0xc6f5c11b, 0xd5757e3a, 0x6c388745,
};

} // namespace

std::pair<std::uint32_t, std::uint32_t> EntryHeaderChecksums(std::span<const std::uint8_t> header,
                                                             std::uint32_t archive_id,
                                                             std::uint32_t offset) {
    // B covers bytes 0..25, which include A. Work on a copy with A in place
    // so building and verifying see the same bytes.
    std::uint8_t filled[kChecksumBOffset];
    std::copy_n(header.begin(), kChecksumBOffset, filled);
    const std::uint32_t a = HashLittle(std::span<const std::uint8_t>(filled, kChecksumAOffset), kChecksumASeed);
    WriteLe32(filled + kChecksumAOffset, a);

    // The low two bits of the archive id ride in the top of the offset.
    const std::uint32_t off = (offset & kMaxOffset) | ((archive_id & 3u) << 30);
    std::uint32_t enc = off + kEntryHeaderSize;
    enc = kOffsetTable[enc & 0x0f] ^ enc;
    std::uint8_t enc_bytes[4];
    WriteLe32(enc_bytes, enc);

    std::uint8_t hashed[4] = {0, 0, 0, 0};
    std::size_t i = 0;
    for (; i < kChecksumBOffset; ++i) {
        hashed[i & 3] ^= filled[i];
    }

    std::uint8_t b[4];
    for (std::size_t j = 0; j < 4; ++j, ++i) {
        b[j] = hashed[i & 3] ^ enc_bytes[i & 3];
    }
    return {a, ReadLe32(b)};
}

EntryHeader BuildEntryHeader(const EKey& ekey,
                             std::uint32_t total_size,
                             std::uint32_t archive_id,
                             std::uint32_t offset) {
    EntryHeader h{};
    std::reverse_copy(ekey.bytes().begin(), ekey.bytes().end(), h.begin());
    WriteLe32(h.data() + kSizeOffset, total_size);
    const auto [a, b] = EntryHeaderChecksums(h, archive_id, offset);
    WriteLe32(h.data() + kChecksumAOffset, a);
    WriteLe32(h.data() + kChecksumBOffset, b);
    return h;
}

Result VerifyEntryHeader(std::span<const std::uint8_t> header,
                         const EKey& ekey,
                         const ArchiveLocation& loc) {
    if (header.size() < kEntryHeaderSize) {
        return Result::Fail(ErrorCode::CorruptArchive, "truncated entry header for " + ekey.Hex());
    }

    EKey::Bytes stored{};
    std::reverse_copy(header.begin(), header.begin() + 16, stored.begin());
    if (EKey(stored) != ekey) {
        return Result::Fail(ErrorCode::CorruptArchive,
                            "entry at data." + std::to_string(loc.archive_id) + "+" +
                                std::to_string(loc.offset) + " holds " + EKey(stored).Hex() +
                                ", expected " + ekey.Hex());
    }

    const std::uint32_t size = ReadLe32(header.data() + kSizeOffset);
    if (size != loc.size) {
        return Result::Fail(ErrorCode::CorruptArchive,
                            "entry size " + std::to_string(size) + " disagrees with index size " +
                                std::to_string(loc.size) + " for " + ekey.Hex());
    }

    const auto [a, b] = EntryHeaderChecksums(header, loc.archive_id, loc.offset);
    if (a != ReadLe32(header.data() + kChecksumAOffset) ||
        b != ReadLe32(header.data() + kChecksumBOffset)) {
        return Result::Fail(ErrorCode::CorruptArchive, "entry header checksum mismatch for " + ekey.Hex());
    }
    return Result::Ok();
}

} // namespace ngdp::casc
