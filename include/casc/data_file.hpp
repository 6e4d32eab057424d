#pragma once

#include "casc/index_shard.hpp"
#include "util/content_key.hpp"
#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <utility>

namespace ngdp::casc {

// Largest data.NNN file the store writes before rolling to the next one.
inline constexpr std::uint64_t kDefaultMaxDataFileSize = 0x3FFFFFFF;

using EntryHeader = std::array<std::uint8_t, kEntryHeaderSize>;

// Entry header layout (little-endian): EKey with bytes reversed, total entry
// size, two zero bytes, checksum A over bytes 0..21, checksum B which mixes
// the header with the entry's archive id and offset.
EntryHeader BuildEntryHeader(const EKey& ekey,
                             std::uint32_t total_size,
                             std::uint32_t archive_id,
                             std::uint32_t offset);

// Returns {A, B} for `header`. Bytes 22.. are ignored; B is taken over the
// header with the computed A in place.
std::pair<std::uint32_t, std::uint32_t> EntryHeaderChecksums(std::span<const std::uint8_t> header,
                                                             std::uint32_t archive_id,
                                                             std::uint32_t offset);

// CorruptArchive if the header does not describe `ekey` stored at `loc`.
Result VerifyEntryHeader(std::span<const std::uint8_t> header,
                         const EKey& ekey,
                         const ArchiveLocation& loc);

} // namespace ngdp::casc
