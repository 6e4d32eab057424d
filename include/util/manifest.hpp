#pragma once

#include "util/content_key.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ngdp {

// Where an entry sits inside a CDN archive blob, when it is not stored as a
// loose data object.
struct ArchiveSlice {
    EKey archive;
    std::uint64_t offset = 0;
    std::uint64_t size = 0;
};

struct ManifestEntry {
    EKey ekey;
    std::optional<CKey> ckey;
    std::vector<std::string> tags;
    std::uint64_t size = 0;
    std::string name;
    std::optional<ArchiveSlice> archive;

    // True iff every tag in `filter` is present.
    bool HasAllTags(const std::vector<std::string>& filter) const;
};

struct Manifest {
    std::string version;
    std::vector<ManifestEntry> entries;
};

// Entries selected by `filter` in manifest order, first occurrence of each
// EKey only. An empty filter selects everything.
std::vector<ManifestEntry> FilterByTags(const Manifest& manifest, const std::vector<std::string>& filter);

} // namespace ngdp
