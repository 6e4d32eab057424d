#include "util/manifest.hpp"

#include <algorithm>
#include <unordered_set>

namespace ngdp {

bool ManifestEntry::HasAllTags(const std::vector<std::string>& filter) const {
    return std::all_of(filter.begin(), filter.end(), [this](const std::string& t) {
        return std::find(tags.begin(), tags.end(), t) != tags.end();
    });
}

std::vector<ManifestEntry> FilterByTags(const Manifest& manifest, const std::vector<std::string>& filter) {
    std::vector<ManifestEntry> out;
    std::unordered_set<EKey, KeyHash> seen;
    for (const auto& e : manifest.entries) {
        if (!e.HasAllTags(filter))
            continue;
        if (!seen.insert(e.ekey).second)
            continue;
        out.push_back(e);
    }
    return out;
}

} // namespace ngdp
