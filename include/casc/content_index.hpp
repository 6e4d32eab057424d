#pragma once

#include "casc/index_shard.hpp"
#include "util/content_key.hpp"
#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ngdp::casc {

// EKey -> archive location, sharded into 16 buckets. Each bucket has its own
// reader/writer lock and is persisted as its own versioned .idx file.
class ContentIndex {
public:
    explicit ContentIndex(std::string dir);

    ContentIndex(const ContentIndex&) = delete;
    ContentIndex& operator=(const ContentIndex&) = delete;

    const std::string& Dir() const { return dir_; }

    std::optional<ArchiveLocation> Lookup(const EKey& ekey) const;

    // Ok if the key is new or already maps to `loc`; DuplicateKey otherwise.
    Result Insert(const EKey& ekey, const ArchiveLocation& loc);

    // Loads the highest version of every bucket found in Dir(). Buckets
    // without a shard stay empty.
    Result Load();
    Result LoadBucket(std::uint8_t bucket);

    // Writes version+1 of a bucket, then removes the older shard files.
    Result Persist();
    Result PersistBucket(std::uint8_t bucket);

    // Snapshot of one bucket, sorted by key.
    std::vector<IndexEntry> Entries(std::uint8_t bucket) const;

    // Removes entries matching `pred`; returns how many were removed. Used by
    // archive recovery; callers persist the bucket afterwards.
    std::size_t EraseIf(std::uint8_t bucket, const std::function<bool(const IndexEntry&)>& pred);

    std::size_t Size() const;
    std::uint32_t BucketVersion(std::uint8_t bucket) const;

private:
    struct Bucket {
        mutable std::shared_mutex mu;
        std::map<IndexKey, ArchiveLocation> entries;
        // Serializes persists and guards version.
        mutable std::mutex persist_mu;
        std::uint32_t version = 0;
    };

    Result LoadBucketLocked(std::uint8_t bucket, const std::vector<std::uint32_t>& versions);
    std::vector<std::uint32_t> ScanVersions(std::uint8_t bucket) const;

    std::string dir_;
    std::array<Bucket, kBucketCount> buckets_;
};

} // namespace ngdp::casc
