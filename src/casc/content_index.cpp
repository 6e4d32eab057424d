#include "casc/content_index.hpp"

#include "io/atomic_file.hpp"
#include "io/file_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace ngdp::casc {

namespace {

Result BadBucket(std::uint8_t bucket) {
    return Result::Fail(ErrorCode::InvalidArgument, "bucket out of range: " + std::to_string(bucket));
}

} // namespace

ContentIndex::ContentIndex(std::string dir) : dir_(std::move(dir)) {}

std::optional<ArchiveLocation> ContentIndex::Lookup(const EKey& ekey) const {
    const IndexKey key = ToIndexKey(ekey);
    const Bucket& b = buckets_[BucketOf(key)];
    std::shared_lock lock(b.mu);
    auto it = b.entries.find(key);
    if (it == b.entries.end()) return std::nullopt;
    return it->second;
}

Result ContentIndex::Insert(const EKey& ekey, const ArchiveLocation& loc) {
    if (loc.archive_id > kMaxArchiveId || loc.offset > kMaxOffset) {
        return Result::Fail(ErrorCode::InvalidArgument, "location out of range for " + ekey.Hex());
    }
    const IndexKey key = ToIndexKey(ekey);
    Bucket& b = buckets_[BucketOf(key)];
    std::unique_lock lock(b.mu);
    auto [it, inserted] = b.entries.emplace(key, loc);
    if (!inserted && !(it->second == loc)) {
        return Result::Fail(ErrorCode::DuplicateKey,
                            "key " + ekey.Hex() + " already indexed at data." +
                                std::to_string(it->second.archive_id) + "+" +
                                std::to_string(it->second.offset));
    }
    return Result::Ok();
}

std::vector<std::uint32_t> ContentIndex::ScanVersions(std::uint8_t bucket) const {
    std::vector<std::uint32_t> versions;
    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        auto name = ParseIndexShardName(it->path().filename().string());
        if (name && name->bucket == bucket) versions.push_back(name->version);
    }
    std::sort(versions.begin(), versions.end());
    return versions;
}

Result ContentIndex::LoadBucketLocked(std::uint8_t bucket, const std::vector<std::uint32_t>& versions) {
    Bucket& b = buckets_[bucket];
    if (versions.empty()) {
        std::unique_lock lock(b.mu);
        b.entries.clear();
        b.version = 0;
        return Result::Ok();
    }

    const std::uint32_t version = versions.back();
    const std::string path = JoinPath(dir_, IndexShardName(bucket, version));
    std::vector<std::uint8_t> data;
    auto r = ReadFileToVector(path, data);
    if (!r.ok) return r;

    std::vector<IndexEntry> entries;
    r = ParseShard(data, bucket, entries);
    if (!r.ok) {
        r.msg += " (" + path + ")";
        return r;
    }

    std::unique_lock lock(b.mu);
    b.entries.clear();
    for (const auto& e : entries) {
        if (!b.entries.emplace(e.key, e.location).second) {
            LogWarn("Duplicate entry in %s, keeping the first", path.c_str());
        }
    }
    b.version = version;
    LogDebug("Loaded %zu entries from %s", b.entries.size(), path.c_str());
    return Result::Ok();
}

Result ContentIndex::LoadBucket(std::uint8_t bucket) {
    if (bucket >= kBucketCount) return BadBucket(bucket);
    std::lock_guard persist(buckets_[bucket].persist_mu);
    return LoadBucketLocked(bucket, ScanVersions(bucket));
}

Result ContentIndex::Load() {
    for (std::uint8_t i = 0; i < kBucketCount; ++i) {
        auto r = LoadBucket(i);
        if (!r.ok) return r;
    }
    return Result::Ok();
}

Result ContentIndex::PersistBucket(std::uint8_t bucket) {
    if (bucket >= kBucketCount) return BadBucket(bucket);
    Bucket& b = buckets_[bucket];
    std::lock_guard persist(b.persist_mu);

    const std::uint32_t next = b.version + 1;
    const std::string path = JoinPath(dir_, IndexShardName(bucket, next));
    {
        std::shared_lock lock(b.mu);
        std::vector<IndexEntry> entries;
        entries.reserve(b.entries.size());
        for (const auto& [key, loc] : b.entries) entries.push_back({key, loc});

        auto r = WriteFileAtomic(path, SerializeShard(bucket, entries));
        if (!r.ok) return r;
    }
    b.version = next;

    for (auto v : ScanVersions(bucket)) {
        if (v >= next) continue;
        std::error_code ec;
        const std::string old = JoinPath(dir_, IndexShardName(bucket, v));
        if (!fs::remove(old, ec) && ec) {
            LogWarn("Failed to remove stale index %s: %s", old.c_str(), ec.message().c_str());
        }
    }
    return Result::Ok();
}

Result ContentIndex::Persist() {
    for (std::uint8_t i = 0; i < kBucketCount; ++i) {
        auto r = PersistBucket(i);
        if (!r.ok) return r;
    }
    return Result::Ok();
}

std::vector<IndexEntry> ContentIndex::Entries(std::uint8_t bucket) const {
    std::vector<IndexEntry> out;
    if (bucket >= kBucketCount) return out;
    const Bucket& b = buckets_[bucket];
    std::shared_lock lock(b.mu);
    out.reserve(b.entries.size());
    for (const auto& [key, loc] : b.entries) out.push_back({key, loc});
    return out;
}

std::size_t ContentIndex::EraseIf(std::uint8_t bucket,
                                  const std::function<bool(const IndexEntry&)>& pred) {
    if (bucket >= kBucketCount) return 0;
    Bucket& b = buckets_[bucket];
    std::unique_lock lock(b.mu);
    return std::erase_if(b.entries, [&](const auto& kv) { return pred(IndexEntry{kv.first, kv.second}); });
}

std::size_t ContentIndex::Size() const {
    std::size_t n = 0;
    for (const auto& b : buckets_) {
        std::shared_lock lock(b.mu);
        n += b.entries.size();
    }
    return n;
}

std::uint32_t ContentIndex::BucketVersion(std::uint8_t bucket) const {
    if (bucket >= kBucketCount) return 0;
    const Bucket& b = buckets_[bucket];
    std::lock_guard persist(b.persist_mu);
    return b.version;
}

} // namespace ngdp::casc
