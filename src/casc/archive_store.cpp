#include "casc/archive_store.hpp"

#include "blte/blte_decoder.hpp"
#include "crypto/key_store.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/hex.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ngdp::casc {

namespace {

Result ErrnoFail(const std::string& what) {
    const int e = errno;
    return Result::Fail(e, what + " failed (" + std::strerror(e) + ")");
}

std::string Describe(const ArchiveLocation& loc) {
    return "data." + std::to_string(loc.archive_id) + "+" + std::to_string(loc.offset);
}

} // namespace

ArchiveStore::ArchiveStore(std::string dir, ArchiveStoreOptions opt)
    : dir_(std::move(dir)), opt_(opt), index_(dir_) {}

Result ArchiveStore::Open(const std::string& data_dir,
                          ArchiveStoreOptions opt,
                          std::unique_ptr<ArchiveStore>& out) {
    if (opt.max_data_file_size <= kEntryHeaderSize || opt.max_data_file_size > kDefaultMaxDataFileSize) {
        return Result::Fail(ErrorCode::InvalidArgument,
                            "max data file size must be in (30, 0x3FFFFFFF]");
    }

    std::error_code ec;
    fs::create_directories(data_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "create " + data_dir + " failed (" + ec.message() + ")");
    }

    std::unique_ptr<ArchiveStore> store(new ArchiveStore(data_dir, opt));
    auto r = store->index_.Load();
    if (!r.ok) return r;
    r = store->OpenDataFiles();
    if (!r.ok) return r;
    if (opt.recover) {
        r = store->Recover();
        if (!r.ok) return r;
    }

    LogInfo("Archive %s: %zu entries in %zu data file(s)", data_dir.c_str(), store->index_.Size(),
            store->files_.size());
    out = std::move(store);
    return Result::Ok();
}

Result ArchiveStore::OpenDataFile(std::uint32_t id, DataFile*& out) {
    auto f = std::make_unique<DataFile>();
    f->id = id;
    const std::string path = JoinPath(dir_, DataFileName(id));
    auto r = Fd::Open(path, O_RDWR | O_CREAT, 0644, f->fd);
    if (!r.ok) return r;

    struct stat st {};
    if (::fstat(f->fd.Get(), &st) != 0) return ErrnoFail("fstat " + path);
    f->size = static_cast<std::uint64_t>(st.st_size);

    out = f.get();
    files_[id] = std::move(f);
    return Result::Ok();
}

Result ArchiveStore::OpenDataFiles() {
    std::error_code ec;
    std::vector<std::uint32_t> ids;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (auto id = ParseDataFileName(it->path().filename().string())) ids.push_back(*id);
    }
    if (ec) return Result::Fail(ec.value(), "scan " + dir_ + " failed (" + ec.message() + ")");

    std::sort(ids.begin(), ids.end());
    for (auto id : ids) {
        DataFile* f = nullptr;
        auto r = OpenDataFile(id, f);
        if (!r.ok) return r;
    }
    active_id_ = ids.empty() ? 0 : ids.back();
    return Result::Ok();
}

// Index entries beyond a file's end are dropped; file bytes beyond the last
// indexed entry are cut off. Both are the leftovers of an interrupted append.
Result ArchiveStore::Recover() {
    std::map<std::uint32_t, std::uint64_t> indexed_end;

    for (std::uint8_t bucket = 0; bucket < kBucketCount; ++bucket) {
        const std::size_t dropped = index_.EraseIf(bucket, [&](const IndexEntry& e) {
            DataFile* f = FindFile(e.location.archive_id);
            const std::uint64_t end = std::uint64_t{e.location.offset} + e.location.size;
            if (f == nullptr || end > f->size || e.location.size < kEntryHeaderSize) {
                LogWarn("Dropping index entry %s at %s: beyond end of data file",
                        HexEncode(e.key).c_str(), Describe(e.location).c_str());
                return true;
            }
            auto& mark = indexed_end[e.location.archive_id];
            mark = std::max(mark, end);
            return false;
        });
        if (dropped > 0) {
            auto r = index_.PersistBucket(bucket);
            if (!r.ok) return r;
        }
    }

    for (auto& [id, f] : files_) {
        const std::uint64_t keep = indexed_end.count(id) ? indexed_end[id] : 0;
        if (f->size <= keep) continue;
        LogWarn("Truncating %llu orphaned bytes from %s",
                static_cast<unsigned long long>(f->size - keep), DataFileName(id).c_str());
        if (::ftruncate(f->fd.Get(), static_cast<off_t>(keep)) != 0) {
            return ErrnoFail("ftruncate " + DataFileName(id));
        }
        if (::fsync(f->fd.Get()) != 0) return ErrnoFail("fsync " + DataFileName(id));
        f->size = keep;
    }
    return Result::Ok();
}

ArchiveStore::DataFile* ArchiveStore::FindFile(std::uint32_t id) const {
    std::lock_guard lock(files_mu_);
    auto it = files_.find(id);
    return it == files_.end() ? nullptr : it->second.get();
}

Result ArchiveStore::ActiveFile(DataFile*& out) {
    std::lock_guard lock(files_mu_);
    auto it = files_.find(active_id_);
    if (it != files_.end()) {
        out = it->second.get();
        return Result::Ok();
    }
    return OpenDataFile(active_id_, out);
}

Result ArchiveStore::RollOver(std::uint32_t full_id) {
    std::lock_guard lock(files_mu_);
    if (active_id_ != full_id) return Result::Ok(); // someone else already rolled
    if (full_id >= kMaxArchiveId) {
        return Result::Fail(ErrorCode::ResourceExhausted, "no data file ids left");
    }
    DataFile* f = nullptr;
    auto r = OpenDataFile(full_id + 1, f);
    if (!r.ok) return r;
    active_id_ = full_id + 1;
    LogInfo("Rolled over to %s", DataFileName(active_id_).c_str());
    return Result::Ok();
}

Result ArchiveStore::Append(const EKey& ekey,
                            std::span<const std::uint8_t> encoded,
                            ArchiveLocation* out_loc) {
    const std::uint64_t total = kEntryHeaderSize + std::uint64_t{encoded.size()};
    if (total > opt_.max_data_file_size) {
        return Result::Fail(ErrorCode::InvalidArgument,
                            "entry of " + std::to_string(total) + " bytes exceeds data file size");
    }

    while (true) {
        if (auto existing = index_.Lookup(ekey)) {
            if (out_loc) *out_loc = *existing;
            return Result::Ok();
        }

        DataFile* f = nullptr;
        auto r = ActiveFile(f);
        if (!r.ok) return r;

        std::unique_lock lock(f->mu);
        if (f->size + total > opt_.max_data_file_size) {
            lock.unlock();
            r = RollOver(f->id);
            if (!r.ok) return r;
            continue;
        }
        // Another writer may have stored the key while we waited.
        if (auto existing = index_.Lookup(ekey)) {
            if (out_loc) *out_loc = *existing;
            return Result::Ok();
        }

        ArchiveLocation loc{f->id, static_cast<std::uint32_t>(f->size), static_cast<std::uint32_t>(total)};
        const EntryHeader header = BuildEntryHeader(ekey, loc.size, loc.archive_id, loc.offset);

        r = PwriteAll(f->fd.Get(), header, loc.offset);
        if (r.ok) r = PwriteAll(f->fd.Get(), encoded, loc.offset + kEntryHeaderSize);
        if (r.ok && ::fsync(f->fd.Get()) != 0) r = ErrnoFail("fsync " + DataFileName(f->id));
        if (!r.ok) {
            // Drop the partial write so the next append reuses the offset.
            if (::ftruncate(f->fd.Get(), static_cast<off_t>(f->size)) != 0) {
                LogWarn("Failed to trim %s after write error: %s", DataFileName(f->id).c_str(),
                        std::strerror(errno));
            }
            return r;
        }
        f->size += total;

        r = index_.Insert(ekey, loc);
        if (!r.ok) return r;

        // The entry is visible only once its shard is on disk. This rewrites
        // the whole bucket per append, so cost grows with bucket size.
        const std::uint8_t bucket = BucketOf(ekey);
        r = index_.PersistBucket(bucket);
        if (!r.ok) {
            // Not durable: forget it so a retry writes it again. The data bytes
            // become an orphan tail that the next Open() trims.
            const IndexKey key = ToIndexKey(ekey);
            index_.EraseIf(bucket, [&](const IndexEntry& e) { return e.key == key; });
            return r;
        }

        LogDebug("Archived %s at %s (%u bytes)", ekey.Hex().c_str(), Describe(loc).c_str(), loc.size);
        if (out_loc) *out_loc = loc;
        return Result::Ok();
    }
}

Result ArchiveStore::ReadAt(const EKey& ekey,
                            const ArchiveLocation& loc,
                            bool verify,
                            std::vector<std::uint8_t>& out) const {
    DataFile* f = FindFile(loc.archive_id);
    if (f == nullptr) {
        return Result::Fail(ErrorCode::CorruptArchive,
                            "index points at missing " + DataFileName(loc.archive_id));
    }
    if (loc.size < kEntryHeaderSize) {
        return Result::Fail(ErrorCode::CorruptArchive, "entry too small at " + Describe(loc));
    }

    std::vector<std::uint8_t> buf(loc.size);
    auto r = PreadExact(f->fd.Get(), buf, loc.offset);
    if (!r.ok) {
        if (r.err == 0) return Result::Fail(ErrorCode::CorruptArchive, r.msg + " in " + Describe(loc));
        return r;
    }

    r = VerifyEntryHeader(std::span<const std::uint8_t>(buf).first(kEntryHeaderSize), ekey, loc);
    if (!r.ok) return r;

    const auto payload = std::span<const std::uint8_t>(buf).subspan(kEntryHeaderSize);
    if (verify) {
        EmptyKeyStore no_keys;
        blte::BlteDecoder decoder(no_keys);
        r = decoder.VerifyChecksums(payload);
        if (!r.ok) {
            return Result::Fail(ErrorCode::CorruptArchive,
                                ekey.Hex() + " fails BLTE verification: " + r.msg);
        }
    }

    out.assign(payload.begin(), payload.end());
    return Result::Ok();
}

Result ArchiveStore::Read(const EKey& ekey, std::vector<std::uint8_t>& out) const {
    auto loc = index_.Lookup(ekey);
    if (!loc) return Result::Fail(ErrorCode::NotFound, ekey.Hex() + " not in archive");
    return ReadAt(ekey, *loc, opt_.verify_on_read, out);
}

bool ArchiveStore::Contains(const EKey& ekey) const {
    return index_.Lookup(ekey).has_value();
}

std::optional<ArchiveLocation> ArchiveStore::Lookup(const EKey& ekey) const {
    return index_.Lookup(ekey);
}

VerifyReport ArchiveStore::VerifyAll() const {
    VerifyReport report;
    std::vector<std::uint8_t> scratch;

    for (std::uint8_t bucket = 0; bucket < kBucketCount; ++bucket) {
        for (const auto& e : index_.Entries(bucket)) {
            ++report.checked;
            const std::string where = HexEncode(e.key) + " at " + Describe(e.location);

            // The index only keeps 9 key bytes; recover the full EKey from the
            // entry header and check it against the index.
            DataFile* f = FindFile(e.location.archive_id);
            EntryHeader header{};
            Result r = f == nullptr
                           ? Result::Fail(ErrorCode::CorruptArchive, "missing data file")
                           : PreadExact(f->fd.Get(), header, e.location.offset);
            if (!r.ok) {
                report.failures.push_back(where + ": " + r.msg);
                continue;
            }
            EKey::Bytes full{};
            std::reverse_copy(header.begin(), header.begin() + 16, full.begin());
            const EKey ekey(full);
            if (ToIndexKey(ekey) != e.key) {
                report.failures.push_back(where + ": entry header holds " + ekey.Hex());
                continue;
            }

            r = ReadAt(ekey, e.location, true, scratch);
            if (!r.ok) report.failures.push_back(where + ": " + r.msg);
        }
    }
    return report;
}

} // namespace ngdp::casc
