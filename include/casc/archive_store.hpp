#pragma once

#include "casc/content_index.hpp"
#include "casc/data_file.hpp"
#include "io/fd.hpp"
#include "util/content_key.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ngdp::casc {

struct ArchiveStoreOptions {
    std::uint64_t max_data_file_size = kDefaultMaxDataFileSize;
    // Re-check BLTE chunk checksums on every Read().
    bool verify_on_read = false;
    // Trim orphaned tails and dangling index entries on open. Inspection
    // tools turn this off so they report damage instead of repairing it.
    bool recover = true;
};

struct VerifyReport {
    std::size_t checked = 0;
    std::vector<std::string> failures;
};

// Append-only local archive: data.NNN files holding encoded BLTE blobs plus
// the bucketed content index that locates them.
class ArchiveStore {
public:
    // Opens or creates the store in `data_dir` (normally <install>/Data/data),
    // loads the index and truncates anything a crash left unindexed.
    static Result Open(const std::string& data_dir,
                       ArchiveStoreOptions opt,
                       std::unique_ptr<ArchiveStore>& out);

    ArchiveStore(const ArchiveStore&) = delete;
    ArchiveStore& operator=(const ArchiveStore&) = delete;

    // Writes `encoded` under `ekey` and makes it durable. A key that is
    // already present is left alone and its location returned.
    Result Append(const EKey& ekey,
                  std::span<const std::uint8_t> encoded,
                  ArchiveLocation* out_loc = nullptr);

    // NotFound, CorruptArchive or the stored encoded bytes.
    Result Read(const EKey& ekey, std::vector<std::uint8_t>& out) const;

    bool Contains(const EKey& ekey) const;

    // Diagnostics only.
    std::optional<ArchiveLocation> Lookup(const EKey& ekey) const;

    // Reads back every indexed entry with checksum verification.
    VerifyReport VerifyAll() const;

    const ContentIndex& Index() const { return index_; }
    const std::string& Dir() const { return dir_; }

private:
    struct DataFile {
        std::uint32_t id = 0;
        Fd fd;
        // Guards size and serializes appends.
        std::mutex mu;
        std::uint64_t size = 0;
    };

    ArchiveStore(std::string dir, ArchiveStoreOptions opt);

    Result OpenDataFiles();
    Result Recover();
    Result OpenDataFile(std::uint32_t id, DataFile*& out);

    DataFile* FindFile(std::uint32_t id) const;
    Result ActiveFile(DataFile*& out);
    Result RollOver(std::uint32_t full_id);

    Result ReadAt(const EKey& ekey,
                  const ArchiveLocation& loc,
                  bool verify,
                  std::vector<std::uint8_t>& out) const;

    std::string dir_;
    ArchiveStoreOptions opt_;
    ContentIndex index_;

    mutable std::mutex files_mu_;
    std::map<std::uint32_t, std::unique_ptr<DataFile>> files_;
    std::uint32_t active_id_ = 0;
};

} // namespace ngdp::casc
