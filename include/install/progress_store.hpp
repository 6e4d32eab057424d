#pragma once

#include "io/fd.hpp"
#include "util/content_key.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace ngdp {

inline constexpr const char* kProgressFileName = ".ngdp-install-progress";

// Resumable record of the keys an install has finished, as JSON lines:
//   {"manifest_version":"..."}
//   {"ekey":"..."}
//   ...
// Each line is fsynced when appended, so a crash loses at most a torn last
// line, which the next Open() discards.
class ProgressStore {
public:
    // Resumes the record at `path` if it belongs to `manifest_version`,
    // otherwise replaces it with an empty one.
    static Result Open(const std::string& path,
                       const std::string& manifest_version,
                       std::unique_ptr<ProgressStore>& out);

    ProgressStore(const ProgressStore&) = delete;
    ProgressStore& operator=(const ProgressStore&) = delete;

    bool IsCompleted(const EKey& ekey) const;
    std::size_t CompletedCount() const;

    // Thread-safe. Recording a key twice writes it once.
    Result RecordCompleted(const EKey& ekey);

    // Deletes the file; called when a session finishes without failures.
    Result Remove();

    const std::string& Path() const { return path_; }

private:
    ProgressStore(std::string path, std::string version);

    Result Resume(const std::string& content);
    Result StartFresh();

    std::string path_;
    std::string version_;

    mutable std::mutex mu_;
    Fd fd_;
    std::unordered_set<EKey, KeyHash> done_;
};

} // namespace ngdp
