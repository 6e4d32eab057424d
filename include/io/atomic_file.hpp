#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace ngdp {

// mkstemp file created next to its final destination. Unlinked on destruction
// unless Commit() renamed it into place.
class TempFile {
public:
    static Result Create(const std::string& dir, const std::string& prefix, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;
    void Close();

    // fsync, close, rename onto final_path and fsync the parent directory.
    Result Commit(const std::string& final_path);

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
    std::string dir_;
};

// Replaces `path` with `data` so readers see either the old or the new file.
Result WriteFileAtomic(const std::string& path, std::span<const std::uint8_t> data);

} // namespace ngdp
