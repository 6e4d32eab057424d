#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ngdp {

class FileOrStdinReader final : public IReader {
public:
    static Result Open(std::string path, FileOrStdinReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

// Slurps a whole file ("-" for stdin).
Result ReadFileToVector(const std::string& path, std::vector<std::uint8_t>& out);

// pread(2) loop. A short file yields Io with err == 0.
Result PreadExact(int fd, std::span<std::uint8_t> out, std::uint64_t offset);

} // namespace ngdp
