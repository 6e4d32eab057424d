#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace ngdp {

// Truncating writer for CLI outputs; "-" writes to stdout.
class FileOrStdoutWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileOrStdoutWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

  private:
    std::string path_;
    Fd fd_;
};

// write(2) / pwrite(2) loops with EINTR handling.
Result WriteAllFd(int fd, std::span<const std::uint8_t> data);
Result PwriteAll(int fd, std::span<const std::uint8_t> data, std::uint64_t offset);

} // namespace ngdp
