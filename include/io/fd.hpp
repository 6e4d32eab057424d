#pragma once

#include "util/result.hpp"

#include <string>
#include <sys/types.h>

namespace ngdp {

class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    // open(2) wrapper; the error message carries the path and strerror.
    static Result Open(const std::string& path, int flags, mode_t mode, Fd& out);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    int Release();
    void Close();

  private:
    int fd_{-1};
};

// fsync on a directory so a rename or create inside it is durable.
Result FsyncDirectory(const std::string& dir);

} // namespace ngdp
