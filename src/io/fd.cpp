#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace ngdp {

Fd::Fd(int fd) : fd_(fd) {}

Result Fd::Open(const std::string& path, int flags, mode_t mode, Fd& out) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e, "open " + path + " failed (" + std::strerror(e) + ")");
    }
    out.Reset(fd);
    return Result::Ok();
}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Close() {
    if (fd_ >= 0 && fd_ != STDIN_FILENO && fd_ != STDOUT_FILENO) {
        ::close(fd_);
    }
    fd_ = -1;
}

Result FsyncDirectory(const std::string& dir) {
    Fd fd;
    auto r = Fd::Open(dir, O_RDONLY | O_DIRECTORY, 0, fd);
    if (!r.ok) return r;
    if (::fsync(fd.Get()) == -1) {
        const int e = errno;
        return Result::Fail(e, "fsync " + dir + " failed (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace ngdp
