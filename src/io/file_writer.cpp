// file_writer.cpp - Plain file and positional write helpers.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace ngdp {

Result FileOrStdoutWriter::Open(std::string path, FileOrStdoutWriter& out) {
    out.path_ = std::move(path);

    if (out.path_ == "-") {
        out.fd_.Reset(STDOUT_FILENO);
        return Result::Ok();
    }

    auto r = Fd::Open(out.path_, O_WRONLY | O_CREAT | O_TRUNC, 0644, out.fd_);
    if (!r.ok) {
        return Result::Fail(r.code, "Failed to open output: " + r.msg, r.err);
    }
    return Result::Ok();
}

Result FileOrStdoutWriter::WriteAll(std::span<const std::uint8_t> in) {
    return WriteAllFd(fd_.Get(), in);
}

Result FileOrStdoutWriter::FsyncNow() {
    if (path_ == "-") return Result::Ok();
    if (::fsync(fd_.Get()) == -1) {
        const int e = errno;
        return Result::Fail(e, "fsync failed (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

Result WriteAllFd(int fd, std::span<const std::uint8_t> data) {
    size_t rem = data.size();
    const std::uint8_t* p = data.data();

    while (rem > 0) {
        ssize_t n = ::write(fd, p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = errno;
        return Result::Fail(e, "Write failed (" + std::string(std::strerror(e)) + ")");
    }

    return Result::Ok();
}

Result PwriteAll(int fd, std::span<const std::uint8_t> data, std::uint64_t offset) {
    size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::pwrite(fd, data.data() + done, data.size() - done,
                             static_cast<off_t>(offset + done));
        if (n > 0) {
            done += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = errno;
        return Result::Fail(e, "pwrite failed (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

} // namespace ngdp
