#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ngdp {

Result FileOrStdinReader::Open(std::string path, FileOrStdinReader& out) {
    out.path_ = std::move(path);

    if (out.path_ == "-") {
        out.fd_.Reset(STDIN_FILENO);
        out.size_ = std::nullopt;
        return Result::Ok();
    }

    auto r = Fd::Open(out.path_, O_RDONLY, 0, out.fd_);
    if (!r.ok) {
        return Result::Fail(r.code, "Failed to open input: " + r.msg, r.err);
    }

    struct stat st{};
    if (::fstat(out.fd_.Get(), &st) == 0 && S_ISREG(st.st_mode)) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileOrStdinReader::TotalSize() const { return size_; }

ssize_t FileOrStdinReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result ReadFileToVector(const std::string& path, std::vector<std::uint8_t>& out) {
    FileOrStdinReader reader;
    auto r = FileOrStdinReader::Open(path, reader);
    if (!r.ok) return r;

    out.clear();
    if (auto sz = reader.TotalSize()) {
        out.reserve(static_cast<size_t>(*sz));
    }

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n < 0) {
            const int e = errno;
            return Result::Fail(e, "read " + path + " failed (" + std::strerror(e) + ")");
        }
        if (n == 0) break;
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    return Result::Ok();
}

Result PreadExact(int fd, std::span<std::uint8_t> out, std::uint64_t offset) {
    size_t done = 0;
    while (done < out.size()) {
        const ssize_t n = ::pread(fd, out.data() + done, out.size() - done,
                                  static_cast<off_t>(offset + done));
        if (n > 0) {
            done += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            return Result::Fail(ErrorCode::Io,
                                "short read at offset " + std::to_string(offset + done));
        }
        if (errno == EINTR) continue;
        const int e = errno;
        return Result::Fail(e, "pread failed (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

} // namespace ngdp
