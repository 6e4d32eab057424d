#include "io/atomic_file.hpp"

#include "io/file_writer.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

namespace ngdp {

Result TempFile::Create(const std::string& dir, const std::string& prefix, TempFile& out) {
    std::string tmpl = JoinPath(dir, prefix + ".XXXXXX");
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e, "mkstemp in " + dir + " failed (" + std::strerror(e) + ")");
    }
    out.Cleanup();
    out.fd_.Reset(fd);
    out.path_ = buf.data();
    out.dir_ = dir;
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        dir_ = std::move(other.dir_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

void TempFile::Close() { fd_.Close(); }

Result TempFile::Commit(const std::string& final_path) {
    if (path_.empty()) return Result::Fail(ErrorCode::InvalidArgument, "temp file not created");

    if (::fsync(fd_.Get()) == -1) {
        const int e = errno;
        return Result::Fail(e, "fsync " + path_ + " failed (" + std::strerror(e) + ")");
    }
    Close();

    if (std::rename(path_.c_str(), final_path.c_str()) != 0) {
        const int e = errno;
        return Result::Fail(e, "rename " + path_ + " -> " + final_path + " failed (" +
                                   std::strerror(e) + ")");
    }
    path_.clear();
    return FsyncDirectory(dir_);
}

void TempFile::Cleanup() {
    Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

Result WriteFileAtomic(const std::string& path, std::span<const std::uint8_t> data) {
    TempFile tmp;
    auto r = TempFile::Create(ParentDir(path), "." + BaseName(path), tmp);
    if (!r.ok) return r;

    r = WriteAllFd(tmp.GetFd(), data);
    if (!r.ok) return r;

    return tmp.Commit(path);
}

} // namespace ngdp
