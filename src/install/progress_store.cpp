#include "install/progress_store.hpp"

#include "io/atomic_file.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace ngdp {

namespace {

bool ParseLine(const std::string& line, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(line);
    } catch (const std::exception&) {
        return false;
    }
    return out.is_object();
}

} // namespace

ProgressStore::ProgressStore(std::string path, std::string version)
    : path_(std::move(path)), version_(std::move(version)) {}

Result ProgressStore::Open(const std::string& path,
                           const std::string& manifest_version,
                           std::unique_ptr<ProgressStore>& out) {
    std::unique_ptr<ProgressStore> store(new ProgressStore(path, manifest_version));

    std::ifstream is(path, std::ios::binary);
    Result r;
    if (is.good()) {
        std::ostringstream ss;
        ss << is.rdbuf();
        r = store->Resume(ss.str());
    } else {
        r = store->StartFresh();
    }
    if (!r.ok) return r;

    out = std::move(store);
    return Result::Ok();
}

Result ProgressStore::StartFresh() {
    done_.clear();
    const nlohmann::json head = {{"manifest_version", version_}};
    const std::string line = head.dump() + "\n";
    auto r = WriteFileAtomic(path_, std::span(reinterpret_cast<const std::uint8_t*>(line.data()), line.size()));
    if (!r.ok) return r;
    return Fd::Open(path_, O_WRONLY | O_APPEND, 0, fd_);
}

Result ProgressStore::Resume(const std::string& content) {
    const auto first_nl = content.find('\n');
    nlohmann::json head;
    if (first_nl == std::string::npos || !ParseLine(content.substr(0, first_nl), head)) {
        LogWarn("Progress file %s unreadable, starting over", path_.c_str());
        return StartFresh();
    }
    auto it = head.find("manifest_version");
    if (it == head.end() || !it->is_string() || it->get<std::string>() != version_) {
        LogInfo("Progress file %s is for another manifest version, starting over", path_.c_str());
        return StartFresh();
    }

    // Only newline-terminated lines count; anything after the last newline
    // is a torn write and gets cut off before we append again.
    const std::size_t valid_end = content.rfind('\n') + 1;
    std::size_t pos = first_nl + 1;
    while (pos < valid_end) {
        const std::size_t nl = content.find('\n', pos);
        const std::string line = content.substr(pos, nl - pos);
        pos = nl + 1;

        nlohmann::json j;
        if (!ParseLine(line, j)) {
            LogWarn("Skipping malformed line in %s", path_.c_str());
            continue;
        }
        auto k = j.find("ekey");
        if (k == j.end() || !k->is_string()) continue;
        if (auto ekey = EKey::FromHex(k->get<std::string>())) done_.insert(*ekey);
    }

    auto r = Fd::Open(path_, O_WRONLY | O_APPEND, 0, fd_);
    if (!r.ok) return r;
    if (valid_end != content.size()) {
        LogWarn("Dropping torn last line of %s", path_.c_str());
        if (::ftruncate(fd_.Get(), static_cast<off_t>(valid_end)) != 0) {
            const int e = errno;
            return Result::Fail(e, "ftruncate " + path_ + " failed (" + std::strerror(e) + ")");
        }
    }

    LogInfo("Resuming install: %zu key(s) already complete", done_.size());
    return Result::Ok();
}

bool ProgressStore::IsCompleted(const EKey& ekey) const {
    std::lock_guard lock(mu_);
    return done_.count(ekey) != 0;
}

std::size_t ProgressStore::CompletedCount() const {
    std::lock_guard lock(mu_);
    return done_.size();
}

Result ProgressStore::RecordCompleted(const EKey& ekey) {
    std::lock_guard lock(mu_);
    if (done_.count(ekey) != 0) return Result::Ok();
    if (!fd_.Valid()) return Result::Fail(ErrorCode::InvalidArgument, "progress store is closed");

    const off_t end = ::lseek(fd_.Get(), 0, SEEK_END);
    if (end < 0) {
        const int e = errno;
        return Result::Fail(e, "lseek " + path_ + " failed (" + std::strerror(e) + ")");
    }

    const std::string line = nlohmann::json{{"ekey", ekey.Hex()}}.dump() + "\n";
    auto r = WriteAllFd(fd_.Get(), std::span(reinterpret_cast<const std::uint8_t*>(line.data()), line.size()));
    if (!r.ok) {
        // Cut a partial line so the next append starts on a line boundary.
        if (::ftruncate(fd_.Get(), end) != 0) {
            LogError("Failed to cut partial line from %s: %s", path_.c_str(), std::strerror(errno));
        }
        return r;
    }
    if (::fsync(fd_.Get()) != 0) {
        const int e = errno;
        return Result::Fail(e, "fsync " + path_ + " failed (" + std::strerror(e) + ")");
    }
    done_.insert(ekey);
    return Result::Ok();
}

Result ProgressStore::Remove() {
    std::lock_guard lock(mu_);
    fd_.Close();
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        const int e = errno;
        return Result::Fail(e, "unlink " + path_ + " failed (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace ngdp
