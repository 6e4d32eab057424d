#pragma once

#include "cdn/http_transport.hpp"
#include "io/io.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/ngdp_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        // Best-effort cleanup. Keep it simple: rely on "rm -rf".
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

class MemoryReader final : public ngdp::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    // Hands out at most `max_read` bytes per call and, when `hide_size` is
    // set, behaves like a pipe whose length is unknown.
    MemoryReader(std::vector<std::uint8_t> data, size_t max_read, bool hide_size)
        : data_(std::move(data)), max_read_(max_read), hide_size_(hide_size) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min({out.size(), data_.size() - pos_, max_read_});
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        if (hide_size_)
            return std::nullopt;
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
    size_t max_read_ = static_cast<size_t>(-1);
    bool hide_size_ = false;
};

inline std::vector<std::uint8_t> Bytes(std::string_view s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

// Deterministic pseudo-random content that still compresses a little.
inline std::vector<std::uint8_t> Pattern(size_t n, std::uint32_t seed = 1) {
    std::vector<std::uint8_t> out(n);
    std::uint32_t x = seed * 2654435761u + 1;
    for (size_t i = 0; i < n; ++i) {
        x = x * 1103515245u + 12345u;
        out[i] = (i % 7 == 0) ? static_cast<std::uint8_t>('a' + i % 26) : static_cast<std::uint8_t>(x >> 16);
    }
    return out;
}

inline std::string ReadAll(ngdp::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

inline void WriteFile(const std::string& path, std::string_view contents) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good())
        throw std::runtime_error("cannot write " + path);
    os.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

inline bool FileExists(const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0;
}

inline std::uint64_t FileSize(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0)
        return 0;
    return static_cast<std::uint64_t>(st.st_size);
}

// Scripted HTTP transport keyed by URL path (host stripped). Each path has a
// queue of replies; the last reply repeats once the queue is down to one.
class FakeTransport final : public ngdp::cdn::IHttpTransport {
  public:
    struct Reply {
        ngdp::Result result;
        long status = 200;
        std::vector<std::uint8_t> body;
    };

    static Reply Ok(std::vector<std::uint8_t> body) { return {ngdp::Result::Ok(), 200, std::move(body)}; }
    static Reply Status(long status) { return {ngdp::Result::Ok(), status, {}}; }
    static Reply Timeout() {
        return {ngdp::Result::Fail(ngdp::ErrorCode::Timeout, "timed out"), 0, {}};
    }

    void Add(const std::string& path, Reply reply) {
        std::lock_guard lock(mu_);
        replies_[path].push_back(std::move(reply));
    }

    // Drops whatever was queued for `path`.
    void Set(const std::string& path, Reply reply) {
        std::lock_guard lock(mu_);
        auto& q = replies_[path];
        q.clear();
        q.push_back(std::move(reply));
    }

    ngdp::Result Get(const ngdp::cdn::HttpRequest& req, ngdp::cdn::HttpResponse& out) override {
        const int now = ++in_flight_;
        int seen = max_in_flight_.load();
        while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
        }
        if (delay_us_ > 0)
            ::usleep(delay_us_);

        std::lock_guard lock(mu_);
        --in_flight_;
        requests_.push_back(req);

        const auto scheme = req.url.find("://");
        const auto path_start = req.url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
        const std::string path = path_start == std::string::npos ? "/" : req.url.substr(path_start);

        auto it = replies_.find(path);
        if (it == replies_.end() || it->second.empty()) {
            out.status = 404;
            out.body.clear();
            return ngdp::Result::Ok();
        }
        Reply reply = it->second.front();
        if (it->second.size() > 1)
            it->second.pop_front();

        out.status = reply.status;
        out.body = reply.body;
        return reply.result;
    }

    std::vector<ngdp::cdn::HttpRequest> Requests() const {
        std::lock_guard lock(mu_);
        return requests_;
    }

    size_t RequestCount(const std::string& path_suffix) const {
        std::lock_guard lock(mu_);
        return static_cast<size_t>(std::count_if(requests_.begin(), requests_.end(), [&](const auto& r) {
            return r.url.size() >= path_suffix.size() &&
                   r.url.compare(r.url.size() - path_suffix.size(), path_suffix.size(), path_suffix) == 0;
        }));
    }

    int MaxInFlight() const { return max_in_flight_.load(); }
    void SetDelayMicros(useconds_t us) { delay_us_ = us; }

  private:
    mutable std::mutex mu_;
    std::map<std::string, std::deque<Reply>> replies_;
    std::vector<ngdp::cdn::HttpRequest> requests_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
    useconds_t delay_us_ = 0;
};

} // namespace testutil
