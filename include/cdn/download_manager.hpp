#pragma once

#include "cdn/http_transport.hpp"
#include "util/content_key.hpp"
#include "util/result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ngdp::cdn {

enum class ObjectKind {
    Data,
    Config,
    Index,
    // Literal path below the CDN root, not hash addressed.
    Path,
};

struct ObjectRef {
    ObjectKind kind = ObjectKind::Data;
    // Lowercase hex for hashed kinds, a relative path for Path.
    std::string name;
    std::optional<ByteRange> range;

    static ObjectRef Data(const EKey& ekey, std::optional<ByteRange> range = std::nullopt) {
        return {ObjectKind::Data, ekey.Hex(), range};
    }
    static ObjectRef DataHex(std::string hex, std::optional<ByteRange> range = std::nullopt) {
        return {ObjectKind::Data, std::move(hex), range};
    }
    static ObjectRef Config(std::string hex) { return {ObjectKind::Config, std::move(hex), std::nullopt}; }
    static ObjectRef Index(std::string hex) { return {ObjectKind::Index, std::move(hex), std::nullopt}; }
    static ObjectRef Path(std::string path) { return {ObjectKind::Path, std::move(path), std::nullopt}; }
};

// "/{cdn_path}/{data|config}/ab/cd/abcd...", indices get ".index" appended.
std::string ObjectPath(const std::string& cdn_path, const ObjectRef& ref);

struct DownloadOptions {
    // Tried in order, one per attempt, wrapping around.
    std::vector<std::string> hosts;
    std::string cdn_path;
    int max_attempts = 5;
    std::chrono::milliseconds initial_backoff{250};
    std::chrono::milliseconds max_backoff{8000};
    int max_in_flight = 8;
    long connect_timeout_s = 15;
    long request_timeout_s = 300;
};

// Retrying CDN client. Fetch() is thread-safe.
class DownloadManager {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    DownloadManager(IHttpTransport& transport, DownloadOptions opt, const std::atomic_bool& cancel);

    // Replaces the backoff wait; tests use this to run without real delays.
    void SetSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    Result Fetch(const ObjectRef& ref, std::vector<std::uint8_t>& out);

    std::uint64_t BytesFetched() const { return bytes_fetched_.load(); }
    std::uint64_t Requests() const { return requests_.load(); }
    int InFlight() const {
        std::lock_guard lock(slot_mu_);
        return in_flight_;
    }

private:
    std::string UrlFor(std::size_t attempt, const std::string& path) const;
    std::chrono::milliseconds BackoffFor(int attempt) const;
    void DefaultSleep(std::chrono::milliseconds delay) const;

    void AcquireSlot();
    void ReleaseSlot();

    // Holds one in-flight slot for its lifetime.
    class SlotGuard {
    public:
        explicit SlotGuard(DownloadManager& dm) : dm_(dm) { dm_.AcquireSlot(); }
        ~SlotGuard() { dm_.ReleaseSlot(); }
        SlotGuard(const SlotGuard&) = delete;
        SlotGuard& operator=(const SlotGuard&) = delete;

    private:
        DownloadManager& dm_;
    };

    IHttpTransport& transport_;
    DownloadOptions opt_;
    const std::atomic_bool& cancel_;
    Sleeper sleeper_;

    mutable std::mutex slot_mu_;
    std::condition_variable slot_cv_;
    int in_flight_ = 0;

    std::atomic<std::uint64_t> bytes_fetched_{0};
    std::atomic<std::uint64_t> requests_{0};
};

} // namespace ngdp::cdn
