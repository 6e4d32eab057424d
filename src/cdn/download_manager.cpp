#include "cdn/download_manager.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <thread>

namespace ngdp::cdn {

namespace {

const char* KindDir(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Data:
        case ObjectKind::Index:
            return "data";
        case ObjectKind::Config:
            return "config";
        case ObjectKind::Path:
            break;
    }
    return "";
}

bool Retryable(ErrorCode code) {
    return ErrorKindOf(code) == ErrorKind::Transient;
}

Result ClassifyStatus(long status, const std::string& url) {
    if (status == 200 || status == 206) return Result::Ok();
    const std::string what = url + " returned HTTP " + std::to_string(status);
    if (status == 404) return Result::Fail(ErrorCode::NotFound, what);
    if (status == 429 || (status >= 500 && status <= 599)) return Result::Fail(ErrorCode::ServerError, what);
    return Result::Fail(ErrorCode::HttpError, what);
}

} // namespace

std::string ObjectPath(const std::string& cdn_path, const ObjectRef& ref) {
    if (ref.kind == ObjectKind::Path) {
        std::string p = JoinPath(cdn_path, ref.name);
        if (p.empty() || p.front() != '/') p.insert(0, "/");
        return p;
    }
    return CdnHashPath(cdn_path, KindDir(ref.kind), ref.name,
                       ref.kind == ObjectKind::Index ? ".index" : "");
}

DownloadManager::DownloadManager(IHttpTransport& transport,
                                 DownloadOptions opt,
                                 const std::atomic_bool& cancel)
    : transport_(transport), opt_(std::move(opt)), cancel_(cancel) {
    opt_.max_attempts = std::max(1, opt_.max_attempts);
    opt_.max_in_flight = std::max(1, opt_.max_in_flight);
    sleeper_ = [this](std::chrono::milliseconds d) { DefaultSleep(d); };
}

std::string DownloadManager::UrlFor(std::size_t attempt, const std::string& path) const {
    std::string host = opt_.hosts[attempt % opt_.hosts.size()];
    if (host.find("://") == std::string::npos) host = "http://" + host;
    while (!host.empty() && host.back() == '/') host.pop_back();
    return host + path;
}

std::chrono::milliseconds DownloadManager::BackoffFor(int attempt) const {
    // attempt is 1-based: the wait after the first failure is initial_backoff.
    auto delay = opt_.initial_backoff;
    for (int i = 1; i < attempt && delay < opt_.max_backoff; ++i) delay *= 2;
    return std::min(delay, opt_.max_backoff);
}

// Sleeps in short slices so a cancel request is noticed promptly.
void DownloadManager::DefaultSleep(std::chrono::milliseconds delay) const {
    const auto until = std::chrono::steady_clock::now() + delay;
    while (!cancel_.load() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::min(delay, std::chrono::milliseconds(50)));
    }
}

void DownloadManager::AcquireSlot() {
    std::unique_lock lock(slot_mu_);
    slot_cv_.wait(lock, [this] { return in_flight_ < opt_.max_in_flight; });
    ++in_flight_;
}

void DownloadManager::ReleaseSlot() {
    {
        std::lock_guard lock(slot_mu_);
        --in_flight_;
    }
    slot_cv_.notify_one();
}

Result DownloadManager::Fetch(const ObjectRef& ref, std::vector<std::uint8_t>& out) {
    out.clear();
    if (opt_.hosts.empty()) return Result::Fail(ErrorCode::InvalidArgument, "no CDN hosts configured");
    if (ref.name.empty()) return Result::Fail(ErrorCode::InvalidArgument, "empty object name");
    if (ref.range && ref.range->last < ref.range->first) {
        return Result::Fail(ErrorCode::InvalidArgument, "inverted byte range");
    }

    const std::string path = ObjectPath(opt_.cdn_path, ref);
    Result last;

    for (int attempt = 1; attempt <= opt_.max_attempts; ++attempt) {
        if (cancel_.load()) return Result::Fail(ErrorCode::Cancelled, "fetch of " + path + " cancelled");

        HttpRequest req;
        req.url = UrlFor(static_cast<std::size_t>(attempt - 1), path);
        req.range = ref.range;
        req.connect_timeout_s = opt_.connect_timeout_s;
        req.timeout_s = opt_.request_timeout_s;

        HttpResponse resp;
        Result r;
        {
            SlotGuard slot(*this);
            ++requests_;
            r = transport_.Get(req, resp);
        }

        if (r.ok) r = ClassifyStatus(resp.status, req.url);
        if (r.ok && ref.range && resp.body.size() != ref.range->Length()) {
            return Result::Fail(ErrorCode::ChecksumMismatch,
                                req.url + ": range answered with " + std::to_string(resp.body.size()) +
                                    " bytes, expected " + std::to_string(ref.range->Length()));
        }
        if (r.ok) {
            bytes_fetched_ += resp.body.size();
            out = std::move(resp.body);
            return Result::Ok();
        }

        if (!Retryable(r.code)) return r;
        last = std::move(r);
        if (attempt < opt_.max_attempts) {
            const auto delay = BackoffFor(attempt);
            LogWarn("Attempt %d/%d failed: %s; retrying in %lld ms", attempt, opt_.max_attempts,
                    last.msg.c_str(), static_cast<long long>(delay.count()));
            sleeper_(delay);
        }
    }

    LogError("Giving up on %s after %d attempts", path.c_str(), opt_.max_attempts);
    return last;
}

} // namespace ngdp::cdn
