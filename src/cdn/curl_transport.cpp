#include "cdn/http_transport.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <string>

namespace ngdp::cdn {

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    auto* body = static_cast<std::vector<std::uint8_t>*>(userp);
    const auto* p = static_cast<const std::uint8_t*>(contents);
    body->insert(body->end(), p, p + total);
    return total;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

} // namespace

CurlTransport::CurlTransport() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

Result CurlTransport::Get(const HttpRequest& req, HttpResponse& out) {
    out = HttpResponse{};

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) return Result::Fail(ErrorCode::Transport, "curl_easy_init failed");

    curl_easy_setopt(curl.get(), CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, req.connect_timeout_s);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, req.timeout_s);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "ngdp-tool/1.0");

    std::string range;
    if (req.range) {
        range = std::to_string(req.range->first) + "-" + std::to_string(req.range->last);
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        const ErrorCode code = res == CURLE_OPERATION_TIMEDOUT ? ErrorCode::Timeout : ErrorCode::Transport;
        return Result::Fail(code, req.url + ": " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &out.status);
    LogDebug("GET %s -> %ld (%zu bytes)", req.url.c_str(), out.status, out.body.size());
    return Result::Ok();
}

} // namespace ngdp::cdn
