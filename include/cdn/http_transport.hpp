#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ngdp::cdn {

// Inclusive byte range, as in "Range: bytes=first-last".
struct ByteRange {
    std::uint64_t first = 0;
    std::uint64_t last = 0;

    std::uint64_t Length() const { return last - first + 1; }
};

struct HttpRequest {
    std::string url;
    std::optional<ByteRange> range;
    long connect_timeout_s = 15;
    long timeout_s = 300;
};

struct HttpResponse {
    long status = 0;
    std::vector<std::uint8_t> body;
};

// One HTTP GET. A failed Result means no response was received (Transport or
// Timeout); any HTTP status, error or not, comes back in `out`.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual Result Get(const HttpRequest& req, HttpResponse& out) = 0;
};

// libcurl easy handle per request; safe to call from several threads.
class CurlTransport final : public IHttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Result Get(const HttpRequest& req, HttpResponse& out) override;
};

} // namespace ngdp::cdn
