#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace ngdp {

class IReader {
public:
    virtual ~IReader() = default;
    // Returns bytes read, 0 at end of stream, -1 on error.
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
    virtual Result FsyncNow() = 0;
};

// Fills `out` completely unless the stream ends first. Returns the number of
// bytes stored or -1 on a read error.
inline ssize_t ReadFull(IReader& reader, std::span<std::uint8_t> out) {
    size_t got = 0;
    while (got < out.size()) {
        const ssize_t n = reader.Read(out.subspan(got));
        if (n < 0) return -1;
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }
    return static_cast<ssize_t>(got);
}

} // namespace ngdp
