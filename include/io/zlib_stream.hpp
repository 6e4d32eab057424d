#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <memory>
#include <span>
#include <vector>
#include <zlib.h>

namespace ngdp {

// Streaming zlib (RFC 1950) inflater over another reader.
class ZlibReader final : public IReader {
  public:
    explicit ZlibReader(std::unique_ptr<IReader> source);
    ~ZlibReader() override;

    // Implementation of IReader
    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return std::nullopt; }

    // True once the zlib trailer has been consumed. A reader that returns 0
    // before this point hit a truncated stream.
    bool Finished() const { return eof_reached_; }

  private:
    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool eof_reached_ = false;
};

// One-shot zlib deflate with an explicit window size (9..15 bits).
Result ZlibCompress(std::span<const std::uint8_t> in,
                    int level,
                    int window_bits,
                    std::vector<std::uint8_t>& out);

} // namespace ngdp
