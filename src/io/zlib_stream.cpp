#include "io/zlib_stream.hpp"

#include <stdexcept>
#include <string>

namespace ngdp {

ZlibReader::ZlibReader(std::unique_ptr<IReader> source)
    : source_(std::move(source)), in_buffer_(16384) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // Plain zlib wrapper, window size taken from the stream header.
    if (inflateInit2(&strm_, MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }
}

ZlibReader::~ZlibReader() {
    inflateEnd(&strm_);
}

ssize_t ZlibReader::Read(std::span<std::uint8_t> out) {
    if (eof_reached_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0) {
            ssize_t n = source_->Read(in_buffer_);
            if (n < 0) return -1;
            if (n == 0) {
                // Source exhausted before Z_STREAM_END: truncated.
                break;
            }
            strm_.avail_in = static_cast<uInt>(n);
            strm_.next_in = in_buffer_.data();
        }

        int ret = inflate(&strm_, Z_NO_FLUSH);

        if (ret == Z_STREAM_END) {
            eof_reached_ = true;
            break;
        }

        // Z_BUF_ERROR only means more input or output space is needed.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return -1;
        }

        if (ret == Z_BUF_ERROR && strm_.avail_in == 0) {
            break;
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

Result ZlibCompress(std::span<const std::uint8_t> in,
                    int level,
                    int window_bits,
                    std::vector<std::uint8_t>& out) {
    if (window_bits < 9 || window_bits > 15) {
        return Result::Fail(ErrorCode::InvalidArgument,
                            "zlib window bits out of range: " + std::to_string(window_bits));
    }
    if (level < 0 || level > 9) {
        return Result::Fail(ErrorCode::InvalidArgument,
                            "zlib level out of range: " + std::to_string(level));
    }

    z_stream strm{};
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    if (deflateInit2(&strm, level, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return Result::Fail(ErrorCode::Io, "Failed to initialize zlib deflate");
    }

    const size_t base = out.size();
    out.resize(base + deflateBound(&strm, static_cast<uLong>(in.size())));

    strm.next_in = const_cast<Bytef*>(in.data());
    strm.avail_in = static_cast<uInt>(in.size());
    strm.next_out = out.data() + base;
    strm.avail_out = static_cast<uInt>(out.size() - base);

    const int ret = deflate(&strm, Z_FINISH);
    const size_t produced = out.size() - base - strm.avail_out;
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        out.resize(base);
        return Result::Fail(ErrorCode::Io, "zlib deflate failed: " + std::to_string(ret));
    }
    out.resize(base + produced);
    return Result::Ok();
}

} // namespace ngdp
