#pragma once

#include "io/io.hpp"

#include <algorithm>
#include <cstdint>
#include <span>

namespace ngdp {

// Non-owning reader over a byte range. The range must outlive the reader.
class SpanReader final : public IReader {
public:
    explicit SpanReader(std::span<const std::uint8_t> data) : data_(data) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size()) return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

private:
    std::span<const std::uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace ngdp
