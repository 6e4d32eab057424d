#include "blte/blte_decoder.hpp"

#include "crypto/salsa20.hpp"
#include "io/span_reader.hpp"
#include "io/zlib_stream.hpp"
#include "util/byte_order.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>

namespace ngdp::blte {

namespace {

// Ceiling for chunks whose decoded size is not declared (no chunk table).
constexpr std::size_t kMaxUndeclaredChunk = std::size_t{1} << 30;

struct ChunkContext {
    const IKeyStore& keys;
    const DecodeOptions& opt;
    int depth;
    std::vector<std::uint32_t>& missing;
};

std::string ChunkLabel(std::uint32_t index) {
    return "chunk " + std::to_string(index);
}

Result DecodeChunk(std::span<const std::uint8_t> payload,
                   std::uint32_t index,
                   std::uint32_t expected,
                   const ChunkContext& ctx,
                   std::vector<std::uint8_t>& out);

Result CheckProduced(std::size_t produced, std::uint32_t expected, std::uint32_t index) {
    if (expected != 0 && produced != expected) {
        return Result::Fail(ErrorCode::ChunkSizeMismatch,
                            ChunkLabel(index) + ": decoded " + std::to_string(produced) +
                                " bytes, header declares " + std::to_string(expected));
    }
    return Result::Ok();
}

Result DecodeZlib(std::span<const std::uint8_t> data,
                  std::uint32_t index,
                  std::uint32_t expected,
                  std::vector<std::uint8_t>& out) {
    const std::size_t base = out.size();
    const std::size_t limit = expected != 0 ? expected : kMaxUndeclaredChunk;

    try {
        ZlibReader z(std::make_unique<SpanReader>(data));
        std::vector<std::uint8_t> buf(64 * 1024);
        while (true) {
            const ssize_t n = z.Read(buf);
            if (n < 0) {
                return Result::Fail(ErrorCode::DecompressFailed,
                                    ChunkLabel(index) + ": invalid zlib data");
            }
            if (n == 0) break;
            if (out.size() - base + static_cast<std::size_t>(n) > limit) {
                if (expected != 0) {
                    return Result::Fail(ErrorCode::ChunkSizeMismatch,
                                        ChunkLabel(index) + ": inflates past declared size " +
                                            std::to_string(expected));
                }
                return Result::Fail(ErrorCode::DecompressFailed,
                                    ChunkLabel(index) + ": undeclared chunk too large");
            }
            out.insert(out.end(), buf.begin(), buf.begin() + n);
        }
        if (!z.Finished()) {
            return Result::Fail(ErrorCode::DecompressFailed,
                                ChunkLabel(index) + ": truncated zlib stream");
        }
    } catch (const std::runtime_error& e) {
        return Result::Fail(ErrorCode::DecompressFailed, ChunkLabel(index) + ": " + e.what());
    }

    return CheckProduced(out.size() - base, expected, index);
}

Result DecodeEncrypted(std::span<const std::uint8_t> data,
                       std::uint32_t index,
                       std::uint32_t expected,
                       const ChunkContext& ctx,
                       std::vector<std::uint8_t>& out) {
    // key_name_len, key_name[8], iv_len, iv[4|8], cipher
    if (data.size() < 1 || data[0] != 8) {
        return Result::Fail(ErrorCode::MalformedHeader,
                            ChunkLabel(index) + ": unsupported key name length");
    }
    if (data.size() < 10) {
        return Result::Fail(ErrorCode::MalformedHeader,
                            ChunkLabel(index) + ": truncated encryption header");
    }
    std::array<std::uint8_t, 8> key_name{};
    std::memcpy(key_name.data(), data.data() + 1, key_name.size());

    const std::size_t iv_len = data[9];
    if (iv_len != 4 && iv_len != 8) {
        return Result::Fail(ErrorCode::MalformedHeader,
                            ChunkLabel(index) + ": unsupported iv length " + std::to_string(iv_len));
    }
    if (data.size() < 10 + iv_len + 1) {
        return Result::Fail(ErrorCode::MalformedHeader,
                            ChunkLabel(index) + ": truncated encryption header");
    }
    Salsa20::Nonce nonce{};
    std::memcpy(nonce.data(), data.data() + 10, iv_len);

    const std::uint8_t cipher = data[10 + iv_len];
    if (cipher != kCipherSalsa20) {
        return Result::Fail(ErrorCode::UnknownEncodingMode,
                            ChunkLabel(index) + ": unsupported cipher '" +
                                std::string(1, static_cast<char>(cipher)) + "'");
    }

    const std::uint64_t key_id = KeyId(key_name);
    auto key = ctx.keys.Lookup(key_id);
    if (!key) {
        char name[24];
        std::snprintf(name, sizeof(name), "%016llx", static_cast<unsigned long long>(key_id));
        if (ctx.opt.missing_key == MissingKeyPolicy::ZeroFill && expected != 0) {
            LogDebug("%s: key %s unknown, zero-filling %u bytes",
                     ChunkLabel(index).c_str(), name, expected);
            out.resize(out.size() + expected, 0);
            ctx.missing.push_back(index);
            return Result::Ok();
        }
        return Result::Fail(ErrorCode::MissingDecryptionKey,
                            ChunkLabel(index) + ": decryption key " + name + " not available");
    }

    for (int i = 0; i < 4; ++i) {
        nonce[i] ^= static_cast<std::uint8_t>((index >> (8 * i)) & 0xff);
    }

    std::vector<std::uint8_t> plain(data.begin() + 11 + static_cast<std::ptrdiff_t>(iv_len),
                                    data.end());
    Salsa20 salsa(*key, nonce);
    salsa.Apply(plain);

    return DecodeChunk(plain, index, expected, ctx, out);
}

Result DecodeNested(std::span<const std::uint8_t> data,
                    std::uint32_t index,
                    std::uint32_t expected,
                    const ChunkContext& ctx,
                    std::vector<std::uint8_t>& out) {
    if (ctx.depth + 1 > ctx.opt.max_depth) {
        return Result::Fail(ErrorCode::MalformedHeader,
                            ChunkLabel(index) + ": nested containers deeper than " +
                                std::to_string(ctx.opt.max_depth));
    }

    const std::size_t base = out.size();
    BlteReader inner(std::make_unique<SpanReader>(data), ctx.keys, ctx.opt, ctx.depth + 1);
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = inner.Read(buf);
        if (n < 0) {
            const Result& st = inner.Status();
            return Result::Fail(st.code, ChunkLabel(index) + " (nested): " + st.msg);
        }
        if (n == 0) break;
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    if (!inner.MissingKeyChunks().empty()) {
        ctx.missing.push_back(index);
    }
    return CheckProduced(out.size() - base, expected, index);
}

Result DecodeChunk(std::span<const std::uint8_t> payload,
                   std::uint32_t index,
                   std::uint32_t expected,
                   const ChunkContext& ctx,
                   std::vector<std::uint8_t>& out) {
    if (payload.empty()) {
        return Result::Fail(ErrorCode::MalformedHeader, ChunkLabel(index) + ": empty payload");
    }

    const auto data = payload.subspan(1);
    switch (static_cast<ModeTag>(payload[0])) {
        case ModeTag::Raw:
            out.insert(out.end(), data.begin(), data.end());
            return CheckProduced(data.size(), expected, index);
        case ModeTag::Zlib:
            return DecodeZlib(data, index, expected, out);
        case ModeTag::Encrypted:
            return DecodeEncrypted(data, index, expected, ctx, out);
        case ModeTag::Recursive:
            return DecodeNested(data, index, expected, ctx, out);
    }

    char tag[8];
    std::snprintf(tag, sizeof(tag), "0x%02x", payload[0]);
    return Result::Fail(ErrorCode::UnknownEncodingMode,
                        ChunkLabel(index) + ": unknown encoding mode " + tag);
}

} // namespace

std::uint64_t KeyId(const std::array<std::uint8_t, 8>& key_name) {
    return ReadLe64(key_name.data());
}

Result ParseHeader(std::span<const std::uint8_t> data, Header& out) {
    out = Header{};
    if (data.size() < kPrefixSize) {
        return Result::Fail(ErrorCode::MalformedHeader, "truncated BLTE header");
    }
    if (std::memcmp(data.data(), kMagic, sizeof(kMagic)) != 0) {
        return Result::Fail(ErrorCode::MalformedHeader, "bad BLTE magic");
    }

    out.header_size = ReadBe32(data.data() + 4);
    if (out.header_size == 0) {
        return Result::Ok();
    }

    if (data.size() < kTableHeaderSize) {
        return Result::Fail(ErrorCode::MalformedHeader, "truncated BLTE chunk table");
    }
    if (data[8] != kTableFlags) {
        return Result::Fail(ErrorCode::MalformedHeader,
                            "unsupported chunk table flags " + std::to_string(data[8]));
    }
    const std::uint32_t count = ReadBe24(data.data() + 9);
    if (count == 0) {
        return Result::Fail(ErrorCode::MalformedHeader, "chunk table with zero chunks");
    }
    const std::uint64_t table_end = kTableHeaderSize + std::uint64_t{count} * kChunkInfoSize;
    if (table_end != out.header_size) {
        return Result::Fail(ErrorCode::MalformedHeader,
                            "header size " + std::to_string(out.header_size) +
                                " does not match " + std::to_string(count) + " chunks");
    }
    if (data.size() < table_end) {
        return Result::Fail(ErrorCode::MalformedHeader, "truncated BLTE chunk table");
    }

    out.chunks.resize(count);
    const std::uint8_t* p = data.data() + kTableHeaderSize;
    for (auto& ci : out.chunks) {
        ci.compressed_size = ReadBe32(p);
        ci.decompressed_size = ReadBe32(p + 4);
        std::memcpy(ci.checksum.data(), p + 8, ci.checksum.size());
        if (ci.compressed_size == 0) {
            return Result::Fail(ErrorCode::MalformedHeader, "chunk with zero encoded size");
        }
        p += kChunkInfoSize;
    }
    return Result::Ok();
}

BlteReader::BlteReader(std::unique_ptr<IReader> source,
                       const IKeyStore& keys,
                       DecodeOptions opt,
                       int depth)
    : source_(std::move(source)), keys_(keys), opt_(opt), depth_(depth) {}

std::optional<std::uint64_t> BlteReader::TotalSize() const {
    if (!header_read_ || !header_.HasTable()) return std::nullopt;
    std::uint64_t total = 0;
    for (const auto& ci : header_.chunks) {
        if (ci.decompressed_size == 0) return std::nullopt;
        total += ci.decompressed_size;
    }
    return total;
}

Result BlteReader::ReadHeader() {
    std::vector<std::uint8_t> buf(kPrefixSize);
    ssize_t n = ReadFull(*source_, buf);
    if (n < 0) return Result::Fail(ErrorCode::Io, "read failed in BLTE header");
    if (static_cast<std::size_t>(n) < kPrefixSize) {
        return Result::Fail(ErrorCode::MalformedHeader, "truncated BLTE header");
    }

    const std::uint32_t header_size = ReadBe32(buf.data() + 4);
    if (header_size != 0) {
        if (header_size < kTableHeaderSize) {
            return Result::Fail(ErrorCode::MalformedHeader,
                                "header size " + std::to_string(header_size) + " too small");
        }
        if (header_size > kTableHeaderSize + std::uint64_t{kMaxChunkCount} * kChunkInfoSize) {
            return Result::Fail(ErrorCode::MalformedHeader,
                                "header size " + std::to_string(header_size) + " too large");
        }
        buf.resize(header_size);
        const auto rest = std::span<std::uint8_t>(buf).subspan(kPrefixSize);
        n = ReadFull(*source_, rest);
        if (n < 0) return Result::Fail(ErrorCode::Io, "read failed in BLTE chunk table");
        buf.resize(kPrefixSize + static_cast<std::size_t>(n));
    }

    auto r = ParseHeader(buf, header_);
    if (!r.ok) return r;

    // With a known container size, the declared chunk sizes must account for
    // every byte before any payload is trusted.
    if (auto total = source_->TotalSize()) {
        if (header_.HasTable()) {
            std::uint64_t sum = header_.header_size;
            for (const auto& ci : header_.chunks) sum += ci.compressed_size;
            if (sum != *total) {
                return Result::Fail(ErrorCode::ChunkSizeMismatch,
                                    "chunk table covers " + std::to_string(sum) +
                                        " bytes, container has " + std::to_string(*total));
            }
        } else if (*total <= kPrefixSize) {
            return Result::Fail(ErrorCode::MalformedHeader, "container without payload");
        }
    }
    return Result::Ok();
}

Result BlteReader::LoadNextChunk() {
    const auto index = static_cast<std::uint32_t>(next_chunk_);
    std::uint32_t expected = 0;

    if (header_.HasTable()) {
        const ChunkInfo& ci = header_.chunks[next_chunk_];
        raw_.resize(ci.compressed_size);
        const ssize_t n = ReadFull(*source_, raw_);
        if (n < 0) return Result::Fail(ErrorCode::Io, ChunkLabel(index) + ": read failed");
        if (static_cast<std::size_t>(n) != raw_.size()) {
            return Result::Fail(ErrorCode::ChunkSizeMismatch,
                                ChunkLabel(index) + ": truncated, got " + std::to_string(n) +
                                    " of " + std::to_string(raw_.size()) + " bytes");
        }
        if (Md5(raw_) != ci.checksum) {
            return Result::Fail(ErrorCode::ChecksumMismatch,
                                ChunkLabel(index) + ": MD5 does not match chunk table");
        }
        expected = ci.decompressed_size;
    } else {
        // Single implicit chunk: everything after the 8-byte prefix.
        raw_.clear();
        std::vector<std::uint8_t> buf(64 * 1024);
        while (true) {
            const ssize_t n = source_->Read(buf);
            if (n < 0) return Result::Fail(ErrorCode::Io, ChunkLabel(index) + ": read failed");
            if (n == 0) break;
            if (raw_.size() + static_cast<std::size_t>(n) > kMaxUndeclaredChunk) {
                return Result::Fail(ErrorCode::MalformedHeader,
                                    "container without chunk table is too large");
            }
            raw_.insert(raw_.end(), buf.begin(), buf.begin() + n);
        }
        if (raw_.empty()) {
            return Result::Fail(ErrorCode::MalformedHeader, "container without payload");
        }
    }

    plain_.clear();
    plain_pos_ = 0;
    ChunkContext ctx{keys_, opt_, depth_, missing_key_chunks_};
    auto r = DecodeChunk(raw_, index, expected, ctx, plain_);
    ++next_chunk_;
    return r;
}

Result BlteReader::CheckTrailingData() {
    if (!header_.HasTable()) return Result::Ok();
    std::uint8_t probe = 0;
    const ssize_t n = source_->Read(std::span<std::uint8_t>(&probe, 1));
    if (n < 0) return Result::Fail(ErrorCode::Io, "read failed after last chunk");
    if (n > 0) {
        return Result::Fail(ErrorCode::ChunkSizeMismatch, "trailing data after last chunk");
    }
    return Result::Ok();
}

ssize_t BlteReader::Read(std::span<std::uint8_t> out) {
    auto fail = [this](Result r) -> ssize_t {
        status_ = std::move(r);
        finished_ = true;
        return -1;
    };

    if (!status_.ok && status_.code != ErrorCode::MissingDecryptionKey) return -1;

    if (!header_read_) {
        auto r = ReadHeader();
        if (!r.ok) return fail(std::move(r));
        header_read_ = true;
    }

    const std::size_t chunk_count = header_.HasTable() ? header_.chunks.size() : 1;
    std::size_t produced = 0;
    while (produced < out.size()) {
        if (plain_pos_ < plain_.size()) {
            const std::size_t n = std::min(out.size() - produced, plain_.size() - plain_pos_);
            std::memcpy(out.data() + produced, plain_.data() + plain_pos_, n);
            produced += n;
            plain_pos_ += n;
            continue;
        }
        if (finished_) break;
        if (next_chunk_ >= chunk_count) {
            auto r = CheckTrailingData();
            if (!r.ok) return fail(std::move(r));
            finished_ = true;
            if (!missing_key_chunks_.empty()) {
                status_ = Result::Fail(ErrorCode::MissingDecryptionKey,
                                       std::to_string(missing_key_chunks_.size()) +
                                           " chunk(s) zero-filled for missing keys");
            }
            break;
        }
        auto r = LoadNextChunk();
        if (!r.ok) return fail(std::move(r));
    }
    return static_cast<ssize_t>(produced);
}

BlteDecoder::BlteDecoder(const IKeyStore& keys, DecodeOptions opt) : keys_(keys), opt_(opt) {}

Result BlteDecoder::Decode(std::span<const std::uint8_t> encoded,
                           std::vector<std::uint8_t>& out) const {
    out.clear();
    BlteReader reader(std::make_unique<SpanReader>(encoded), keys_, opt_);
    std::vector<std::uint8_t> buf(256 * 1024);
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n < 0) return reader.Status();
        if (n == 0) break;
        if (out.empty()) {
            if (auto total = reader.TotalSize()) out.reserve(static_cast<std::size_t>(*total));
        }
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    return reader.Status();
}

Result BlteDecoder::VerifyChecksums(std::span<const std::uint8_t> encoded) const {
    Header header;
    auto r = ParseHeader(encoded, header);
    if (!r.ok) return r;

    if (!header.HasTable()) {
        if (encoded.size() <= kPrefixSize) {
            return Result::Fail(ErrorCode::MalformedHeader, "container without payload");
        }
        return Result::Ok();
    }

    std::uint64_t sum = header.header_size;
    for (const auto& ci : header.chunks) sum += ci.compressed_size;
    if (sum != encoded.size()) {
        return Result::Fail(ErrorCode::ChunkSizeMismatch,
                            "chunk table covers " + std::to_string(sum) +
                                " bytes, container has " + std::to_string(encoded.size()));
    }

    std::size_t off = header.header_size;
    for (std::size_t i = 0; i < header.chunks.size(); ++i) {
        const auto& ci = header.chunks[i];
        if (Md5(encoded.subspan(off, ci.compressed_size)) != ci.checksum) {
            return Result::Fail(ErrorCode::ChecksumMismatch,
                                ChunkLabel(static_cast<std::uint32_t>(i)) +
                                    ": MD5 does not match chunk table");
        }
        off += ci.compressed_size;
    }
    return Result::Ok();
}

} // namespace ngdp::blte
