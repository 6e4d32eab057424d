#include "blte/blte_encoder.hpp"

#include "blte/blte_decoder.hpp"
#include "crypto/salsa20.hpp"
#include "io/zlib_stream.hpp"
#include "util/byte_order.hpp"
#include "util/hex.hpp"

#include <algorithm>
#include <cstring>
#include <string>

namespace ngdp::blte {

namespace {

// Window size for "mpq" zlib, by chunk input length.
int MpqWindowBits(std::size_t len) {
    if (len <= 0x200) return 9;
    if (len <= 0x400) return 10;
    if (len <= 0x800) return 11;
    if (len <= 0x1000) return 12;
    if (len <= 0x2000) return 13;
    if (len <= 0x4000) return 14;
    return 15;
}

struct PendingChunk {
    std::span<const std::uint8_t> input;
    const ChunkMode* mode;
};

// Splits `content` into chunks following the block list. Blocks with a count
// stop early once the input runs out, so the last chunk may be short.
Result SplitBlocks(std::span<const std::uint8_t> content,
                   const std::vector<BlockSpec>& blocks,
                   std::vector<PendingChunk>& out) {
    std::size_t pos = 0;
    for (const auto& block : blocks) {
        if (block.size == 0) {
            if (block.count) {
                return Result::Fail(ErrorCode::InvalidArgument, "block of size 0 with a count");
            }
            out.push_back({content.subspan(pos), &block.mode});
            pos = content.size();
            continue;
        }
        if (block.count) {
            for (std::uint64_t i = 0; i < *block.count && pos < content.size(); ++i) {
                const std::size_t n =
                    static_cast<std::size_t>(std::min<std::uint64_t>(block.size, content.size() - pos));
                out.push_back({content.subspan(pos, n), &block.mode});
                pos += n;
            }
            continue;
        }
        while (pos < content.size()) {
            const std::size_t n =
                static_cast<std::size_t>(std::min<std::uint64_t>(block.size, content.size() - pos));
            out.push_back({content.subspan(pos, n), &block.mode});
            pos += n;
        }
    }
    if (pos != content.size()) {
        return Result::Fail(ErrorCode::InvalidArgument,
                            "encoding spec leaves " + std::to_string(content.size() - pos) +
                                " bytes uncovered");
    }
    return Result::Ok();
}

} // namespace

BlteEncoder::BlteEncoder(const IKeyStore& keys) : keys_(keys) {}

Result BlteEncoder::EncodeChunk(std::span<const std::uint8_t> input,
                                const ChunkMode& mode,
                                std::uint32_t index,
                                std::vector<std::uint8_t>& out) const {
    if (std::holds_alternative<RawMode>(mode.value)) {
        out.push_back(static_cast<std::uint8_t>(ModeTag::Raw));
        out.insert(out.end(), input.begin(), input.end());
        return Result::Ok();
    }

    if (const auto* z = std::get_if<ZlibMode>(&mode.value)) {
        out.push_back(static_cast<std::uint8_t>(ModeTag::Zlib));
        const int bits = z->window_bits == 0 ? MpqWindowBits(input.size()) : z->window_bits;
        return ZlibCompress(input, z->level, bits, out);
    }

    if (const auto* e = std::get_if<EncryptedMode>(&mode.value)) {
        const std::uint64_t key_id = KeyId(e->key_name);
        auto key = keys_.Lookup(key_id);
        if (!key) {
            return Result::Fail(ErrorCode::MissingDecryptionKey,
                                "no encryption key for key name " + HexEncode(e->key_name));
        }
        if (!e->inner) {
            return Result::Fail(ErrorCode::InvalidArgument, "encrypted mode without inner mode");
        }

        std::vector<std::uint8_t> inner;
        auto r = EncodeChunk(input, *e->inner, index, inner);
        if (!r.ok) return r;

        Salsa20::Nonce nonce{};
        std::memcpy(nonce.data(), e->iv.data(), e->iv.size());
        for (int i = 0; i < 4; ++i) {
            nonce[i] ^= static_cast<std::uint8_t>((index >> (8 * i)) & 0xff);
        }
        Salsa20 salsa(*key, nonce);
        salsa.Apply(inner);

        out.push_back(static_cast<std::uint8_t>(ModeTag::Encrypted));
        out.push_back(static_cast<std::uint8_t>(e->key_name.size()));
        out.insert(out.end(), e->key_name.begin(), e->key_name.end());
        out.push_back(static_cast<std::uint8_t>(e->iv.size()));
        out.insert(out.end(), e->iv.begin(), e->iv.end());
        out.push_back(kCipherSalsa20);
        out.insert(out.end(), inner.begin(), inner.end());
        return Result::Ok();
    }

    const auto& rec = std::get<RecursiveMode>(mode.value);
    if (!rec.nested) {
        return Result::Fail(ErrorCode::InvalidArgument, "recursive mode without nested spec");
    }
    std::vector<std::uint8_t> nested;
    auto r = Encode(input, *rec.nested, nested);
    if (!r.ok) return r;
    out.push_back(static_cast<std::uint8_t>(ModeTag::Recursive));
    out.insert(out.end(), nested.begin(), nested.end());
    return Result::Ok();
}

Result BlteEncoder::Encode(std::span<const std::uint8_t> content,
                           const EncodingSpec& spec,
                           std::vector<std::uint8_t>& out) const {
    out.clear();

    if (!spec.Chunked()) {
        out.resize(kPrefixSize);
        std::memcpy(out.data(), kMagic, sizeof(kMagic));
        WriteBe32(out.data() + 4, 0);
        return EncodeChunk(content, spec.mode, 0, out);
    }

    std::vector<PendingChunk> pending;
    auto r = SplitBlocks(content, spec.blocks, pending);
    if (!r.ok) return r;
    if (pending.empty()) {
        // Empty input still needs one chunk to describe.
        pending.push_back({content, &spec.blocks.front().mode});
    }
    if (pending.size() > kMaxChunkCount) {
        return Result::Fail(ErrorCode::InvalidArgument,
                            "too many chunks: " + std::to_string(pending.size()));
    }

    const std::size_t count = pending.size();
    const std::size_t header_size = kTableHeaderSize + count * kChunkInfoSize;
    out.resize(header_size);
    std::memcpy(out.data(), kMagic, sizeof(kMagic));
    WriteBe32(out.data() + 4, static_cast<std::uint32_t>(header_size));
    out[8] = kTableFlags;
    WriteBe24(out.data() + 9, static_cast<std::uint32_t>(count));

    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t start = out.size();
        r = EncodeChunk(pending[i].input, *pending[i].mode, static_cast<std::uint32_t>(i), out);
        if (!r.ok) return r;

        const auto encoded = std::span<const std::uint8_t>(out).subspan(start);
        if (encoded.size() > 0xFFFFFFFFu) {
            return Result::Fail(ErrorCode::InvalidArgument, "chunk exceeds 4 GiB encoded");
        }
        const Md5Digest digest = Md5(encoded);

        std::uint8_t* info = out.data() + kTableHeaderSize + i * kChunkInfoSize;
        WriteBe32(info, static_cast<std::uint32_t>(encoded.size()));
        WriteBe32(info + 4, static_cast<std::uint32_t>(pending[i].input.size()));
        std::memcpy(info + 8, digest.data(), digest.size());
    }
    return Result::Ok();
}

Result ComputeEKey(std::span<const std::uint8_t> encoded, EKey& out) {
    Header header;
    auto r = ParseHeader(encoded, header);
    if (!r.ok) return r;
    const auto covered = header.HasTable() ? encoded.first(header.header_size) : encoded;
    out = EKey(Md5(covered));
    return Result::Ok();
}

} // namespace ngdp::blte
