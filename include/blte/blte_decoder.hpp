#pragma once

#include "blte/blte_types.hpp"
#include "crypto/key_store.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace ngdp::blte {

enum class MissingKeyPolicy {
    // Stop with MissingDecryptionKey at the first chunk whose key is unknown.
    Fail,
    // Substitute zeros of the declared size and keep going; the overall status
    // is still MissingDecryptionKey so callers can tell the output is partial.
    ZeroFill,
};

struct DecodeOptions {
    MissingKeyPolicy missing_key = MissingKeyPolicy::Fail;
    // Nesting limit for 'F' chunks.
    int max_depth = 4;
};

// Parses magic, header size and chunk table from the front of `data`.
Result ParseHeader(std::span<const std::uint8_t> data, Header& out);

// Streaming decoder: pulls one chunk at a time from `source`, verifies its
// MD5, decodes it and hands the plaintext out through Read(). Memory use is
// bounded by the largest chunk.
class BlteReader final : public IReader {
public:
    BlteReader(std::unique_ptr<IReader> source,
               const IKeyStore& keys,
               DecodeOptions opt = {},
               int depth = 0);

    ssize_t Read(std::span<std::uint8_t> out) override;

    // Decoded size, known once the header has a chunk table with sizes.
    std::optional<std::uint64_t> TotalSize() const override;

    // Ok while decoding succeeds. After Read() returns -1 this holds the
    // failure; after a clean end of stream it may hold MissingDecryptionKey
    // when chunks were zero-filled.
    const Result& Status() const { return status_; }

    const std::vector<std::uint32_t>& MissingKeyChunks() const { return missing_key_chunks_; }

private:
    Result ReadHeader();
    Result LoadNextChunk();
    Result CheckTrailingData();

    std::unique_ptr<IReader> source_;
    const IKeyStore& keys_;
    DecodeOptions opt_;
    int depth_;

    bool header_read_ = false;
    bool finished_ = false;
    Header header_;
    std::size_t next_chunk_ = 0;

    std::vector<std::uint8_t> raw_;
    std::vector<std::uint8_t> plain_;
    std::size_t plain_pos_ = 0;

    Result status_;
    std::vector<std::uint32_t> missing_key_chunks_;
};

class BlteDecoder {
public:
    explicit BlteDecoder(const IKeyStore& keys, DecodeOptions opt = {});

    // Decodes a complete container held in memory. With ZeroFill a missing
    // key yields MissingDecryptionKey and a fully sized `out`.
    Result Decode(std::span<const std::uint8_t> encoded, std::vector<std::uint8_t>& out) const;

    // Structural and checksum validation without decoding any payload.
    Result VerifyChecksums(std::span<const std::uint8_t> encoded) const;

private:
    const IKeyStore& keys_;
    DecodeOptions opt_;
};

} // namespace ngdp::blte
