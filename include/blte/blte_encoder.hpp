#pragma once

#include "blte/blte_types.hpp"
#include "crypto/key_store.hpp"
#include "util/content_key.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace ngdp::blte {

class BlteEncoder {
public:
    // Keys are needed for 'E' modes only.
    explicit BlteEncoder(const IKeyStore& keys);

    // Builds a container for `content` according to `spec`. A key name that
    // is missing from the key store fails with MissingDecryptionKey; a block
    // list that leaves input uncovered fails with InvalidArgument.
    Result Encode(std::span<const std::uint8_t> content,
                  const EncodingSpec& spec,
                  std::vector<std::uint8_t>& out) const;

private:
    Result EncodeChunk(std::span<const std::uint8_t> input,
                       const ChunkMode& mode,
                       std::uint32_t index,
                       std::vector<std::uint8_t>& out) const;

    const IKeyStore& keys_;
};

// EKey of an encoded container: MD5 of the header when a chunk table exists,
// otherwise MD5 of the whole container.
Result ComputeEKey(std::span<const std::uint8_t> encoded, EKey& out);

} // namespace ngdp::blte
