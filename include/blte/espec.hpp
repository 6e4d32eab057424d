#pragma once

#include "blte/blte_types.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace ngdp::blte {

// Parses the textual encoding spec used by NGDP encoding manifests:
//   n                      raw
//   z | z:6 | z:{6,12}     zlib with level / window bits
//   z:{9,mpq}              zlib, window picked from chunk size
//   e:{KEYNAME,IV,mode}    Salsa20 around an inner mode (hex key name and IV)
//   f:{spec}               nested BLTE container
//   b:{256K*4=z,*=n}       chunked container; sizes take K and M suffixes
std::expected<EncodingSpec, std::string> ParseEspec(std::string_view text);

std::string FormatEspec(const EncodingSpec& spec);
std::string FormatChunkMode(const ChunkMode& mode);

} // namespace ngdp::blte
