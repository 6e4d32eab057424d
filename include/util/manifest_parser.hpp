#pragma once

#include "util/manifest.hpp"

#include <expected>
#include <string>

namespace ngdp {

class ManifestParser {
  public:
    std::expected<Manifest, std::string> Parse(const std::string& json_input) const;
    std::expected<Manifest, std::string> ParseFile(const std::string& path) const;
};

} // namespace ngdp
