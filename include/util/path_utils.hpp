#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace ngdp {

inline std::string JoinPath(std::string_view a, std::string_view b) {
    if (a.empty()) return std::string(b);
    std::string out(a);
    if (out.back() != '/') out.push_back('/');
    while (!b.empty() && b.front() == '/') b.remove_prefix(1);
    out.append(b);
    return out;
}

inline std::string ParentDir(const std::string& path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

inline std::string BaseName(const std::string& path) {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

// "{cdn_path}/{kind}/ab/cd/abcd..." as laid out on Blizzard CDNs.
inline std::string CdnHashPath(std::string_view cdn_path,
                               std::string_view kind,
                               std::string_view hex,
                               std::string_view suffix = {}) {
    std::string out;
    if (!cdn_path.empty()) {
        if (cdn_path.front() != '/') out.push_back('/');
        out.append(cdn_path);
        if (out.back() != '/') out.push_back('/');
    } else {
        out.push_back('/');
    }
    out.append(kind);
    out.push_back('/');
    out.append(hex.substr(0, 2));
    out.push_back('/');
    out.append(hex.substr(2, 2));
    out.push_back('/');
    out.append(hex);
    out.append(suffix);
    return out;
}

inline std::string DataFileName(std::uint32_t archive_id) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "data.%03u", archive_id);
    return buf;
}

inline std::string IndexShardName(std::uint8_t bucket, std::uint32_t version) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02x%08x.idx", bucket, version);
    return buf;
}

struct ShardName {
    std::uint8_t bucket = 0;
    std::uint32_t version = 0;
};

// Inverse of IndexShardName; nullopt for anything that is not a shard file.
inline std::optional<ShardName> ParseIndexShardName(std::string_view name) {
    if (name.size() != 14 || name.substr(10) != ".idx") return std::nullopt;
    std::uint32_t vals[2] = {0, 0};
    const std::string_view parts[2] = {name.substr(0, 2), name.substr(2, 8)};
    for (int p = 0; p < 2; ++p) {
        for (char c : parts[p]) {
            int d;
            if (c >= '0' && c <= '9') d = c - '0';
            else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
            else return std::nullopt;
            vals[p] = (vals[p] << 4) | static_cast<std::uint32_t>(d);
        }
    }
    if (vals[0] > 0xff) return std::nullopt;
    return ShardName{static_cast<std::uint8_t>(vals[0]), vals[1]};
}

// "data.NNN" -> NNN
inline std::optional<std::uint32_t> ParseDataFileName(std::string_view name) {
    if (name.size() < 6 || name.substr(0, 5) != "data.") return std::nullopt;
    std::uint32_t v = 0;
    for (char c : name.substr(5)) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<std::uint32_t>(c - '0');
        if (v > 0x3ff) return std::nullopt;
    }
    return v;
}

} // namespace ngdp
