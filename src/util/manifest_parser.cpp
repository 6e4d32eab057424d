#include "util/manifest_parser.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace ngdp {

using json = nlohmann::json;

namespace {

template <typename Key>
std::expected<Key, std::string> ParseKey(const json& item, const char* field, std::size_t index) {
    const std::string where = "entries[" + std::to_string(index) + "]." + field;
    auto it = item.find(field);
    if (it == item.end() || !it->is_string()) {
        return std::unexpected(where + " must be a hex string");
    }
    auto key = Key::FromHex(it->template get<std::string>());
    if (!key) {
        return std::unexpected(where + " is not 32 hex digits");
    }
    return *key;
}

std::expected<ManifestEntry, std::string> ParseEntry(const json& item, std::size_t index) {
    if (!item.is_object()) {
        return std::unexpected("entries[" + std::to_string(index) + "] must be an object");
    }

    ManifestEntry e;
    auto ekey = ParseKey<EKey>(item, "ekey", index);
    if (!ekey)
        return std::unexpected(ekey.error());
    e.ekey = *ekey;

    if (item.contains("ckey") && !item["ckey"].is_null()) {
        auto ckey = ParseKey<CKey>(item, "ckey", index);
        if (!ckey)
            return std::unexpected(ckey.error());
        e.ckey = *ckey;
    }

    e.size = item.value("size", 0ULL);
    e.name = item.value("name", "");
    e.tags = item.value("tags", std::vector<std::string>{});

    if (item.contains("archive") && !item["archive"].is_null()) {
        const json& a = item["archive"];
        if (!a.is_object()) {
            return std::unexpected("entries[" + std::to_string(index) + "].archive must be an object");
        }
        auto archive = ParseKey<EKey>(a, "key", index);
        if (!archive)
            return std::unexpected(archive.error());
        ArchiveSlice slice;
        slice.archive = *archive;
        slice.offset = a.value("offset", 0ULL);
        slice.size = a.value("size", 0ULL);
        if (slice.size == 0) {
            return std::unexpected("entries[" + std::to_string(index) + "].archive.size must be positive");
        }
        e.archive = slice;
    }
    return e;
}

} // namespace

std::expected<Manifest, std::string> ManifestParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        Manifest m;
        m.version = j.value("version", "");
        if (m.version.empty()) {
            return std::unexpected("manifest has no version");
        }

        if (!j.contains("entries") || !j["entries"].is_array()) {
            return std::unexpected("'entries' must be an array");
        }
        const json& entries = j["entries"];
        m.entries.reserve(entries.size());
        for (std::size_t i = 0; i < entries.size(); ++i) {
            auto e = ParseEntry(entries[i], i);
            if (!e)
                return std::unexpected(e.error());
            m.entries.push_back(std::move(*e));
        }
        return m;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::expected<Manifest, std::string> ManifestParser::ParseFile(const std::string& path) const {
    std::ifstream is(path);
    if (!is.good()) {
        return std::unexpected("cannot open " + path);
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    return Parse(ss.str());
}

} // namespace ngdp
