#include "crypto/key_store.hpp"

#include "util/hex.hpp"
#include "util/logger.hpp"

#include <fstream>
#include <mutex>
#include <sstream>

namespace ngdp {

namespace {

bool ParseKeyName(std::string_view hex, std::uint64_t& out) {
    if (hex.size() != 16) return false;
    std::array<std::uint8_t, 8> raw{};
    if (!HexDecodeInto(hex, raw)) return false;
    out = 0;
    for (auto b : raw) {
        out = (out << 8) | b;
    }
    return true;
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

std::optional<EncryptionKey> MemoryKeyStore::Lookup(std::uint64_t key_id) const {
    std::shared_lock lk(mu_);
    auto it = keys_.find(key_id);
    if (it == keys_.end()) return std::nullopt;
    return it->second;
}

void MemoryKeyStore::Add(std::uint64_t key_id, const EncryptionKey& key) {
    std::unique_lock lk(mu_);
    keys_[key_id] = key;
}

std::size_t MemoryKeyStore::Size() const {
    std::shared_lock lk(mu_);
    return keys_.size();
}

Result MemoryKeyStore::LoadFromString(std::string_view text) {
    size_t line_no = 0;
    size_t loaded = 0;
    while (!text.empty()) {
        const auto nl = text.find('\n');
        std::string_view line = Trim(text.substr(0, nl));
        text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
        ++line_no;

        if (line.empty() || line.front() == '#') continue;

        const auto sep = line.find_first_of(" \t");
        if (sep == std::string_view::npos) {
            return Result::Fail(ErrorCode::InvalidArgument,
                                "key line " + std::to_string(line_no) + ": missing key");
        }
        const std::string_view name = line.substr(0, sep);
        std::string_view rest = Trim(line.substr(sep));
        const std::string_view key_hex = rest.substr(0, rest.find_first_of(" \t"));

        std::uint64_t id = 0;
        EncryptionKey key{};
        if (!ParseKeyName(name, id) || !HexDecodeInto(key_hex, key)) {
            return Result::Fail(ErrorCode::InvalidArgument,
                                "key line " + std::to_string(line_no) + ": malformed hex");
        }
        Add(id, key);
        ++loaded;
    }
    LogDebug("loaded %zu decryption keys", loaded);
    return Result::Ok();
}

Result MemoryKeyStore::LoadFromFile(const std::string& path) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorCode::NotFound, "cannot open key file: " + path);
    }
    std::stringstream ss;
    ss << is.rdbuf();
    auto r = LoadFromString(ss.str());
    if (!r.ok) {
        return Result::Fail(r.code, path + ": " + r.msg);
    }
    return Result::Ok();
}

} // namespace ngdp
