#include "util/config_json_utils.hpp"

#include "util/logger.hpp"

#include <fstream>
#include <limits>

namespace ngdp::config::detail {

namespace {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return false;
    auto v = it->get<long long>();
    if (v < 0)
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetIntIfPresent(const nlohmann::json& j, const char* key, int& out) {
    std::uint64_t v{};
    if (!GetU64IfPresent(j, key, v))
        return false;
    if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
        return false;
    out = static_cast<int>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
    return true;
}

bool GetStringArrayIfPresent(const nlohmann::json& j,
                             const char* key,
                             std::vector<std::string>& out,
                             std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string("'") + key + "' must be an array of strings";
        return false;
    }
    out.clear();
    for (const auto& v : *it) {
        if (!v.is_string()) {
            err = std::string("'") + key + "' must be an array of strings";
            return false;
        }
        out.push_back(v.get<std::string>());
    }
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, ClientConfig& cfg, std::string& err) {
    GetStringIfPresent(j, "install_dir", cfg.install_dir);
    if (cfg.install_dir.empty()) {
        err = "missing install_dir";
        return false;
    }

    if (!GetStringArrayIfPresent(j, "cdn_hosts", cfg.cdn_hosts, err))
        return false;
    if (cfg.cdn_hosts.empty()) {
        err = "cdn_hosts must list at least one host";
        return false;
    }
    GetStringIfPresent(j, "cdn_path", cfg.cdn_path);

    GetIntIfPresent(j, "workers", cfg.workers);
    GetIntIfPresent(j, "max_in_flight", cfg.max_in_flight);
    GetIntIfPresent(j, "max_attempts", cfg.max_attempts);
    if (cfg.workers < 1 || cfg.max_in_flight < 1 || cfg.max_attempts < 1) {
        err = "workers, max_in_flight and max_attempts must be positive";
        return false;
    }

    GetU64IfPresent(j, "initial_backoff_ms", cfg.initial_backoff_ms);
    GetU64IfPresent(j, "max_backoff_ms", cfg.max_backoff_ms);
    if (cfg.max_backoff_ms < cfg.initial_backoff_ms) {
        err = "max_backoff_ms is smaller than initial_backoff_ms";
        return false;
    }
    GetU64IfPresent(j, "connect_timeout_s", cfg.connect_timeout_s);
    GetU64IfPresent(j, "request_timeout_s", cfg.request_timeout_s);

    if (!GetStringArrayIfPresent(j, "tags", cfg.tags, err))
        return false;

    GetU64IfPresent(j, "max_data_file_size", cfg.max_data_file_size);
    if (cfg.max_data_file_size <= 30 || cfg.max_data_file_size > 0x3FFFFFFF) {
        err = "max_data_file_size must be in (30, 0x3FFFFFFF]";
        return false;
    }
    GetBoolIfPresent(j, "verify_on_read", cfg.verify_on_read);

    GetStringIfPresent(j, "key_file", cfg.key_file);
    GetStringIfPresent(j, "log_level", cfg.log_level);
    if (!ParseLogLevel(cfg.log_level)) {
        err = "unknown log_level '" + cfg.log_level + "'";
        return false;
    }
    GetStringIfPresent(j, "progress_file", cfg.progress_file);

    return true;
}

} // namespace ngdp::config::detail
