#include "util/config_parser.hpp"

#include "install/progress_store.hpp"
#include "util/config_json_utils.hpp"
#include "util/path_utils.hpp"

namespace ngdp::config {

void ClientConfig::Reset() {
    *this = ClientConfig{};
}

Result ClientConfig::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorCode::InvalidArgument, "config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(ErrorCode::InvalidArgument, "config: " + err + " in " + path);
    }

    return Result::Ok();
}

std::string ClientConfig::DataDir() const {
    return JoinPath(JoinPath(install_dir, "Data"), "data");
}

std::string ClientConfig::ProgressRecordPath() const {
    return JoinPath(install_dir, kProgressFileName);
}

} // namespace ngdp::config
