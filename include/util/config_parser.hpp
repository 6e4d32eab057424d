#pragma once
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ngdp::config {

// Client settings read from a JSON object file. Every key is optional except
// install_dir and cdn_hosts.
class ClientConfig {
public:
    std::string install_dir;
    std::vector<std::string> cdn_hosts;
    std::string cdn_path;

    int workers = 4;
    int max_in_flight = 8;
    int max_attempts = 5;
    std::uint64_t initial_backoff_ms = 250;
    std::uint64_t max_backoff_ms = 8000;
    std::uint64_t connect_timeout_s = 15;
    std::uint64_t request_timeout_s = 300;

    std::vector<std::string> tags;
    std::uint64_t max_data_file_size = 0x3FFFFFFF;
    bool verify_on_read = false;

    std::string key_file;
    std::string log_level = "info";
    // JSON status document for external monitors; empty disables it.
    std::string progress_file;

    Result LoadFile(const std::string &path);

    void Reset();

    // <install_dir>/Data/data
    std::string DataDir() const;
    // <install_dir>/.ngdp-install-progress
    std::string ProgressRecordPath() const;
};

} // namespace ngdp::config
