#include "install/progress_sinks.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <string>

namespace ngdp {

namespace {
std::atomic_bool g_progress_line_active{false};

int Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 0;
    const auto pct = static_cast<int>((done * 100ULL) / total);
    return pct > 100 ? 100 : pct;
}
} // namespace

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::OnProgress(const ProgressEvent& e) {
    nlohmann::json j = {
        {"key", std::string(e.key)},
        {"keys_done", e.keys_done},
        {"keys_failed", e.keys_failed},
        {"keys_total", e.keys_total},
        {"bytes_done", e.bytes_done},
        {"bytes_total", e.bytes_total},
        {"overall_percent", Percent(e.keys_done + e.keys_failed, e.keys_total)},
    };

    std::lock_guard lock(mu_);
    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good())
        return;
    os << j.dump();
    os.close();

    std::rename(tmp_path.c_str(), path_.c_str());
}

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    std::lock_guard lock(mu_);
    const std::uint64_t finished = e.keys_done + e.keys_failed;
    const int pct = Percent(finished, e.keys_total);

    std::fprintf(stderr,
                 "\r[%llu/%llu keys] %3d%% | %.1f MiB",
                 static_cast<unsigned long long>(finished),
                 static_cast<unsigned long long>(e.keys_total),
                 pct,
                 static_cast<double>(e.bytes_done) / (1024.0 * 1024.0));
    if (e.keys_failed > 0) {
        std::fprintf(stderr, " | %llu failed", static_cast<unsigned long long>(e.keys_failed));
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.keys_total > 0 && finished >= e.keys_total) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace ngdp
