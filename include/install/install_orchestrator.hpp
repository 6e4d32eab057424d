#pragma once

#include "casc/archive_store.hpp"
#include "cdn/download_manager.hpp"
#include "crypto/key_store.hpp"
#include "install/progress.hpp"
#include "util/manifest.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace ngdp {

enum class KeyState {
    Pending,
    Resolving,
    Fetching,
    Decoding,
    Archiving,
    Completed,
    Errored,
};

const char* ToString(KeyState s);

struct KeyOutcome {
    EKey ekey;
    std::string name;
    KeyState state = KeyState::Pending;
    // Completed because the archive already held the key.
    bool already_present = false;
    // Set when state is Errored.
    Result error;
};

enum class SessionOutcome {
    Completed,
    PartiallyFailed,
    Cancelled,
    // A ResourceExhausted failure stopped the run.
    Aborted,
};

const char* ToString(SessionOutcome o);

struct InstallReport {
    SessionOutcome outcome = SessionOutcome::Completed;
    std::vector<KeyOutcome> keys;

    std::size_t completed = 0;
    std::size_t errored = 0;
    std::size_t already_present = 0;
    std::size_t not_attempted = 0;
    std::uint64_t bytes_fetched = 0;
};

struct InstallOptions {
    int workers = 4;
    // Strict: an entry needs every tag listed here.
    std::vector<std::string> tags;
    // Resumable record; see ProgressStore.
    std::string progress_path;
};

// Runs the per-key Resolve -> Fetch -> Decode -> Archive -> Record pipeline
// over the selected manifest entries on a worker pool.
class InstallOrchestrator {
public:
    InstallOrchestrator(casc::ArchiveStore& store,
                        cdn::DownloadManager& downloads,
                        const IKeyStore& keys,
                        InstallOptions opt,
                        const std::atomic_bool& cancel,
                        IProgress* progress = nullptr);

    // Fails only if the session cannot start (bad progress file, ...).
    // Per-key failures are reported through `report`.
    Result Run(const Manifest& manifest, InstallReport& report);

private:
    class ProgressRecorder;

    void ProcessKey(const ManifestEntry& entry, KeyOutcome& outcome, ProgressRecorder& recorder);
    Result FetchVerified(const ManifestEntry& entry, std::vector<std::uint8_t>& encoded);
    Result DecodeAndCheck(const ManifestEntry& entry, std::span<const std::uint8_t> encoded);

    casc::ArchiveStore& store_;
    cdn::DownloadManager& downloads_;
    const IKeyStore& keys_;
    InstallOptions opt_;
    const std::atomic_bool& cancel_;
    IProgress* progress_;

    std::atomic_bool abort_{false};
};

} // namespace ngdp
