#include "install/install_orchestrator.hpp"

#include "blte/blte_decoder.hpp"
#include "blte/blte_encoder.hpp"
#include "crypto/md5.hpp"
#include "install/progress_store.hpp"
#include "install/worker_pool.hpp"
#include "io/span_reader.hpp"
#include "util/logger.hpp"

#include <memory>

namespace ngdp {

const char* ToString(KeyState s) {
    switch (s) {
        case KeyState::Pending:   return "pending";
        case KeyState::Resolving: return "resolving";
        case KeyState::Fetching:  return "fetching";
        case KeyState::Decoding:  return "decoding";
        case KeyState::Archiving: return "archiving";
        case KeyState::Completed: return "completed";
        case KeyState::Errored:   return "errored";
    }
    return "unknown";
}

const char* ToString(SessionOutcome o) {
    switch (o) {
        case SessionOutcome::Completed:       return "completed";
        case SessionOutcome::PartiallyFailed: return "partially failed";
        case SessionOutcome::Cancelled:       return "cancelled";
        case SessionOutcome::Aborted:         return "aborted";
    }
    return "unknown";
}

// Durable per-key record plus the running totals handed to progress sinks.
class InstallOrchestrator::ProgressRecorder {
public:
    ProgressRecorder(ProgressStore& store, IProgress* sink, std::uint64_t keys_total, std::uint64_t bytes_total)
        : store_(store), sink_(sink) {
        ev_.keys_total = keys_total;
        ev_.bytes_total = bytes_total;
    }

    bool IsRecorded(const EKey& ekey) const { return store_.IsCompleted(ekey); }
    Result Record(const EKey& ekey) { return store_.RecordCompleted(ekey); }

    void KeyFinished(const KeyOutcome& o, std::uint64_t bytes) {
        std::lock_guard lock(mu_);
        if (o.state == KeyState::Completed) {
            ++ev_.keys_done;
            ev_.bytes_done += bytes;
        } else {
            ++ev_.keys_failed;
        }
        if (sink_ == nullptr) return;
        const std::string hex = o.ekey.Hex();
        ev_.key = hex;
        sink_->OnProgress(ev_);
        ev_.key = {};
    }

private:
    ProgressStore& store_;
    IProgress* sink_;
    std::mutex mu_;
    ProgressEvent ev_;
};

InstallOrchestrator::InstallOrchestrator(casc::ArchiveStore& store,
                                         cdn::DownloadManager& downloads,
                                         const IKeyStore& keys,
                                         InstallOptions opt,
                                         const std::atomic_bool& cancel,
                                         IProgress* progress)
    : store_(store),
      downloads_(downloads),
      keys_(keys),
      opt_(std::move(opt)),
      cancel_(cancel),
      progress_(progress) {}

Result InstallOrchestrator::FetchVerified(const ManifestEntry& entry, std::vector<std::uint8_t>& encoded) {
    cdn::ObjectRef ref = cdn::ObjectRef::Data(entry.ekey);
    if (entry.archive) {
        const auto& a = *entry.archive;
        ref = cdn::ObjectRef::Data(a.archive, cdn::ByteRange{a.offset, a.offset + a.size - 1});
    }

    auto r = downloads_.Fetch(ref, encoded);
    if (!r.ok) return r;

    EKey actual;
    r = blte::ComputeEKey(encoded, actual);
    if (!r.ok) return r;
    if (actual != entry.ekey) {
        return Result::Fail(ErrorCode::KeyMismatch, "downloaded bytes hash to " + actual.Hex());
    }
    return Result::Ok();
}

// Streams the container through the decoder so the decoded file is never
// held in memory; only its MD5 is kept when a CKey is available.
Result InstallOrchestrator::DecodeAndCheck(const ManifestEntry& entry, std::span<const std::uint8_t> encoded) {
    blte::BlteReader reader(std::make_unique<SpanReader>(encoded), keys_);
    Md5Hasher hasher;
    std::vector<std::uint8_t> buf(256 * 1024);

    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n < 0) return reader.Status();
        if (n == 0) break;
        if (entry.ckey) hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<std::size_t>(n)));
    }
    if (!reader.Status().ok) return reader.Status();

    if (entry.ckey) {
        Md5Digest digest{};
        if (!hasher.Final(digest)) return Result::Fail(ErrorCode::Io, "MD5 context failed");
        if (CKey(digest) != *entry.ckey) {
            return Result::Fail(ErrorCode::ChecksumMismatch,
                                "decoded content hashes to " + CKey(digest).Hex() + ", manifest says " +
                                    entry.ckey->Hex());
        }
    }
    return Result::Ok();
}

void InstallOrchestrator::ProcessKey(const ManifestEntry& entry, KeyOutcome& outcome, ProgressRecorder& recorder) {
    if (cancel_.load() || abort_.load()) return;

    const std::string hex = entry.ekey.Hex();
    auto fail = [&](Result r) {
        if (r.code == ErrorCode::Cancelled) {
            // Interrupted before anything was written; leave it for the next run.
            outcome.state = KeyState::Pending;
            return;
        }
        LogError("%s (%s) failed while %s: [%s] %s", hex.c_str(), entry.name.c_str(), ToString(outcome.state),
                 ToString(r.code), r.msg.c_str());
        if (r.kind() == ErrorKind::ResourceExhausted && !abort_.exchange(true)) {
            LogError("Out of resources, stopping the install");
        }
        outcome.state = KeyState::Errored;
        outcome.error = std::move(r);
        recorder.KeyFinished(outcome, 0);
    };

    outcome.state = KeyState::Resolving;
    const bool recorded = recorder.IsRecorded(entry.ekey);
    if (store_.Contains(entry.ekey)) {
        if (!recorded) {
            auto r = recorder.Record(entry.ekey);
            if (!r.ok) return fail(std::move(r));
        }
        outcome.already_present = true;
        outcome.state = KeyState::Completed;
        LogDebug("%s already archived", hex.c_str());
        recorder.KeyFinished(outcome, entry.size);
        return;
    }
    if (recorded) {
        LogWarn("%s recorded as installed but missing from the archive, fetching again", hex.c_str());
    }

    outcome.state = KeyState::Fetching;
    std::vector<std::uint8_t> encoded;
    auto r = FetchVerified(entry, encoded);
    if (!r.ok) return fail(std::move(r));

    outcome.state = KeyState::Decoding;
    r = DecodeAndCheck(entry, encoded);
    if (!r.ok) return fail(std::move(r));

    outcome.state = KeyState::Archiving;
    r = store_.Append(entry.ekey, encoded);
    if (!r.ok) return fail(std::move(r));
    r = recorder.Record(entry.ekey);
    if (!r.ok) return fail(std::move(r));

    outcome.state = KeyState::Completed;
    LogDebug("%s installed (%zu encoded bytes)", hex.c_str(), encoded.size());
    recorder.KeyFinished(outcome, entry.size);
}

Result InstallOrchestrator::Run(const Manifest& manifest, InstallReport& report) {
    report = InstallReport{};
    abort_ = false;

    const std::vector<ManifestEntry> selected = FilterByTags(manifest, opt_.tags);
    LogInfo("Manifest %s: %zu of %zu entries selected", manifest.version.c_str(), selected.size(),
            manifest.entries.size());

    std::unique_ptr<ProgressStore> progress;
    auto r = ProgressStore::Open(opt_.progress_path, manifest.version, progress);
    if (!r.ok) return r;

    std::uint64_t bytes_total = 0;
    report.keys.resize(selected.size());
    for (std::size_t i = 0; i < selected.size(); ++i) {
        report.keys[i].ekey = selected[i].ekey;
        report.keys[i].name = selected[i].name;
        bytes_total += selected[i].size;
    }

    ProgressRecorder recorder(*progress, progress_, selected.size(), bytes_total);
    const std::uint64_t fetched_before = downloads_.BytesFetched();
    {
        WorkerPool pool(opt_.workers, "install");
        for (std::size_t i = 0; i < selected.size(); ++i) {
            pool.Submit([this, &selected, &report, &recorder, i] {
                ProcessKey(selected[i], report.keys[i], recorder);
            });
        }
        pool.Wait();
    }
    report.bytes_fetched = downloads_.BytesFetched() - fetched_before;

    for (const auto& k : report.keys) {
        switch (k.state) {
            case KeyState::Completed:
                ++report.completed;
                if (k.already_present) ++report.already_present;
                break;
            case KeyState::Errored:
                ++report.errored;
                break;
            default:
                ++report.not_attempted;
                break;
        }
    }

    if (abort_.load()) {
        report.outcome = SessionOutcome::Aborted;
    } else if (report.not_attempted > 0) {
        report.outcome = SessionOutcome::Cancelled;
    } else if (report.errored > 0) {
        report.outcome = SessionOutcome::PartiallyFailed;
    } else {
        report.outcome = SessionOutcome::Completed;
        r = progress->Remove();
        if (!r.ok) LogWarn("Could not remove %s: %s", progress->Path().c_str(), r.msg.c_str());
    }

    LogInfo("Install %s: %zu completed (%zu already present), %zu failed, %zu not attempted",
            ToString(report.outcome), report.completed, report.already_present, report.errored,
            report.not_attempted);
    return Result::Ok();
}

} // namespace ngdp
