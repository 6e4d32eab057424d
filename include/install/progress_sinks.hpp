#pragma once

#include "install/progress.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace ngdp {

// Rewrites a small JSON status document on every event (tmp file + rename).
class FileProgressSink final : public IProgress {
public:
    explicit FileProgressSink(std::string path);

    void OnProgress(const ProgressEvent& e) override;

private:
    std::mutex mu_;
    std::string path_;
};

// Single self-overwriting status line on stderr.
class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    std::mutex mu_;
};

// Fans events out to several sinks.
class MultiProgress final : public IProgress {
public:
    void Add(IProgress* sink) { sinks_.push_back(sink); }
    bool Empty() const { return sinks_.empty(); }

    void OnProgress(const ProgressEvent& e) override {
        for (auto* s : sinks_) s->OnProgress(e);
    }

private:
    std::vector<IProgress*> sinks_;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace ngdp
