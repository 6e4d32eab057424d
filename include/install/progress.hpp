#pragma once
#include <cstdint>
#include <string_view>

namespace ngdp {

struct ProgressEvent {
    // EKey (hex) of the key whose state just changed.
    std::string_view key;

    std::uint64_t keys_done = 0;
    std::uint64_t keys_failed = 0;
    std::uint64_t keys_total = 0;

    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace ngdp
