#pragma once

#include <atomic>

namespace ngdp {

// Set by the first SIGINT/SIGTERM. Long-running work polls it and winds down;
// archive writes already in progress are finished first.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace ngdp
