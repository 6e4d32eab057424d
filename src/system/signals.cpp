// signals.cpp - Cooperative cancellation for installs and stream commands.

#include "system/signals.hpp"

#include <csignal>

namespace ngdp {

std::atomic_bool g_cancel{false};

namespace {

void HandleCancel(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

} // namespace

void InstallSignalHandlers() {
    // One-shot: the first SIGINT/SIGTERM asks workers to wind down, a second
    // one gets the default action and terminates.
    struct sigaction sa{};
    sa.sa_handler = HandleCancel;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESETHAND;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // A peer closing a CDN connection must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace ngdp
