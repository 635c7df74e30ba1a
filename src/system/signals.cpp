// signals.cpp - SIGINT/SIGTERM request a cooperative stop of the current run.
// The handler is one-shot: a second signal gets the default action, so an
// operator can still kill a run that is stuck in a blocking syscall.

#include "system/signals.hpp"

#include <csignal>

namespace batchsync {

std::atomic_bool g_cancel{false};

static void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESETHAND;
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
}

} // namespace batchsync
