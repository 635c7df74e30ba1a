#pragma once

#include <atomic>

namespace batchsync {

// Set by SIGINT/SIGTERM. Only the CLI reads it; the engine receives a
// pointer to it through its options.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace batchsync
