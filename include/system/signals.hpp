#pragma once

#include <atomic>

namespace adbpipe {

// Set by SIGINT/SIGTERM; the interactive loop turns it into a cancel.
extern std::atomic_bool g_cancel;
// Number of the signal that set g_cancel, 0 if none.
extern std::atomic_int g_cancel_signal;

// Also ignores SIGPIPE so a vanished reader surfaces as EPIPE.
void InstallSignalHandlers();

} // namespace adbpipe
