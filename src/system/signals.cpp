#include "system/signals.hpp"

#include <csignal>
#include <signal.h>

namespace adbpipe {

std::atomic_bool g_cancel{false};
std::atomic_int g_cancel_signal{0};

namespace {

void OnTerminationSignal(int sig) {
    g_cancel_signal.store(sig, std::memory_order_relaxed);
    g_cancel.store(true, std::memory_order_relaxed);
}

void Install(int sig, void (*handler)(int)) {
    struct sigaction sa {};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: blocking poll()/waitpid() return EINTR and callers
    // re-check the flag.
    sa.sa_flags = 0;
    (void)::sigaction(sig, &sa, nullptr);
}

} // namespace

void InstallSignalHandlers() {
    Install(SIGINT, OnTerminationSignal);
    Install(SIGTERM, OnTerminationSignal);
    Install(SIGPIPE, SIG_IGN);
}

} // namespace adbpipe
