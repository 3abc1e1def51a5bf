#include "signals.h"

#include <csignal>

namespace drover::linux_shell {

static volatile sig_atomic_t g_shutdown = 0;

static void handle_term(int sig) {
    if (g_shutdown) {
        // Second request: stop waiting for transfers.
        std::signal(sig, SIG_DFL);
        std::raise(sig);
        return;
    }
    g_shutdown = 1;
}

void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = handle_term;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
}

bool shutdown_requested() {
    return g_shutdown != 0;
}

} // namespace drover::linux_shell
