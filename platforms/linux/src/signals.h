#pragma once

namespace drover::linux_shell {

// Install signal handlers for SIGTERM/SIGINT. The first signal only sets a
// flag, so the round in progress runs to its barrier; a second one restores
// the default action and is re-raised, killing the process.
void install_signal_handlers();

// Check if shutdown was requested
bool shutdown_requested();

} // namespace drover::linux_shell
