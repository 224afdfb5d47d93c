#pragma once

#include <atomic>

namespace brainforge {

extern std::atomic<bool> g_shutdown_requested;

/// SIGINT/SIGTERM request shutdown; SIGPIPE is ignored.
void setup_signal_handlers();
/// Blocks until a shutdown was requested.
void wait_for_shutdown();

} // namespace brainforge
