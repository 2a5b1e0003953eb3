#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace core {

// ---------------------------------------------------------------------------
// Process-wide shutdown signalling
// ---------------------------------------------------------------------------

/// Set by the OS signal handler and request_shutdown(); read lock-free.
inline std::atomic<bool> g_shutdown_requested{false};

inline std::condition_variable g_shutdown_cv;
inline std::mutex g_shutdown_mutex;

/// Installs SIGINT/SIGTERM/SIGHUP handlers and ignores SIGPIPE so a client
/// hanging up mid-response cannot kill the daemon. Idempotent.
void init_signal_handlers();

[[nodiscard]] bool shutdown_requested() noexcept;

/// Wakes every wait_for_shutdown() caller. Idempotent.
void request_shutdown();

void wait_for_shutdown();

/// Blocks until shutdown is requested or @p timeout passes.
/// @return true if shutdown was requested.
bool wait_for_shutdown_for(std::chrono::milliseconds timeout);

/// Clears the flag. Tests only.
void reset_shutdown();

} // namespace core
