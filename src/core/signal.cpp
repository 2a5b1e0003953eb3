#include "core/signal.h"
#include "core/logging.h"

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace core {

bool shutdown_requested() noexcept {
    return g_shutdown_requested.load(std::memory_order_acquire);
}

void request_shutdown() {
    bool expected = false;
    if (g_shutdown_requested.compare_exchange_strong(
            expected, true, std::memory_order_release,
            std::memory_order_relaxed)) {
        LOG_INFO(core::LogCategory::NODE, "Shutdown requested");
    }
    std::lock_guard<std::mutex> lock(g_shutdown_mutex);
    g_shutdown_cv.notify_all();
}

void wait_for_shutdown() {
    std::unique_lock<std::mutex> lock(g_shutdown_mutex);
    g_shutdown_cv.wait(lock, [] {
        return g_shutdown_requested.load(std::memory_order_acquire);
    });
}

bool wait_for_shutdown_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(g_shutdown_mutex);
    return g_shutdown_cv.wait_for(lock, timeout, [] {
        return g_shutdown_requested.load(std::memory_order_acquire);
    });
}

void reset_shutdown() {
    g_shutdown_requested.store(false, std::memory_order_release);
}

// ---------------------------------------------------------------------------
// POSIX signal handling
// ---------------------------------------------------------------------------

static void posix_signal_handler(int /*signum*/) {
    // Async-signal-safe only: no logging, no allocation.
    // A second signal while shutting down forces exit.
    if (g_shutdown_requested.load(std::memory_order_relaxed)) {
        const char msg[] = "\nForced shutdown (second signal received)\n";
        (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(1);
    }

    g_shutdown_requested.store(true, std::memory_order_release);

    // Not strictly async-signal-safe; works on Linux/glibc and wakes the
    // main thread out of wait_for_shutdown().
    std::lock_guard<std::mutex> lock(g_shutdown_mutex);
    g_shutdown_cv.notify_all();
}

void init_signal_handlers() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = posix_signal_handler;
        sigemptyset(&sa.sa_mask);

        for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
            if (sigaction(sig, &sa, nullptr) != 0) {
                LOG_ERROR(core::LogCategory::NODE,
                          "Failed to install handler for signal " +
                          std::to_string(sig));
            }
        }

        std::signal(SIGPIPE, SIG_IGN);
    });
}

} // namespace core
