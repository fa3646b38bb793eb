#pragma once

/**
 * Process utilities for the trade finder daemon
 *
 * Signal handling for graceful shutdown.
 */

#include <atomic>
#include <csignal>

namespace tradefinder {
namespace util {

// ============================================================================
// Signal Handler
// ============================================================================

namespace detail {
inline std::atomic<bool>* g_running_flag = nullptr;
inline std::atomic<int> g_last_signal{0};
} // namespace detail

/**
 * Clears the running flag and remembers the signal.
 * Only async-signal-safe work here; the main loop does the logging.
 */
inline void graceful_shutdown_handler(int sig) {
    detail::g_last_signal.store(sig);
    if (detail::g_running_flag) {
        detail::g_running_flag->store(false);
    }
}

/**
 * Install graceful shutdown handler for SIGINT and SIGTERM.
 *
 * @param running Atomic flag to set to false on signal
 */
inline void install_shutdown_handler(std::atomic<bool>& running) {
    detail::g_running_flag = &running;
    std::signal(SIGINT, graceful_shutdown_handler);
    std::signal(SIGTERM, graceful_shutdown_handler);
}

// 0 if no shutdown signal has been received
inline int last_shutdown_signal() { return detail::g_last_signal.load(); }

} // namespace util
} // namespace tradefinder
