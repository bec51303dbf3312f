#pragma once

#include <chrono>
#include <csignal>
#include <stop_token>
#include <thread>

namespace tracestore {

/**
 * @brief Forwards SIGINT/SIGTERM into a std::stop_source
 *
 * request_stop() runs stop callbacks synchronously and takes a lock, so it
 * must not be called from a signal handler. The handler only calls
 * notify(), which sets a sig_atomic_t flag; a background thread polls the
 * flag and requests the stop on a normal thread.
 *
 * Usage:
 *   std::signal(SIGINT, [](int) { SignalWatcher::notify(); });
 *   SignalWatcher watcher(stop_source);
 */
class SignalWatcher {
public:
    explicit SignalWatcher(std::stop_source target,
                           std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));

    ~SignalWatcher() = default;

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /// Async-signal-safe
    static void notify() noexcept;

    /// Clear a pending notification (tests)
    static void reset() noexcept;

    [[nodiscard]] static bool pending() noexcept;

private:
    static volatile std::sig_atomic_t pending_;

    std::jthread poller_;
};

} // namespace tracestore
