#include "core/signal_watcher.hpp"
#include "core/utils.hpp"

namespace tracestore {

volatile std::sig_atomic_t SignalWatcher::pending_ = 0;

SignalWatcher::SignalWatcher(std::stop_source target, std::chrono::milliseconds poll_interval)
    : poller_([target, poll_interval](std::stop_token self) mutable {
          while (!self.stop_requested()) {
              if (pending_ != 0) {
                  utils::log::warn("Signal received, cancelling request");
                  target.request_stop();
                  return;
              }
              std::this_thread::sleep_for(poll_interval);
          }
      }) {}

void SignalWatcher::notify() noexcept {
    pending_ = 1;
}

void SignalWatcher::reset() noexcept {
    pending_ = 0;
}

bool SignalWatcher::pending() noexcept {
    return pending_ != 0;
}

} // namespace tracestore
