#include <catch2/catch_test_macros.hpp>
#include "core/signal_watcher.hpp"
#include <csignal>

using namespace tracestore;

namespace {

void forward_to_watcher(int /*signal*/) {
    SignalWatcher::notify();
}

// Polls until the token is stopped or the timeout elapses
bool wait_for_stop(const std::stop_token& token, std::chrono::milliseconds timeout) {
    const auto until = std::chrono::steady_clock::now() + timeout;
    while (!token.stop_requested() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return token.stop_requested();
}

} // anonymous namespace

TEST_CASE("SignalWatcher: raised signal stops the source off the handler", "[signal]") {
    SignalWatcher::reset();
    std::stop_source source;

    bool callback_ran = false;
    std::stop_callback on_stop(source.get_token(), [&callback_ran] { callback_ran = true; });

    {
        SignalWatcher watcher(source, std::chrono::milliseconds(5));
        auto previous = std::signal(SIGUSR1, forward_to_watcher);
        std::raise(SIGUSR1);
        std::signal(SIGUSR1, previous);

        // The handler itself only set the flag
        CHECK(SignalWatcher::pending());
        CHECK(wait_for_stop(source.get_token(), std::chrono::seconds(2)));
    }
    CHECK(callback_ran);
    SignalWatcher::reset();
}

TEST_CASE("SignalWatcher: no signal leaves the source untouched", "[signal]") {
    SignalWatcher::reset();
    std::stop_source source;
    {
        SignalWatcher watcher(source, std::chrono::milliseconds(5));
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
    }
    CHECK_FALSE(source.stop_requested());
}
