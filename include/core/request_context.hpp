#pragma once

#include <chrono>
#include <optional>
#include <stop_token>

namespace tracestore {

/**
 * @brief Request context - carries cancellation state through a read call
 *
 * Owned by the caller. Components poll should_stop() before each storage
 * round trip; a call already in flight is not aborted, its result is
 * discarded once cancellation has been observed.
 */
struct RequestContext {
    std::stop_token stop_token;
    std::optional<std::chrono::steady_clock::time_point> deadline;

    RequestContext() = default;

    explicit RequestContext(std::stop_token token)
        : stop_token(std::move(token)) {}

    RequestContext(std::stop_token token, std::chrono::steady_clock::time_point until)
        : stop_token(std::move(token)), deadline(until) {}

    [[nodiscard]] bool is_cancelled() const {
        return stop_token.stop_requested();
    }

    [[nodiscard]] bool is_expired() const {
        return deadline.has_value() && std::chrono::steady_clock::now() >= *deadline;
    }

    [[nodiscard]] bool should_stop() const {
        return is_cancelled() || is_expired();
    }

    /// Reason string for a CANCELLED result
    [[nodiscard]] const char* stop_reason() const {
        return is_cancelled() ? "request cancelled" : "request deadline exceeded";
    }

    /// Context with a deadline relative to now (0 = none)
    [[nodiscard]] static RequestContext with_timeout(std::stop_token token,
                                                     std::chrono::milliseconds timeout) {
        if (timeout.count() <= 0) {
            return RequestContext(std::move(token));
        }
        return RequestContext(std::move(token), std::chrono::steady_clock::now() + timeout);
    }
};

} // namespace tracestore
