#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace tracestore {

inline constexpr int kDefaultNumTraces = 10;

/**
 * @brief Trace search criteria
 *
 * Present fields combine with AND; absent fields impose no constraint.
 * num_traces <= 0 means the reader's default.
 */
struct TraceQueryParameters {
    std::optional<std::string> service_name;
    std::optional<std::string> operation_name;
    std::optional<std::chrono::system_clock::time_point> start_time_min;
    std::optional<std::chrono::system_clock::time_point> start_time_max;
    std::optional<std::chrono::microseconds> duration_min;
    std::optional<std::chrono::microseconds> duration_max;
    std::map<std::string, std::string> tags;
    int num_traces = 0;

    /// Short human-readable summary for error context and logs
    [[nodiscard]] std::string describe() const;
};

struct OperationQueryParameters {
    std::string service_name;   // empty = all services
};

} // namespace tracestore
