#pragma once

#include "core/error.hpp"
#include "core/request_context.hpp"
#include "model/query_parameters.hpp"
#include "model/trace.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace tracestore {

/**
 * @brief Read interface expected by the upstream query service
 *
 * Empty results are successes. Storage errors are returned as-is, never
 * retried; batch operations attach what they assembled before failing.
 */
class ISpanReader {
public:
    virtual ~ISpanReader() = default;

    /// Service names, ascending, no empty names
    [[nodiscard]] virtual Result<std::vector<std::string>> get_services(const RequestContext& ctx) = 0;

    /// Operation names, ascending, no empty names; narrowed to a service when given
    [[nodiscard]] virtual Result<std::vector<Operation>> get_operations(
        const RequestContext& ctx, const OperationQueryParameters& params) = 0;

    /// Spans ordered by start time; empty Trace when the id has no spans
    [[nodiscard]] virtual Result<Trace> get_trace(const RequestContext& ctx, const TraceId& trace_id) = 0;

    /// Distinct ids, at most num_traces (default when <= 0)
    [[nodiscard]] virtual Result<std::vector<TraceId>> find_trace_ids(
        const RequestContext& ctx, const TraceQueryParameters& query) = 0;

    /// find_trace_ids followed by one assembly per id
    [[nodiscard]] virtual Result<std::vector<Trace>> find_traces(
        const RequestContext& ctx, const TraceQueryParameters& query) = 0;

    /// Call counts per service pair over [end_time - lookback, end_time]
    [[nodiscard]] virtual Result<std::vector<DependencyLink>> get_dependencies(
        const RequestContext& ctx,
        std::chrono::system_clock::time_point end_time,
        std::chrono::microseconds lookback) = 0;
};

} // namespace tracestore
