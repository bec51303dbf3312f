#include "spanstore/pg_span_reader.hpp"
#include "core/utils.hpp"
#include <format>

namespace tracestore {

PgSpanReader::PgSpanReader(std::shared_ptr<IConnectionPool> pool, const ReaderOptions& options)
    : catalog_(pool, options),
      finder_(pool, options),
      assembler_(pool, options),
      dependencies_(std::move(pool), options) {}

Result<std::vector<std::string>> PgSpanReader::get_services(const RequestContext& ctx) {
    return catalog_.list_services(ctx);
}

Result<std::vector<Operation>> PgSpanReader::get_operations(
    const RequestContext& ctx, const OperationQueryParameters& params) {
    return catalog_.list_operations(ctx, params);
}

Result<Trace> PgSpanReader::get_trace(const RequestContext& ctx, const TraceId& trace_id) {
    if (trace_id.is_zero()) {
        return Result<Trace>::error(ErrorCategory::INVALID_REQUEST, "trace id must not be zero",
                                    std::format("get_trace trace_id={}", trace_id.to_hex()));
    }
    return assembler_.assemble(ctx, trace_id);
}

Result<std::vector<TraceId>> PgSpanReader::find_trace_ids(
    const RequestContext& ctx, const TraceQueryParameters& query) {
    return finder_.find(ctx, query);
}

Result<std::vector<Trace>> PgSpanReader::find_traces(
    const RequestContext& ctx, const TraceQueryParameters& query) {

    auto ids = finder_.find(ctx, query);
    if (ids.is_error()) {
        return Result<std::vector<Trace>>::partial({}, ids.error_category(), ids.error_message(), ids.context());
    }

    auto traces = assembler_.assemble_batch(ctx, ids.value());
    if (traces.is_error()) {
        auto context = std::format("find_traces [{}] / {}", query.describe(), traces.context());
        auto assembled = traces.has_value() ? std::move(traces.value()) : std::vector<Trace>{};
        return Result<std::vector<Trace>>::partial(
            std::move(assembled), traces.error_category(), traces.error_message(), std::move(context));
    }

    utils::log::debug(std::format("find_traces [{}]: {} ids -> {} traces",
        query.describe(), ids.value().size(), traces.value().size()));
    return traces;
}

Result<std::vector<DependencyLink>> PgSpanReader::get_dependencies(
    const RequestContext& ctx,
    std::chrono::system_clock::time_point end_time,
    std::chrono::microseconds lookback) {
    return dependencies_.get_dependencies(ctx, end_time, lookback);
}

} // namespace tracestore
