#include "spanstore/trace_assembler.hpp"
#include "core/utils.hpp"
#include "spanstore/row_codec.hpp"
#include <algorithm>
#include <atomic>
#include <format>
#include <future>
#include <optional>
#include <stdexcept>
#include <stop_token>

namespace tracestore {

namespace {

constexpr const char* kSelectTraceSpans =
    "SELECT span.id, span.trace_id_low, span.trace_id_high, span.span_id,\n"
    "       operation.operation_name, service.service_name, span.flags,\n"
    "       (EXTRACT(EPOCH FROM span.start_time) * 1000000)::bigint AS start_time_us,\n"
    "       span.duration, span.tags, span.process_id, span.process_tags\n"
    "FROM spans AS span\n"
    "LEFT JOIN operations AS operation ON operation.id = span.operation_id\n"
    "LEFT JOIN services AS service ON service.id = span.service_id\n"
    "WHERE span.trace_id_low = $1::bigint AND span.trace_id_high = $2::bigint\n"
    "ORDER BY span.start_time ASC, span.id ASC";

enum SpanColumn : size_t {
    kRowId, kTraceIdLow, kTraceIdHigh, kSpanId, kOperationName, kServiceName,
    kFlags, kStartTimeUs, kDuration, kTags, kProcessId, kProcessTags, kSpanColumnCount
};

constexpr const char* kSelectTraceRefs =
    "SELECT ref.source_span_id, ref.ref_type,\n"
    "       child.trace_id_low, child.trace_id_high, child.span_id\n"
    "FROM span_refs AS ref\n"
    "JOIN spans AS source ON source.id = ref.source_span_id\n"
    "JOIN spans AS child ON child.id = ref.child_span_id\n"
    "WHERE source.trace_id_low = $1::bigint AND source.trace_id_high = $2::bigint\n"
    "ORDER BY ref.id ASC";

enum RefColumn : size_t {
    kRefSource, kRefType, kRefTraceIdLow, kRefTraceIdHigh, kRefSpanId, kRefColumnCount
};

void require_columns(const std::vector<std::string>& row, size_t count) {
    if (row.size() < count) {
        throw std::invalid_argument(std::format("expected {} columns, got {}", count, row.size()));
    }
}

SpanRow decode_span_row(const std::vector<std::string>& row) {
    require_columns(row, kSpanColumnCount);

    SpanRow out;
    out.row_id = codec::parse_bigint(row[kRowId]);
    out.span.trace_id = codec::parse_trace_id(row[kTraceIdLow], row[kTraceIdHigh]);
    out.span.span_id = codec::parse_unsigned_id(row[kSpanId]);
    out.span.operation_name = row[kOperationName];
    out.span.flags = row[kFlags].empty() ? 0u : static_cast<uint32_t>(codec::parse_bigint(row[kFlags]));
    out.span.start_time = codec::parse_epoch_micros(row[kStartTimeUs]);
    out.span.duration = std::chrono::microseconds(codec::parse_bigint(row[kDuration]));
    out.span.tags = codec::parse_tags(row[kTags]);
    out.span.process_id = row[kProcessId];
    out.service_name = row[kServiceName];
    out.process_tags = codec::parse_tags(row[kProcessTags]);
    return out;
}

struct BatchFailure {
    ErrorCategory category;
    std::string message;
    std::string context;
};

struct WorkerOutcome {
    std::vector<std::pair<size_t, Trace>> traces;
    std::optional<BatchFailure> failure;   // set only on the worker that failed first
};

} // anonymous namespace

TraceAssembler::TraceAssembler(std::shared_ptr<IConnectionPool> pool, const ReaderOptions& options)
    : pool_(std::move(pool)), options_(options) {}

Result<std::vector<SpanRow>> TraceAssembler::load_spans(const RequestContext& ctx, StoreSession& session,
                                                        const TraceId& id, const std::string& context) const {
    const std::vector<std::string> params = {
        codec::format_unsigned_id(id.low),
        codec::format_unsigned_id(id.high),
    };

    auto rs = session.query(ctx, kSelectTraceSpans, params, context);
    if (rs.is_error()) {
        return Result<std::vector<SpanRow>>::error(rs.error_category(), rs.error_message(), rs.context());
    }

    std::vector<SpanRow> rows;
    rows.reserve(rs.value().rows.size());
    try {
        for (const auto& row : rs.value().rows) {
            rows.push_back(decode_span_row(row));
        }
    } catch (const std::exception& e) {
        return Result<std::vector<SpanRow>>::error(
            ErrorCategory::INTERNAL_ERROR, std::format("bad span row: {}", e.what()), context);
    }
    return Result<std::vector<SpanRow>>::ok(std::move(rows));
}

Result<bool> TraceAssembler::load_references(const RequestContext& ctx, StoreSession& session,
                                             const TraceId& id, TraceGrouper& grouper,
                                             const std::string& context) const {
    const std::vector<std::string> params = {
        codec::format_unsigned_id(id.low),
        codec::format_unsigned_id(id.high),
    };

    auto rs = session.query(ctx, kSelectTraceRefs, params, context);
    if (rs.is_error()) {
        return Result<bool>::error(rs.error_category(), rs.error_message(), rs.context());
    }

    try {
        for (const auto& row : rs.value().rows) {
            require_columns(row, kRefColumnCount);
            SpanRef ref;
            ref.ref_type = parse_span_ref_type(row[kRefType]);
            ref.trace_id = codec::parse_trace_id(row[kRefTraceIdLow], row[kRefTraceIdHigh]);
            ref.span_id = codec::parse_unsigned_id(row[kRefSpanId]);
            if (!grouper.attach_reference(codec::parse_bigint(row[kRefSource]), ref)) {
                utils::log::debug(std::format("{}: reference from unknown span row {}", context, row[kRefSource]));
            }
        }
    } catch (const std::exception& e) {
        return Result<bool>::error(
            ErrorCategory::INTERNAL_ERROR, std::format("bad reference row: {}", e.what()), context);
    }
    return Result<bool>::ok(true);
}

Result<Trace> TraceAssembler::assemble(const RequestContext& ctx, const TraceId& id) const {
    const std::string context = std::format("get_trace trace_id={}", id.to_hex());

    auto session = StoreSession::open(*pool_, ctx, options_.acquire_timeout, context);
    if (session.is_error()) {
        return Result<Trace>::error(session.error_category(), session.error_message(), context);
    }

    auto rows = load_spans(ctx, session.value(), id, context);
    if (rows.is_error()) {
        return Result<Trace>::error(rows.error_category(), rows.error_message(), rows.context());
    }
    if (rows.value().empty()) {
        return Result<Trace>::ok(Trace{});
    }

    TraceGrouper grouper;
    for (auto& row : rows.value()) {
        grouper.add(std::move(row));
    }

    auto refs = load_references(ctx, session.value(), id, grouper, context);
    if (refs.is_error()) {
        return Result<Trace>::error(refs.error_category(), refs.error_message(), refs.context());
    }

    auto traces = grouper.take();
    return Result<Trace>::ok(std::move(traces.front()));
}

Result<std::vector<Trace>> TraceAssembler::assemble_batch(
    const RequestContext& ctx, const std::vector<TraceId>& ids) const {

    if (ids.empty()) {
        return Result<std::vector<Trace>>::ok({});
    }

    // Private stop source: set by the first failing worker or by the caller
    std::stop_source batch_stop;
    std::stop_callback forward_cancel(ctx.stop_token, [&batch_stop] { batch_stop.request_stop(); });
    RequestContext worker_ctx = ctx.deadline
        ? RequestContext(batch_stop.get_token(), *ctx.deadline)
        : RequestContext(batch_stop.get_token());

    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};

    auto worker = [&]() {
        WorkerOutcome out;
        while (!worker_ctx.should_stop()) {
            const size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= ids.size()) break;

            auto result = assemble(worker_ctx, ids[i]);
            if (result.is_error()) {
                bool expected = false;
                if (failed.compare_exchange_strong(expected, true)) {
                    out.failure = BatchFailure{result.error_category(), result.error_message(), result.context()};
                }
                batch_stop.request_stop();
                break;
            }
            if (!result.value().empty()) {
                out.traces.emplace_back(i, std::move(result.value()));
            }
        }
        return out;
    };

    const size_t workers = std::clamp<size_t>(options_.max_parallel_fetches, 1, ids.size());

    std::vector<WorkerOutcome> outcomes;
    outcomes.reserve(workers);
    if (workers == 1) {
        outcomes.push_back(worker());
    } else {
        std::vector<std::future<WorkerOutcome>> futures;
        futures.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            futures.push_back(std::async(std::launch::async, worker));
        }
        for (auto& f : futures) {
            outcomes.push_back(f.get());
        }
    }

    // Single aggregator: only this thread touches the merged slots
    std::vector<std::optional<Trace>> slots(ids.size());
    std::optional<BatchFailure> failure;
    for (auto& outcome : outcomes) {
        for (auto& [index, trace] : outcome.traces) {
            slots[index] = std::move(trace);
        }
        if (outcome.failure) {
            failure = std::move(outcome.failure);
        }
    }

    std::vector<Trace> traces;
    traces.reserve(ids.size());
    for (auto& slot : slots) {
        if (slot) traces.push_back(std::move(*slot));
    }

    if (failure) {
        return Result<std::vector<Trace>>::partial(
            std::move(traces), failure->category, std::move(failure->message), std::move(failure->context));
    }
    if (next.load() < ids.size() && ctx.should_stop()) {
        return Result<std::vector<Trace>>::partial(
            std::move(traces), ErrorCategory::CANCELLED, ctx.stop_reason(),
            std::format("assemble_batch {}/{} traces", traces.size(), ids.size()));
    }
    return Result<std::vector<Trace>>::ok(std::move(traces));
}

} // namespace tracestore
