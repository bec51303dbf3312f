#include "spanstore/trace_id_finder.hpp"
#include "core/utils.hpp"
#include "spanstore/row_codec.hpp"
#include "spanstore/schema.hpp"
#include "spanstore/store_session.hpp"
#include <format>
#include <unordered_set>

namespace tracestore {

TraceIdFinder::TraceIdFinder(std::shared_ptr<IConnectionPool> pool, const ReaderOptions& options)
    : pool_(std::move(pool)), options_(options) {}

int TraceIdFinder::effective_limit(const TraceQueryParameters& query) const {
    if (query.num_traces > 0) return query.num_traces;
    return options_.default_num_traces > 0 ? options_.default_num_traces : kDefaultNumTraces;
}

std::string TraceIdFinder::validate(const TraceQueryParameters& query) {
    if (query.start_time_min && query.start_time_max && *query.start_time_min > *query.start_time_max) {
        return "start_time_min is after start_time_max";
    }
    if (query.duration_min && query.duration_max &&
        query.duration_min->count() > 0 && query.duration_max->count() > 0 &&
        *query.duration_min > *query.duration_max) {
        return "duration_min is greater than duration_max";
    }
    return {};
}

std::pair<std::string, std::vector<std::string>> TraceIdFinder::build_query(
    const FilterBuilder& filter, int64_t row_limit) const {

    std::string sql =
        "SELECT span.trace_id_low, span.trace_id_high\n"
        "FROM spans AS span\n";
    if (filter.references(schema::kOperationAlias)) {
        sql += "JOIN operations AS operation ON operation.id = span.operation_id\n";
    }
    if (filter.references(schema::kServiceAlias)) {
        sql += "JOIN services AS service ON service.id = span.service_id\n";
    }
    if (!filter.empty()) {
        sql += std::format("WHERE {}\n", filter.render(1));
    }
    sql += "ORDER BY span.start_time DESC\n";

    auto params = filter.params();
    params.push_back(std::to_string(row_limit));
    sql += std::format("LIMIT ${}::bigint", params.size());
    return {std::move(sql), std::move(params)};
}

Result<std::vector<TraceId>> TraceIdFinder::find(const RequestContext& ctx,
                                                 const TraceQueryParameters& query) const {
    const std::string context = std::format("find_trace_ids [{}]", query.describe());

    if (auto problem = validate(query); !problem.empty()) {
        return Result<std::vector<TraceId>>::error(ErrorCategory::INVALID_REQUEST, std::move(problem), context);
    }

    const int limit = effective_limit(query);
    const int factor = options_.overfetch_factor > 0 ? options_.overfetch_factor : 1;
    const auto filter = FilterBuilder::from_query(query);
    auto [sql, params] = build_query(filter, static_cast<int64_t>(limit) * factor);

    auto rs = StoreSession::run(*pool_, ctx, options_.acquire_timeout, sql, params, context);
    if (rs.is_error()) {
        return Result<std::vector<TraceId>>::partial({}, rs.error_category(), rs.error_message(), rs.context());
    }

    std::vector<TraceId> ids;
    std::unordered_set<TraceId, TraceIdHash> seen;
    try {
        for (const auto& row : rs.value().rows) {
            const auto id = codec::parse_trace_id(row.at(0), row.at(1));
            if (seen.insert(id).second) {
                ids.push_back(id);
                if (ids.size() >= static_cast<size_t>(limit)) break;
            }
        }
    } catch (const std::exception& e) {
        return Result<std::vector<TraceId>>::partial(
            std::move(ids), ErrorCategory::INTERNAL_ERROR, e.what(), context);
    }

    utils::log::debug(std::format("{}: {} rows -> {} trace ids", context, rs.value().rows.size(), ids.size()));
    return Result<std::vector<TraceId>>::ok(std::move(ids));
}

} // namespace tracestore
