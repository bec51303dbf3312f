#pragma once

#include "db/iconnection_pool.hpp"
#include "spanstore/dependency_aggregator.hpp"
#include "spanstore/ispan_reader.hpp"
#include "spanstore/reader_options.hpp"
#include "spanstore/service_catalog.hpp"
#include "spanstore/trace_assembler.hpp"
#include "spanstore/trace_id_finder.hpp"
#include <memory>

namespace tracestore {

/**
 * @brief ISpanReader over the relational span schema
 *
 * Composes the catalog, finder, assembler and dependency components over one
 * shared connection pool. Holds no per-request state; safe to call from
 * several threads.
 */
class PgSpanReader : public ISpanReader {
public:
    PgSpanReader(std::shared_ptr<IConnectionPool> pool, const ReaderOptions& options);

    Result<std::vector<std::string>> get_services(const RequestContext& ctx) override;

    Result<std::vector<Operation>> get_operations(
        const RequestContext& ctx, const OperationQueryParameters& params) override;

    Result<Trace> get_trace(const RequestContext& ctx, const TraceId& trace_id) override;

    Result<std::vector<TraceId>> find_trace_ids(
        const RequestContext& ctx, const TraceQueryParameters& query) override;

    Result<std::vector<Trace>> find_traces(
        const RequestContext& ctx, const TraceQueryParameters& query) override;

    Result<std::vector<DependencyLink>> get_dependencies(
        const RequestContext& ctx,
        std::chrono::system_clock::time_point end_time,
        std::chrono::microseconds lookback) override;

private:
    ServiceCatalog catalog_;
    TraceIdFinder finder_;
    TraceAssembler assembler_;
    DependencyAggregator dependencies_;
};

} // namespace tracestore
