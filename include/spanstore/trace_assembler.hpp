#pragma once

#include "core/error.hpp"
#include "core/request_context.hpp"
#include "db/iconnection_pool.hpp"
#include "model/trace.hpp"
#include "spanstore/reader_options.hpp"
#include "spanstore/store_session.hpp"
#include "spanstore/trace_grouper.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tracestore {

/**
 * @brief Loads the spans of trace ids and rebuilds them as Trace aggregates
 *
 * Per trace: one query for the spans (joined to operations and services,
 * ordered by start time) and one for their outbound references, both on the
 * same pooled connection.
 *
 * Batch assembly fans out over at most max_parallel_fetches workers. Each
 * fetch takes its own connection; workers keep results locally and the
 * calling thread merges them. The first failure stops the remaining
 * workers and is returned together with the traces already assembled.
 */
class TraceAssembler {
public:
    TraceAssembler(std::shared_ptr<IConnectionPool> pool, const ReaderOptions& options);

    /**
     * @brief Assemble one trace
     * @return Empty Trace (not an error) when no span has this id
     */
    [[nodiscard]] Result<Trace> assemble(const RequestContext& ctx, const TraceId& id) const;

    /**
     * @brief Assemble every id; ids with no spans are omitted
     *
     * Output follows the order of `ids`. On failure the error carries the
     * traces assembled before the batch stopped.
     */
    [[nodiscard]] Result<std::vector<Trace>> assemble_batch(
        const RequestContext& ctx, const std::vector<TraceId>& ids) const;

private:
    Result<std::vector<SpanRow>> load_spans(const RequestContext& ctx, StoreSession& session,
                                            const TraceId& id, const std::string& context) const;

    Result<bool> load_references(const RequestContext& ctx, StoreSession& session,
                                 const TraceId& id, TraceGrouper& grouper,
                                 const std::string& context) const;

    std::shared_ptr<IConnectionPool> pool_;
    ReaderOptions options_;
};

} // namespace tracestore
