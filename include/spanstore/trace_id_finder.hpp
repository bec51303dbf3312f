#pragma once

#include "core/error.hpp"
#include "core/request_context.hpp"
#include "db/iconnection_pool.hpp"
#include "model/query_parameters.hpp"
#include "model/trace_id.hpp"
#include "spanstore/filter_builder.hpp"
#include "spanstore/reader_options.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tracestore {

/**
 * @brief Resolves trace search criteria to distinct trace ids
 *
 * The span-level join yields one row per matching span, so a trace can
 * appear many times. The row fetch is over-fetched (overfetch_factor x N,
 * most recent spans first) and deduplicated client-side, keeping first
 * occurrence order, then truncated to N traces.
 */
class TraceIdFinder {
public:
    TraceIdFinder(std::shared_ptr<IConnectionPool> pool, const ReaderOptions& options);

    [[nodiscard]] Result<std::vector<TraceId>> find(const RequestContext& ctx,
                                                    const TraceQueryParameters& query) const;

    /// Number of traces a query asks for after defaulting
    [[nodiscard]] int effective_limit(const TraceQueryParameters& query) const;

    /**
     * @brief SQL and bound parameters for the row fetch
     *
     * Joins operations/services only when the filter names them. The row
     * limit is the last parameter.
     */
    [[nodiscard]] std::pair<std::string, std::vector<std::string>> build_query(
        const FilterBuilder& filter, int64_t row_limit) const;

    /// Rejects inverted start-time or duration ranges; empty when valid
    [[nodiscard]] static std::string validate(const TraceQueryParameters& query);

private:
    std::shared_ptr<IConnectionPool> pool_;
    ReaderOptions options_;
};

} // namespace tracestore
