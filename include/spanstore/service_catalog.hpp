#pragma once

#include "core/error.hpp"
#include "core/request_context.hpp"
#include "db/iconnection_pool.hpp"
#include "model/query_parameters.hpp"
#include "model/trace.hpp"
#include "spanstore/reader_options.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tracestore {

/**
 * @brief Lists the service and operation names known to the store
 *
 * Names come back sorted ascending with empty names dropped. On a storage
 * failure the error result still carries whatever was materialized.
 */
class ServiceCatalog {
public:
    ServiceCatalog(std::shared_ptr<IConnectionPool> pool, const ReaderOptions& options);

    [[nodiscard]] Result<std::vector<std::string>> list_services(const RequestContext& ctx) const;

    /// All operations, or those observed on spans of params.service_name when set
    [[nodiscard]] Result<std::vector<Operation>> list_operations(
        const RequestContext& ctx, const OperationQueryParameters& params) const;

private:
    std::shared_ptr<IConnectionPool> pool_;
    ReaderOptions options_;
};

} // namespace tracestore
