#include "spanstore/service_catalog.hpp"
#include "spanstore/store_session.hpp"
#include <algorithm>
#include <format>

namespace tracestore {

namespace {

constexpr const char* kSelectServices =
    "SELECT service_name\n"
    "FROM services\n"
    "ORDER BY service_name ASC";

constexpr const char* kSelectOperations =
    "SELECT DISTINCT operation_name\n"
    "FROM operations\n"
    "ORDER BY operation_name ASC";

constexpr const char* kSelectOperationsForService =
    "SELECT DISTINCT operation.operation_name\n"
    "FROM operations AS operation\n"
    "JOIN spans AS span ON span.operation_id = operation.id\n"
    "JOIN services AS service ON service.id = span.service_id\n"
    "WHERE service.service_name = $1::text\n"
    "ORDER BY operation.operation_name ASC";

// First column of every row, empty names dropped, byte-wise ascending
// regardless of the server's collation
std::vector<std::string> non_empty_names(const DbResultSet& rs) {
    std::vector<std::string> names;
    names.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (!row.empty() && !row[0].empty()) {
            names.push_back(row[0]);
        }
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

} // anonymous namespace

ServiceCatalog::ServiceCatalog(std::shared_ptr<IConnectionPool> pool, const ReaderOptions& options)
    : pool_(std::move(pool)), options_(options) {}

Result<std::vector<std::string>> ServiceCatalog::list_services(const RequestContext& ctx) const {
    const std::string context = "get_services";
    auto rs = StoreSession::run(*pool_, ctx, options_.acquire_timeout, kSelectServices, {}, context);
    if (rs.is_error()) {
        return Result<std::vector<std::string>>::partial(
            {}, rs.error_category(), rs.error_message(), rs.context());
    }
    return Result<std::vector<std::string>>::ok(non_empty_names(rs.value()));
}

Result<std::vector<Operation>> ServiceCatalog::list_operations(
    const RequestContext& ctx, const OperationQueryParameters& params) const {

    const bool by_service = !params.service_name.empty();
    const std::string context = by_service
        ? std::format("get_operations service={}", params.service_name)
        : std::string("get_operations");

    std::vector<std::string> bind;
    if (by_service) bind.push_back(params.service_name);

    auto rs = StoreSession::run(*pool_, ctx, options_.acquire_timeout,
                                by_service ? kSelectOperationsForService : kSelectOperations,
                                bind, context);
    if (rs.is_error()) {
        return Result<std::vector<Operation>>::partial(
            {}, rs.error_category(), rs.error_message(), rs.context());
    }

    std::vector<Operation> operations;
    for (auto& name : non_empty_names(rs.value())) {
        operations.push_back(Operation{std::move(name)});
    }
    return Result<std::vector<Operation>>::ok(std::move(operations));
}

} // namespace tracestore
