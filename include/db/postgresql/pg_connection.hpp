#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>
#include <vector>

namespace tracestore {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn*. All libpq calls are encapsulated here. Parameters are
 * sent out-of-line through PQexecParams in text format.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute_params(const std::string& sql,
                               const std::vector<std::string>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    /// Convert a PGresult into a DbResultSet and PQclear it
    DbResultSet consume_result(PGresult* res);

    DbResultSet process_tuples_result(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory (PQconnectdb)
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace tracestore
