#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tracestore {

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute_params(). Owns the result data
 * (copied from native result handles). SQL NULL is materialized as an
 * empty string; a statement that returns no tuples yields zero rows.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement with positional parameters
     * @param sql SQL text using $1..$N placeholders
     * @param params Text-format parameter values, bound in order
     * @return Result set with the returned rows
     */
    [[nodiscard]] virtual DbResultSet execute_params(
        const std::string& sql, const std::vector<std::string>& params) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     * @return true if connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set query timeout for subsequent queries
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace tracestore
