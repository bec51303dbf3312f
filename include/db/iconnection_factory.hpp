#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace tracestore {

/**
 * @brief Abstract factory for creating database connections
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string libpq conninfo string
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace tracestore
