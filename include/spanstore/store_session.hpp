#pragma once

#include "core/error.hpp"
#include "core/request_context.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace tracestore {

/**
 * @brief One pooled connection used for a sequence of read queries
 *
 * Acquired per logical fetch and never shared across threads. Checks the
 * request context before every round trip and maps database failures to
 * STORAGE_ERROR with the server message kept verbatim.
 */
class StoreSession {
public:
    /**
     * @brief Acquire a connection for `context`
     * @return CANCELLED if the request already stopped, STORAGE_ERROR if no
     *         connection could be acquired within `timeout`
     */
    [[nodiscard]] static Result<StoreSession> open(IConnectionPool& pool,
                                                   const RequestContext& ctx,
                                                   std::chrono::milliseconds timeout,
                                                   const std::string& context);

    /**
     * @brief Run a parameterized query on this session's connection
     * @param context Operation description recorded on failure
     */
    [[nodiscard]] Result<DbResultSet> query(const RequestContext& ctx,
                                            const std::string& sql,
                                            const std::vector<std::string>& params,
                                            const std::string& context);

    /// Convenience: open a session and run a single query on it
    [[nodiscard]] static Result<DbResultSet> run(IConnectionPool& pool,
                                                 const RequestContext& ctx,
                                                 std::chrono::milliseconds timeout,
                                                 const std::string& sql,
                                                 const std::vector<std::string>& params,
                                                 const std::string& context);

private:
    explicit StoreSession(std::unique_ptr<PooledConnection> conn)
        : conn_(std::move(conn)) {}

    std::unique_ptr<PooledConnection> conn_;
};

} // namespace tracestore
