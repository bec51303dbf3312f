#include "spanstore/store_session.hpp"
#include "core/utils.hpp"
#include <format>

namespace tracestore {

Result<StoreSession> StoreSession::open(IConnectionPool& pool,
                                        const RequestContext& ctx,
                                        std::chrono::milliseconds timeout,
                                        const std::string& context) {
    if (ctx.should_stop()) {
        return Result<StoreSession>::error(ErrorCategory::CANCELLED, ctx.stop_reason(), context);
    }

    auto conn = pool.acquire(timeout);
    if (!conn || !conn->is_valid()) {
        utils::log::warn(std::format("{}: failed to acquire connection from pool '{}'", context, pool.name()));
        return Result<StoreSession>::error(ErrorCategory::STORAGE_ERROR,
            std::format("Failed to acquire database connection from pool '{}'", pool.name()), context);
    }

    return Result<StoreSession>::ok(StoreSession(std::move(conn)));
}

Result<DbResultSet> StoreSession::query(const RequestContext& ctx,
                                        const std::string& sql,
                                        const std::vector<std::string>& params,
                                        const std::string& context) {
    if (ctx.should_stop()) {
        return Result<DbResultSet>::error(ErrorCategory::CANCELLED, ctx.stop_reason(), context);
    }

    utils::Timer timer;
    auto rs = conn_->get()->execute_params(sql, params);

    if (!rs.success) {
        utils::log::warn(std::format("{}: query failed: {}", context, rs.error_message));
        return Result<DbResultSet>::error(ErrorCategory::STORAGE_ERROR, std::move(rs.error_message), context);
    }

    // The call was not interruptible; drop what it returned
    if (ctx.should_stop()) {
        return Result<DbResultSet>::error(ErrorCategory::CANCELLED, ctx.stop_reason(), context);
    }

    utils::log::debug(std::format("{}: {} rows in {}us (connection held {}us)",
        context, rs.rows.size(), timer.elapsed_us().count(), conn_->held_for().count()));
    return Result<DbResultSet>::ok(std::move(rs));
}

Result<DbResultSet> StoreSession::run(IConnectionPool& pool,
                                      const RequestContext& ctx,
                                      std::chrono::milliseconds timeout,
                                      const std::string& sql,
                                      const std::vector<std::string>& params,
                                      const std::string& context) {
    auto session = open(pool, ctx, timeout, context);
    if (session.is_error()) {
        return Result<DbResultSet>::error(session.error_category(), session.error_message(), context);
    }
    return session.value().query(ctx, sql, params, context);
}

} // namespace tracestore
