#pragma once

#include "db/idb_connection.hpp"
#include <chrono>
#include <functional>
#include <memory>

namespace tracestore {

/**
 * @brief RAII handle for a pooled database connection
 *
 * Returns the connection to its pool on destruction. Move-only; one handle
 * is used by exactly one thread at a time.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /// Time since this handle took the connection out of the pool
    [[nodiscard]] std::chrono::microseconds held_for() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - acquired_at_);
    }

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    std::chrono::steady_clock::time_point acquired_at_;
};

} // namespace tracestore
