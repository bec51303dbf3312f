#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace tracestore {

/**
 * @brief Bounded connection pool over any IConnectionFactory
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore
 * - Lazy initialization: connections created on-demand up to max
 * - Health checking: connections idle longer than idle_timeout are probed
 * - Lifetime: connections older than max_lifetime are replaced on acquire
 * - RAII: PooledConnection auto-returns on destruction
 */
class GenericConnectionPool : public IConnectionPool {
public:
    GenericConnectionPool(
        std::string store_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return store_name_; }

private:
    struct Slot {
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point last_used;
    };

    /// Create via factory and apply the configured statement timeout
    std::unique_ptr<IDbConnection> create_connection();

    /// Close a connection and forget its bookkeeping
    void discard_connection(std::unique_ptr<IDbConnection> conn);

    /// Called by PooledConnection destructor
    void return_connection(std::unique_ptr<IDbConnection> conn);

    std::string store_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, Slot> slots_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace tracestore
