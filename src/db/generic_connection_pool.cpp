#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace tracestore {

GenericConnectionPool::GenericConnectionPool(
    std::string store_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : store_name_(std::move(store_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm with min_connections
    for (size_t i = 0; i < config_.min_connections && i < config_.max_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for '{}'",
                i + 1, store_name_));
            continue;
        }
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard lock(mutex_);
        slots_[conn.get()] = Slot{now, now};
        idle_connections_.emplace_back(std::move(conn));
    }

    utils::log::info(std::format("ConnectionPool initialized for '{}': {} connections (min={}, max={})",
        store_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Blocks while every connection is handed out
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Shutdown may have started while we waited
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    Slot slot{};
    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            const auto it = slots_.find(conn.get());
            if (it != slots_.end()) slot = it->second;
        }
    }

    const auto now = std::chrono::steady_clock::now();
    bool replace = false;

    if (conn) {
        if (config_.max_lifetime.count() > 0 && now - slot.created_at > config_.max_lifetime) {
            connections_recycled_.fetch_add(1, std::memory_order_relaxed);
            replace = true;
        } else if (now - slot.last_used > config_.idle_timeout &&
                   !conn->is_healthy(config_.health_check_query)) {
            // Recently used connections skip the probe round trip
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            replace = true;
        }
    }

    if (replace) {
        discard_connection(std::move(conn));
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        std::lock_guard lock(mutex_);
        slots_[conn.get()] = Slot{now, now};
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c) {
        this->return_connection(std::move(c));
    };

    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);
    for (auto& conn : idle_connections_) {
        if (conn) {
            slots_.erase(conn.get());
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }
    idle_connections_.clear();

    utils::log::info(std::format("ConnectionPool drained for '{}'", store_name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (!conn) {
        return nullptr;
    }
    if (config_.query_timeout_ms > 0 && !conn->set_query_timeout(config_.query_timeout_ms)) {
        utils::log::warn(std::format("Failed to set statement_timeout={}ms on new connection for '{}'",
            config_.query_timeout_ms, store_name_));
    }
    total_connections_.fetch_add(1, std::memory_order_relaxed);
    return conn;
}

void GenericConnectionPool::discard_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) return;
    {
        std::lock_guard lock(mutex_);
        slots_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (shutdown_.load(std::memory_order_acquire) || !conn->is_connected()) {
        discard_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        slots_[conn.get()].last_used = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace tracestore
