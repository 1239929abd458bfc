#pragma once

#include "core/bounded_queue.hpp"
#include "db/iconnection_factory.hpp"
#include "pool/iconnection_pool.hpp"
#include "pool/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace sqlpool {

/**
 * @brief Bounded pool of database connections
 *
 * Design:
 * - Bounded pool: at most max_connections open (leased + idle) at any time
 * - Lazy initialization: connections created on demand, none at construction
 * - Verification: idle connections are pinged and age-checked before reuse
 * - Blocking lease: waits up to connect_timeout for an idle connection
 * - Backfill: destroying a connection while callers wait opens a replacement
 * - Thread-safe: one mutex guards the open set and the pending-waiter count;
 *   the idle queue synchronizes itself
 *
 * The mutex is held across the connect handshake whenever a connection is
 * created, so the open-set size check and registration are atomic. Other
 * pool operations stall for the duration of that handshake.
 */
class ConnectionPool : public IConnectionPool,
                       public std::enable_shared_from_this<ConnectionPool> {
public:
    /**
     * @brief Create a pool (no connections are opened yet)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    [[nodiscard]] static std::shared_ptr<ConnectionPool> create(
        PoolConfig config,
        std::shared_ptr<IConnectionFactory> factory);

    ~ConnectionPool() override;

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Result<std::shared_ptr<PooledConnection>> lease() override;

    Status release(const std::shared_ptr<PooledConnection>& conn) override;

    PoolSize size() const override;

    Result<std::chrono::microseconds> ping() override;

    void drain() override;

    const std::string& name() const override { return name_; }

    [[nodiscard]] const PoolConfig& config() const { return config_; }

private:
    friend class PooledConnection;

    ConnectionPool(PoolConfig config, std::shared_ptr<IConnectionFactory> factory);

    /**
     * @brief Open and register a new connection (mutex_ must be held)
     */
    Result<std::shared_ptr<PooledConnection>> create_connection_locked();

    /**
     * @brief Queue a released connection as idle
     * @return false if the queue is full or the pool is drained
     */
    bool return_to_idle(std::shared_ptr<PooledConnection>& conn);

    /**
     * @brief Unregister a destroyed connection and backfill for waiters
     */
    void on_connection_destroyed(PooledConnection& conn);

    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;
    std::string name_;

    // Membership (guarded by mutex_)
    std::unordered_set<const PooledConnection*> open_connections_;
    size_t pending_ = 0;
    mutable std::mutex mutex_;

    BoundedQueue<std::shared_ptr<PooledConnection>> idle_connections_;

    std::atomic<bool> shutdown_{false};
};

} // namespace sqlpool
