#include "pool/connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlpool {

std::shared_ptr<ConnectionPool> ConnectionPool::create(
    PoolConfig config,
    std::shared_ptr<IConnectionFactory> factory) {

    return std::shared_ptr<ConnectionPool>(
        new ConnectionPool(std::move(config), std::move(factory)));
}

ConnectionPool::ConnectionPool(PoolConfig config, std::shared_ptr<IConnectionFactory> factory)
    : config_(std::move(config)),
      factory_(std::move(factory)),
      name_(std::format("{}@{}/{}", config_.username, config_.address, config_.database)),
      idle_connections_(config_.max_connections) {

    utils::log::info(std::format(
        "ConnectionPool initialized for '{}': max={}, max_age={}s, connect_timeout={}ms, request_timeout={}ms, keep_alive={}",
        name_, config_.max_connections, config_.max_connection_age.count(),
        config_.connect_timeout.count(), config_.request_timeout.count(),
        utils::booltostr(config_.keep_connections_alive)));
}

ConnectionPool::~ConnectionPool() {
    drain();
}

Result<std::shared_ptr<PooledConnection>> ConnectionPool::lease() {
    using LeaseResult = Result<std::shared_ptr<PooledConnection>>;

    if (shutdown_.load(std::memory_order_acquire)) {
        return LeaseResult::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Connection pool '{}' has been drained", name_));
    }

    for (;;) {
        // Idle connection available right away. It may have gone stale in
        // the queue, so it is verified even though nobody is waiting.
        if (auto idle = idle_connections_.try_pop()) {
            if ((*idle)->verify()) {
                return LeaseResult::ok(std::move(*idle));
            }
            continue;
        }

        // Below capacity: open a new connection
        {
            std::lock_guard lock(mutex_);
            if (open_connections_.size() < config_.max_connections) {
                return create_connection_locked();
            }
            ++pending_;
        }

        // At capacity: wait for a release or a backfill
        auto idle = idle_connections_.pop_for(config_.connect_timeout);
        {
            std::lock_guard lock(mutex_);
            --pending_;
        }

        if (!idle) {
            const auto current = size();
            utils::log::warn(std::format("Connection pool '{}' exhausted (total: {}, avail: {}, max: {})",
                name_, current.total, current.available, config_.max_connections));
            return LeaseResult::error(ErrorCategory::POOL_EXHAUSTED, std::format(
                "Timeout reached while waiting for SQL connection (total: {}, avail: {}, max: {})",
                current.total, current.available, config_.max_connections));
        }

        if ((*idle)->verify()) {
            return LeaseResult::ok(std::move(*idle));
        }
    }
}

Status ConnectionPool::release(const std::shared_ptr<PooledConnection>& conn) {
    if (!conn || conn->pool().get() != this) {
        return Status::error(ErrorCategory::CONNECTION_NOT_IN_POOL, "Connection not associated with a pool");
    }
    return conn->release();
}

PoolSize ConnectionPool::size() const {
    std::lock_guard lock(mutex_);
    return PoolSize{open_connections_.size(), idle_connections_.size()};
}

Result<std::chrono::microseconds> ConnectionPool::ping() {
    auto leased = lease();
    if (leased.is_error()) {
        return Result<std::chrono::microseconds>::error(leased.error());
    }
    auto conn = std::move(leased.value());

    utils::Timer timer;
    auto out = conn->query("SELECT 1");
    const auto elapsed = timer.elapsed_us();

    // A fatal error has already destroyed the connection
    if (conn->is_in_pool()) {
        if (auto status = conn->release(); status.is_error()) {
            utils::log::warn(std::format("Ping on '{}': release failed: {}",
                name_, status.error_message()));
        }
    }

    if (out.is_error()) {
        return Result<std::chrono::microseconds>::error(out.error());
    }
    return Result<std::chrono::microseconds>::ok(elapsed);
}

void ConnectionPool::drain() {
    shutdown_.store(true, std::memory_order_release);

    auto idle = idle_connections_.drain();
    for (auto& conn : idle) {
        conn->destroy();
    }

    utils::log::info(std::format("ConnectionPool drained for '{}' ({} idle connections closed)",
        name_, idle.size()));
}

Result<std::shared_ptr<PooledConnection>> ConnectionPool::create_connection_locked() {
    using CreateResult = Result<std::shared_ptr<PooledConnection>>;

    auto native = factory_->create(config_.connection_params());
    if (!native) {
        utils::log::warn(std::format("Connection factory returned no connection for '{}'", name_));
        return CreateResult::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Failed to create connection for '{}'", name_));
    }
    native->set_timeout(config_.connect_timeout);

    std::shared_ptr<PooledConnection> conn(new PooledConnection(std::move(native), config_));
    if (auto status = conn->connect(); status.is_error()) {
        utils::log::warn(std::format("Failed to open connection for '{}': {}",
            name_, status.error().to_string()));
        // Not attached yet: dropping it only closes the native connection
        return CreateResult::error(status.error());
    }

    conn->attach(weak_from_this());
    open_connections_.insert(conn.get());
    return CreateResult::ok(std::move(conn));
}

bool ConnectionPool::return_to_idle(std::shared_ptr<PooledConnection>& conn) {
    if (shutdown_.load(std::memory_order_acquire)) {
        return false;
    }
    return idle_connections_.try_push(conn);
}

void ConnectionPool::on_connection_destroyed(PooledConnection& conn) {
    std::shared_ptr<PooledConnection> replacement;

    {
        std::lock_guard lock(mutex_);
        if (open_connections_.erase(&conn) == 0) {
            return;  // Already unregistered by a concurrent destroy
        }
        conn.detach();

        if (pending_ == 0 || shutdown_.load(std::memory_order_acquire)) {
            return;
        }

        // Callers are blocked in lease(): hand them a replacement
        auto created = create_connection_locked();
        if (created.is_error()) {
            utils::log::warn(std::format("Backfill for '{}' failed: {}",
                name_, created.error().to_string()));
            return;
        }
        replacement = std::move(created.value());
        if (idle_connections_.try_push(replacement)) {
            return;
        }
        open_connections_.erase(replacement.get());
        replacement->detach();
    }
    // replacement (if still held) closes here, outside the lock
}

} // namespace sqlpool
