#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/idb_connection.hpp"
#include "pool/error_classifier.hpp"
#include "pool/iconnection_pool.hpp"
#include "pool/prepared_statement.hpp"
#include "pool/result_set.hpp"
#include "pool/transaction.hpp"
#include <chrono>
#include <format>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>

namespace sqlpool {

class ConnectionPool;

/**
 * @brief Database connection owned by a ConnectionPool
 *
 * Owned by the pool while idle and by exactly one caller while leased.
 * Every operation is bounded by the pool's request timeout and passes
 * through error classification: fatal errors destroy the connection,
 * recoverable ones leave it pooled. The error is always returned unchanged.
 *
 * Once destroyed the connection is detached from its pool; further
 * operations and release() return CONNECTION_NOT_IN_POOL.
 *
 * Dropping the last reference without release() destroys it.
 */
class PooledConnection : public std::enable_shared_from_this<PooledConnection> {
public:
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    /**
     * @brief Open the native connection and apply charset/collation
     */
    Status connect();

    /**
     * @brief Reopen the native connection and apply charset/collation
     */
    Status reconnect();

    /**
     * @brief Hand the connection back to its pool
     *
     * Re-verified and queued as idle when the pool keeps connections alive,
     * destroyed otherwise (or when the idle queue is full).
     */
    Status release();

    /**
     * @brief Close the native connection and leave the pool
     *
     * Idempotent. If callers are blocked in lease(), the pool opens a
     * replacement connection for them.
     */
    void destroy();

    /**
     * @brief Is the connection connected, answering pings and unexpired?
     *
     * Destroys the connection when it is not.
     */
    bool verify();

    /**
     * @brief Run a query and buffer its rows
     * @param params Values for `?` placeholders, escaped by the driver
     */
    [[nodiscard]] Result<QueryRows> query(const std::string& sql, const std::vector<Field>& params = {});
    [[nodiscard]] Result<QueryRow> query_first(const std::string& sql, const std::vector<Field>& params = {});
    [[nodiscard]] Result<QueryRow> query_last(const std::string& sql, const std::vector<Field>& params = {});

    /**
     * @brief Send a query and stream its rows through the returned result
     */
    [[nodiscard]] Result<std::unique_ptr<ResultSet>> start(const std::string& sql,
                                                           const std::vector<Field>& params = {});

    /**
     * @brief Prepared statement for `sql`, prepared once per connection
     */
    [[nodiscard]] Result<std::shared_ptr<PreparedStatement>> prepare(const std::string& sql);

    [[nodiscard]] Result<std::unique_ptr<Transaction>> begin();

    /**
     * @brief Select the database on which queries are executed
     */
    Status use(const std::string& database);

    /**
     * @brief Run `work`, allowing it the pool's request timeout
     *
     * The work runs on its own thread. If the deadline passes first the
     * native connection is closed, which aborts the statement on the server,
     * the connection is destroyed and REQUEST_TIMEOUT is returned. The
     * work's late result is discarded.
     */
    template <typename Work>
    auto with_timeout(Work work) -> std::invoke_result_t<Work&>;

    /**
     * @brief Run `work` and destroy the connection if it fails fatally
     * @see is_fatal_error
     */
    template <typename Work>
    auto destroy_on_error(Work&& work) -> std::invoke_result_t<Work&>;

    [[nodiscard]] bool is_in_pool() const;
    [[nodiscard]] bool is_connected() const { return conn_->is_connected(); }

    /**
     * @brief Expiry time, or std::nullopt when max connection age is unlimited
     */
    [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> expires_at() const { return expires_at_; }

    [[nodiscard]] size_t statement_cache_size() const;

    /**
     * @brief Pool this connection belongs to (nullptr once destroyed)
     */
    [[nodiscard]] std::shared_ptr<ConnectionPool> pool() const;

private:
    friend class ConnectionPool;
    friend class PreparedStatement;

    PooledConnection(std::unique_ptr<IDbConnection> conn, const PoolConfig& config);

    // Called by the pool once the connection is registered (pool lock held)
    void attach(std::weak_ptr<ConnectionPool> pool);

    // Called by the pool when it unregisters the connection (pool lock held)
    void detach();

    // SET NAMES ... COLLATE ... on the native connection
    Status prepare_session();

    void forget_statement(const std::string& sql);

    std::unique_ptr<IDbConnection> conn_;
    std::string charset_;
    std::string collation_;
    std::chrono::milliseconds request_timeout_;
    std::optional<std::chrono::steady_clock::time_point> expires_at_;

    // Guards pool_ and statements_
    mutable std::mutex mutex_;
    std::weak_ptr<ConnectionPool> pool_;
    std::unordered_map<std::string, std::shared_ptr<IDbStatement>> statements_;
};

// ============================================================================
// Template implementations
// ============================================================================

template <typename Work>
auto PooledConnection::with_timeout(Work work) -> std::invoke_result_t<Work&> {
    using R = std::invoke_result_t<Work&>;

    if (!is_in_pool()) {
        return R::error(ErrorCategory::CONNECTION_NOT_IN_POOL, "Connection not associated with a pool");
    }

    if (request_timeout_.count() <= 0) {
        return work();
    }

    // The task outlives this call when the deadline passes first
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(work));
    auto done = task->get_future();
    std::thread([task] { (*task)(); }).detach();

    if (done.wait_for(request_timeout_) == std::future_status::ready) {
        return done.get();
    }

    utils::log::warn(std::format("Request exceeded {}ms, closing connection",
        request_timeout_.count()));
    destroy();
    return R::error(ErrorCategory::REQUEST_TIMEOUT, "Query took too long to execute");
}

template <typename Work>
auto PooledConnection::destroy_on_error(Work&& work) -> std::invoke_result_t<Work&> {
    auto result = work();
    if (result.is_error() && is_fatal_error(result.error())) {
        utils::log::debug(std::format("Destroying connection after fatal error: {}",
            result.error().to_string()));
        destroy();
    }
    return result;
}

} // namespace sqlpool
