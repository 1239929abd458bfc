#pragma once

#include "core/error.hpp"
#include "db/iconnection_factory.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace sqlpool {

// Forward declarations
class PooledConnection;

/**
 * @brief Pool configuration
 *
 * max_connection_age and request_timeout of zero mean "no limit".
 */
struct PoolConfig {
    std::string address;
    std::string protocol{"tcp"};
    std::string username;
    std::string password;
    std::string database;
    size_t max_connections = 10;
    std::chrono::seconds max_connection_age{0};
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds request_timeout{30000};
    bool keep_connections_alive = true;
    std::string charset;
    std::string collation;

    [[nodiscard]] ConnectionParams connection_params() const {
        return ConnectionParams{protocol, address, username, password, database};
    }
};

/**
 * @brief Snapshot of pool membership
 */
struct PoolSize {
    size_t total = 0;      // Open connections (leased + idle)
    size_t available = 0;  // Idle connections ready for reuse
};

/**
 * @brief Abstract connection pool interface
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Lease a connection (blocking up to the connect timeout)
     * @return Verified connection, or POOL_EXHAUSTED on timeout
     */
    [[nodiscard]] virtual Result<std::shared_ptr<PooledConnection>> lease() = 0;

    /**
     * @brief Return a leased connection
     * @return CONNECTION_NOT_IN_POOL if it was destroyed or belongs elsewhere
     */
    virtual Status release(const std::shared_ptr<PooledConnection>& conn) = 0;

    /**
     * @brief Total and idle connection counts (thread-safe)
     */
    [[nodiscard]] virtual PoolSize size() const = 0;

    /**
     * @brief Round-trip a trivial query on a leased connection
     * @return Elapsed time of the query
     */
    [[nodiscard]] virtual Result<std::chrono::microseconds> ping() = 0;

    /**
     * @brief Drain pool - close all idle connections, stop pooling
     */
    virtual void drain() = 0;

    /**
     * @brief user@address/database, for logging
     */
    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace sqlpool
