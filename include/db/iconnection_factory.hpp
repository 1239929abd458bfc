#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace sqlpool {

/**
 * @brief Everything needed to open a native connection
 *
 * protocol is "tcp" (address = host[:port]) or "unix" (address = socket path).
 */
struct ConnectionParams {
    std::string protocol{"tcp"};
    std::string address;
    std::string username;
    std::string password;
    std::string database;
};

/**
 * @brief Abstract factory for creating database connections
 *
 * Each backend provides its own factory. Connections are returned
 * unconnected; the pool applies its timeout and calls connect().
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new, unconnected database connection
     * @param params Address, protocol and credentials
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const ConnectionParams& params) = 0;
};

} // namespace sqlpool
