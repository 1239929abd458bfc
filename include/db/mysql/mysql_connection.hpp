#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include "db/mysql/mysql_handle.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace sqlpool {

/**
 * @brief MySQL connection implementing IDbConnection
 *
 * Wraps MYSQL* handle (MariaDB Connector/C or libmysqlclient).
 * All MySQL C API calls are encapsulated here and in the result set and
 * statement classes that share the handle.
 *
 * Connects with multi-statement and multi-result support so that
 * ResultSet::next_result() can walk batches and stored procedure output.
 */
class MysqlConnection : public IDbConnection {
public:
    explicit MysqlConnection(ConnectionParams params);
    ~MysqlConnection() override;

    MysqlConnection(const MysqlConnection&) = delete;
    MysqlConnection& operator=(const MysqlConnection&) = delete;

    void set_timeout(std::chrono::milliseconds timeout) override { timeout_ = timeout; }

    Status connect() override;
    Status reconnect() override;
    void close() override;
    [[nodiscard]] bool is_connected() const override;
    Status ping() override;

    [[nodiscard]] Result<QueryOutput> query(const std::string& sql,
                                            const std::vector<Field>& params) override;
    [[nodiscard]] Result<RowOutput> query_first(const std::string& sql,
                                                const std::vector<Field>& params) override;
    [[nodiscard]] Result<RowOutput> query_last(const std::string& sql,
                                               const std::vector<Field>& params) override;
    [[nodiscard]] Result<std::unique_ptr<IDbResultSet>> start(
        const std::string& sql, const std::vector<Field>& params) override;
    [[nodiscard]] Result<std::shared_ptr<IDbStatement>> prepare(const std::string& sql) override;
    [[nodiscard]] Result<std::unique_ptr<IDbTransaction>> begin() override;
    Status use(const std::string& database) override;

private:
    // mysql_real_query with placeholders expanded (op_mutex held)
    [[nodiscard]] Status send_query_locked(const std::string& sql, const std::vector<Field>& params);

    std::shared_ptr<MysqlHandle> handle_;
    ConnectionParams params_;
    std::chrono::milliseconds timeout_{0};
};

/**
 * @brief Transaction opened with START TRANSACTION
 *
 * Statements prepared on the same session already run inside it, so
 * bind() returns the statement unchanged.
 */
class MysqlTransaction : public IDbTransaction {
public:
    MysqlTransaction(std::shared_ptr<MysqlHandle> handle, uint64_t generation);

    Status commit() override;
    Status rollback() override;
    [[nodiscard]] std::shared_ptr<IDbStatement> bind(std::shared_ptr<IDbStatement> stmt) override;
    [[nodiscard]] bool is_valid() const override;

private:
    std::shared_ptr<MysqlHandle> handle_;
    uint64_t generation_;
    std::atomic<bool> finished_{false};
};

/**
 * @brief Where mysql_real_connect should go
 */
struct MysqlEndpoint {
    std::string host;
    unsigned int port = 3306;
    std::string unix_socket;   // Set for protocol "unix"
};

/**
 * @brief MySQL connection factory
 *
 * Creates unconnected MysqlConnection instances. Addresses are
 *   tcp:  host, host:port, [ipv6]:port
 *   unix: /path/to/mysqld.sock
 */
class MysqlConnectionFactory : public IConnectionFactory {
public:
    MysqlConnectionFactory();

    [[nodiscard]] std::unique_ptr<IDbConnection> create(const ConnectionParams& params) override;

    [[nodiscard]] static Result<MysqlEndpoint> parse_address(const std::string& protocol,
                                                             const std::string& address);
};

} // namespace sqlpool
