#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <memory>

namespace sqlpool {

class PooledConnection;
class PreparedStatement;

/**
 * @brief Transaction on a pooled connection
 *
 * Statements inside the transaction are issued through connection()
 * or through statements bound with bind().
 */
class Transaction {
public:
    Transaction(std::shared_ptr<PooledConnection> conn, std::shared_ptr<IDbTransaction> trans);

    Status commit();
    Status rollback();

    /**
     * @brief Bind a prepared statement to this transaction
     */
    [[nodiscard]] std::shared_ptr<PreparedStatement> bind(const PreparedStatement& stmt);

    [[nodiscard]] bool is_valid() const { return trans_->is_valid(); }

    [[nodiscard]] const std::shared_ptr<PooledConnection>& connection() const { return conn_; }

private:
    std::shared_ptr<PooledConnection> conn_;
    std::shared_ptr<IDbTransaction> trans_;
};

} // namespace sqlpool
