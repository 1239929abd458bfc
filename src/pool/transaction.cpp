#include "pool/transaction.hpp"
#include "pool/pooled_connection.hpp"
#include "pool/prepared_statement.hpp"

namespace sqlpool {

Transaction::Transaction(std::shared_ptr<PooledConnection> conn, std::shared_ptr<IDbTransaction> trans)
    : conn_(std::move(conn)), trans_(std::move(trans)) {}

Status Transaction::commit() {
    return conn_->with_timeout([conn = conn_, trans = trans_] {
        return conn->destroy_on_error([&] { return trans->commit(); });
    });
}

Status Transaction::rollback() {
    return conn_->with_timeout([conn = conn_, trans = trans_] {
        return conn->destroy_on_error([&] { return trans->rollback(); });
    });
}

std::shared_ptr<PreparedStatement> Transaction::bind(const PreparedStatement& stmt) {
    return std::make_shared<PreparedStatement>(conn_, trans_->bind(stmt.native()), stmt.sql());
}

} // namespace sqlpool
