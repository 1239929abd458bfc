#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include "pool/result_set.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sqlpool {

class PooledConnection;

/**
 * @brief Prepared statement cached on a pooled connection
 *
 * Executions are bounded by the pool's request timeout and classified
 * like any other operation on the connection.
 */
class PreparedStatement {
public:
    PreparedStatement(std::shared_ptr<PooledConnection> conn,
                      std::shared_ptr<IDbStatement> stmt,
                      std::string sql);

    [[nodiscard]] Result<QueryRows> exec(const std::vector<Field>& params = {});
    [[nodiscard]] Result<QueryRow> exec_first(const std::vector<Field>& params = {});
    [[nodiscard]] Result<QueryRow> exec_last(const std::vector<Field>& params = {});

    /**
     * @brief Deallocate the statement and drop it from the connection's cache
     */
    Status remove();

    /** @brief SQL text the statement was prepared from */
    [[nodiscard]] const std::string& sql() const { return sql_; }

    [[nodiscard]] size_t param_count() const { return stmt_->param_count(); }

    [[nodiscard]] const std::shared_ptr<IDbStatement>& native() const { return stmt_; }
    [[nodiscard]] const std::shared_ptr<PooledConnection>& connection() const { return conn_; }

private:
    std::shared_ptr<PooledConnection> conn_;
    std::shared_ptr<IDbStatement> stmt_;
    std::string sql_;
};

} // namespace sqlpool
