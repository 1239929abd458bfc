#pragma once

#include "db/idb_connection.hpp"
#include "db/mysql/mysql_handle.hpp"
#include <mysql/mysql.h>
#include <memory>
#include <string>
#include <vector>

namespace sqlpool {

/**
 * @brief MySQL server-side prepared statement implementing IDbStatement
 *
 * Parameters are sent as strings (NULL for std::nullopt) and every result
 * column is read back as a string. A statement belongs to the session it
 * was prepared on; after a reconnect it fails with a "server gone" error.
 */
class MysqlStatement : public IDbStatement {
public:
    // op_mutex must be held
    MysqlStatement(std::shared_ptr<MysqlHandle> handle, MYSQL_STMT* stmt);
    ~MysqlStatement() override;

    MysqlStatement(const MysqlStatement&) = delete;
    MysqlStatement& operator=(const MysqlStatement&) = delete;

    [[nodiscard]] Result<QueryOutput> exec(const std::vector<Field>& params) override;
    [[nodiscard]] Result<RowOutput> exec_first(const std::vector<Field>& params) override;
    [[nodiscard]] Result<RowOutput> exec_last(const std::vector<Field>& params) override;

    [[nodiscard]] size_t param_count() const override { return param_count_; }

    Status remove() override;

private:
    [[nodiscard]] Result<QueryOutput> exec_locked(const std::vector<Field>& params);
    [[nodiscard]] Result<std::vector<Row>> fetch_rows_locked(MYSQL_RES* meta, std::vector<std::string>& columns);
    [[nodiscard]] Error stmt_error() const;

    std::shared_ptr<MysqlHandle> handle_;
    MYSQL_STMT* stmt_;          // Guarded by handle_->op_mutex
    uint64_t generation_;
    size_t param_count_;
};

} // namespace sqlpool
