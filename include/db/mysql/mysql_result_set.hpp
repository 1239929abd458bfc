#pragma once

#include "db/idb_connection.hpp"
#include "db/mysql/mysql_handle.hpp"
#include <mysql/mysql.h>
#include <memory>
#include <string>
#include <vector>

namespace sqlpool {

/**
 * @brief MySQL result implementing IDbResultSet
 *
 * Wraps a MYSQL_RES taken with mysql_store_result (buffered) or
 * mysql_use_result (streaming). A streaming result keeps reading from the
 * network, so no other statement may run on the connection until it is
 * exhausted or ended.
 *
 * The MYSQL_RES is registered with the handle. Once the handle closes or
 * reconnects, the result belongs to nobody here and is only dropped.
 */
class MysqlResultSet : public IDbResultSet {
public:
    MysqlResultSet(std::shared_ptr<MysqlHandle> handle,
                   MYSQL_RES* res,
                   bool streaming,
                   uint64_t affected_rows,
                   uint64_t insert_id);
    ~MysqlResultSet() override;

    MysqlResultSet(const MysqlResultSet&) = delete;
    MysqlResultSet& operator=(const MysqlResultSet&) = delete;

    /**
     * @brief Take the handle's current result (op_mutex held)
     */
    [[nodiscard]] static Result<std::unique_ptr<MysqlResultSet>> take_current(
        const std::shared_ptr<MysqlHandle>& handle, bool streaming);

    /**
     * @brief Metadata-only result of a prepared statement; has no further results
     */
    [[nodiscard]] static std::unique_ptr<MysqlResultSet> statement_result(
        std::shared_ptr<MysqlHandle> handle,
        std::vector<std::string> columns,
        uint64_t affected_rows,
        uint64_t insert_id);

    [[nodiscard]] const std::vector<std::string>& column_names() const override { return columns_; }
    [[nodiscard]] uint64_t affected_rows() const override { return affected_rows_; }
    [[nodiscard]] uint64_t insert_id() const override { return insert_id_; }

    [[nodiscard]] Result<std::optional<Row>> get_row() override;
    [[nodiscard]] Result<std::vector<Row>> get_rows() override;
    [[nodiscard]] Result<std::optional<Row>> get_first_row() override;
    [[nodiscard]] Result<std::optional<Row>> get_last_row() override;
    [[nodiscard]] Result<std::unique_ptr<IDbResultSet>> next_result() override;
    Status end() override;
    Status scan_row(Row& row) override;

    // Remaining rows, op_mutex held
    [[nodiscard]] Result<std::vector<Row>> read_all_locked();

private:
    // Next row, op_mutex held
    [[nodiscard]] Result<std::optional<Row>> fetch_locked();

    void free_locked();

    // res_ still belongs to the handle's current session (op_mutex held)
    [[nodiscard]] bool owned_locked() const;

    std::shared_ptr<MysqlHandle> handle_;
    MYSQL_RES* res_;
    bool streaming_;
    uint64_t generation_;
    std::vector<std::string> columns_;
    uint64_t affected_rows_;
    uint64_t insert_id_;

    // False for prepared statement results
    bool chained_ = true;
};

} // namespace sqlpool
