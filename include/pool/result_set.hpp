#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlpool {

class PooledConnection;

/**
 * @brief Query result bound to the pooled connection that produced it
 *
 * Rows of streamed results are read lazily from the network, so every
 * read goes through the connection's error classification: a fatal error
 * while iterating destroys the connection exactly like a failed query.
 */
class ResultSet {
public:
    ResultSet(std::shared_ptr<PooledConnection> conn, std::unique_ptr<IDbResultSet> result);

    ResultSet(const ResultSet&) = delete;
    ResultSet& operator=(const ResultSet&) = delete;

    [[nodiscard]] const std::vector<std::string>& column_names() const { return result_->column_names(); }
    [[nodiscard]] uint64_t affected_rows() const { return result_->affected_rows(); }
    [[nodiscard]] uint64_t insert_id() const { return result_->insert_id(); }

    [[nodiscard]] Result<std::optional<Row>> get_row();
    [[nodiscard]] Result<std::vector<Row>> get_rows();
    [[nodiscard]] Result<std::optional<Row>> get_first_row();
    [[nodiscard]] Result<std::optional<Row>> get_last_row();

    /**
     * @brief Next result of a multi-statement query
     * @return nullptr when there are no more results
     */
    [[nodiscard]] Result<std::unique_ptr<ResultSet>> next_result();

    /**
     * @brief Discard all unread rows
     */
    Status end();

    /**
     * @brief Read the next row straight from the network into `row`
     * @return END_OF_STREAM after the last row (connection stays pooled)
     */
    Status scan_row(Row& row);

    [[nodiscard]] const std::shared_ptr<PooledConnection>& connection() const { return conn_; }

private:
    std::shared_ptr<PooledConnection> conn_;
    std::unique_ptr<IDbResultSet> result_;
};

/**
 * @brief All rows of a query plus its result metadata
 */
struct QueryRows {
    std::vector<Row> rows;
    std::unique_ptr<ResultSet> result;
};

/**
 * @brief A single row (first or last) of a query plus its result metadata
 */
struct QueryRow {
    std::optional<Row> row;
    std::unique_ptr<ResultSet> result;
};

} // namespace sqlpool
