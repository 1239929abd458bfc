#pragma once

#include "core/error.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlpool {

/** @brief A single column value; std::nullopt is SQL NULL */
using Field = std::optional<std::string>;

/** @brief A row of column values */
using Row = std::vector<Field>;

class IDbResultSet;
class IDbStatement;

/**
 * @brief Output of a buffered query: all rows plus the result metadata
 */
struct QueryOutput {
    std::vector<Row> rows;
    std::unique_ptr<IDbResultSet> result;
};

/**
 * @brief Output of a query that keeps only one row (first or last)
 */
struct RowOutput {
    std::optional<Row> row;
    std::unique_ptr<IDbResultSet> result;
};

/**
 * @brief Result of a query on a native connection
 *
 * Either fully buffered (query/exec) or streamed row-by-row from the
 * network (start). Streaming results are only valid while the owning
 * connection is open and no other operation has been issued on it.
 */
class IDbResultSet {
public:
    virtual ~IDbResultSet() = default;

    [[nodiscard]] virtual const std::vector<std::string>& column_names() const = 0;
    [[nodiscard]] virtual uint64_t affected_rows() const = 0;
    [[nodiscard]] virtual uint64_t insert_id() const = 0;

    /**
     * @brief Next row, or std::nullopt once the result set is exhausted
     */
    [[nodiscard]] virtual Result<std::optional<Row>> get_row() = 0;

    /**
     * @brief All remaining rows
     */
    [[nodiscard]] virtual Result<std::vector<Row>> get_rows() = 0;

    /**
     * @brief First remaining row; the rest are discarded
     */
    [[nodiscard]] virtual Result<std::optional<Row>> get_first_row() = 0;

    /**
     * @brief Last remaining row; the rest are discarded
     */
    [[nodiscard]] virtual Result<std::optional<Row>> get_last_row() = 0;

    /**
     * @brief Next result of a multi-statement query or stored procedure
     * @return nullptr when there are no more results
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbResultSet>> next_result() = 0;

    /**
     * @brief Discard all unread rows
     */
    virtual Status end() = 0;

    /**
     * @brief Read the next row into `row`
     * @return END_OF_STREAM once the result set is exhausted
     */
    virtual Status scan_row(Row& row) = 0;
};

/**
 * @brief Server-side prepared statement
 */
class IDbStatement {
public:
    virtual ~IDbStatement() = default;

    [[nodiscard]] virtual Result<QueryOutput> exec(const std::vector<Field>& params) = 0;
    [[nodiscard]] virtual Result<RowOutput> exec_first(const std::vector<Field>& params) = 0;
    [[nodiscard]] virtual Result<RowOutput> exec_last(const std::vector<Field>& params) = 0;

    [[nodiscard]] virtual size_t param_count() const = 0;

    /**
     * @brief Deallocate the statement on the server
     */
    virtual Status remove() = 0;
};

/**
 * @brief Open transaction on a native connection
 */
class IDbTransaction {
public:
    virtual ~IDbTransaction() = default;

    virtual Status commit() = 0;
    virtual Status rollback() = 0;

    /**
     * @brief Bind a statement to this transaction
     */
    [[nodiscard]] virtual std::shared_ptr<IDbStatement> bind(
        std::shared_ptr<IDbStatement> stmt) = 0;

    /**
     * @brief True while the transaction is attached to an open connection
     */
    [[nodiscard]] virtual bool is_valid() const = 0;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (MYSQL*, etc.).
 * Implementations are not thread-safe and run one operation at a time,
 * with one exception: close() may be called from another thread while an
 * operation is in flight, and must abort that operation.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Timeout applied to the connect handshake
     */
    virtual void set_timeout(std::chrono::milliseconds timeout) = 0;

    virtual Status connect() = 0;

    /**
     * @brief Close (if open) and connect again
     */
    virtual Status reconnect() = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Live round trip to the server
     */
    virtual Status ping() = 0;

    /**
     * @brief Run a text query, buffering all rows
     * @param params Values for the `?` placeholders in `sql`, quoted and
     *               escaped client-side (empty: `sql` is sent unchanged)
     */
    [[nodiscard]] virtual Result<QueryOutput> query(const std::string& sql,
                                                    const std::vector<Field>& params) = 0;
    [[nodiscard]] virtual Result<RowOutput> query_first(const std::string& sql,
                                                        const std::vector<Field>& params) = 0;
    [[nodiscard]] virtual Result<RowOutput> query_last(const std::string& sql,
                                                       const std::vector<Field>& params) = 0;

    /**
     * @brief Send a query and stream its rows through the returned result
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbResultSet>> start(
        const std::string& sql, const std::vector<Field>& params) = 0;

    [[nodiscard]] virtual Result<std::shared_ptr<IDbStatement>> prepare(const std::string& sql) = 0;

    [[nodiscard]] virtual Result<std::unique_ptr<IDbTransaction>> begin() = 0;

    /**
     * @brief Select the default database
     */
    virtual Status use(const std::string& database) = 0;
};

} // namespace sqlpool
