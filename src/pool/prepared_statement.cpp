#include "pool/prepared_statement.hpp"
#include "pool/pooled_connection.hpp"

namespace sqlpool {

PreparedStatement::PreparedStatement(std::shared_ptr<PooledConnection> conn,
                                     std::shared_ptr<IDbStatement> stmt,
                                     std::string sql)
    : conn_(std::move(conn)), stmt_(std::move(stmt)), sql_(std::move(sql)) {}

Result<QueryRows> PreparedStatement::exec(const std::vector<Field>& params) {
    auto out = conn_->with_timeout([conn = conn_, stmt = stmt_, params] {
        return conn->destroy_on_error([&] { return stmt->exec(params); });
    });
    if (out.is_error()) {
        return Result<QueryRows>::error(out.error());
    }

    QueryRows rows;
    rows.rows = std::move(out.value().rows);
    if (out.value().result) {
        rows.result = std::make_unique<ResultSet>(conn_, std::move(out.value().result));
    }
    return Result<QueryRows>::ok(std::move(rows));
}

Result<QueryRow> PreparedStatement::exec_first(const std::vector<Field>& params) {
    auto out = conn_->with_timeout([conn = conn_, stmt = stmt_, params] {
        return conn->destroy_on_error([&] { return stmt->exec_first(params); });
    });
    if (out.is_error()) {
        return Result<QueryRow>::error(out.error());
    }

    QueryRow row;
    row.row = std::move(out.value().row);
    if (out.value().result) {
        row.result = std::make_unique<ResultSet>(conn_, std::move(out.value().result));
    }
    return Result<QueryRow>::ok(std::move(row));
}

Result<QueryRow> PreparedStatement::exec_last(const std::vector<Field>& params) {
    auto out = conn_->with_timeout([conn = conn_, stmt = stmt_, params] {
        return conn->destroy_on_error([&] { return stmt->exec_last(params); });
    });
    if (out.is_error()) {
        return Result<QueryRow>::error(out.error());
    }

    QueryRow row;
    row.row = std::move(out.value().row);
    if (out.value().result) {
        row.result = std::make_unique<ResultSet>(conn_, std::move(out.value().result));
    }
    return Result<QueryRow>::ok(std::move(row));
}

Status PreparedStatement::remove() {
    return conn_->destroy_on_error([this] {
        auto status = stmt_->remove();
        if (status.is_ok()) {
            conn_->forget_statement(sql_);
        }
        return status;
    });
}

} // namespace sqlpool
