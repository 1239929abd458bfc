#include "pool/result_set.hpp"
#include "pool/pooled_connection.hpp"

namespace sqlpool {

ResultSet::ResultSet(std::shared_ptr<PooledConnection> conn, std::unique_ptr<IDbResultSet> result)
    : conn_(std::move(conn)), result_(std::move(result)) {}

Result<std::optional<Row>> ResultSet::get_row() {
    return conn_->destroy_on_error([this] { return result_->get_row(); });
}

Result<std::vector<Row>> ResultSet::get_rows() {
    return conn_->destroy_on_error([this] { return result_->get_rows(); });
}

Result<std::optional<Row>> ResultSet::get_first_row() {
    return conn_->destroy_on_error([this] { return result_->get_first_row(); });
}

Result<std::optional<Row>> ResultSet::get_last_row() {
    return conn_->destroy_on_error([this] { return result_->get_last_row(); });
}

Result<std::unique_ptr<ResultSet>> ResultSet::next_result() {
    auto next = conn_->destroy_on_error([this] { return result_->next_result(); });
    if (next.is_error()) {
        return Result<std::unique_ptr<ResultSet>>::error(next.error());
    }
    if (!next.value()) {
        return Result<std::unique_ptr<ResultSet>>::ok(nullptr);
    }
    return Result<std::unique_ptr<ResultSet>>::ok(
        std::make_unique<ResultSet>(conn_, std::move(next.value())));
}

Status ResultSet::end() {
    return conn_->destroy_on_error([this] { return result_->end(); });
}

Status ResultSet::scan_row(Row& row) {
    return conn_->destroy_on_error([this, &row] { return result_->scan_row(row); });
}

} // namespace sqlpool
