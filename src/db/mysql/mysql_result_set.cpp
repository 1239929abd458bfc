#include "db/mysql/mysql_result_set.hpp"

namespace sqlpool {

MysqlResultSet::MysqlResultSet(std::shared_ptr<MysqlHandle> handle,
                               MYSQL_RES* res,
                               bool streaming,
                               uint64_t affected_rows,
                               uint64_t insert_id)
    : handle_(std::move(handle)),
      res_(res),
      streaming_(streaming),
      generation_(handle_->generation.load()),
      affected_rows_(affected_rows),
      insert_id_(insert_id) {
    if (res_) {
        handle_->track_result(res_, streaming_);
        const unsigned int num_fields = mysql_num_fields(res_);
        const MYSQL_FIELD* fields = mysql_fetch_fields(res_);
        columns_.reserve(num_fields);
        for (unsigned int i = 0; i < num_fields; ++i) {
            columns_.emplace_back(fields[i].name);
        }
    }
}

MysqlResultSet::~MysqlResultSet() {
    if (res_) {
        MysqlHandle::Operation op(*handle_);
        free_locked();
    }
}

Result<std::unique_ptr<MysqlResultSet>> MysqlResultSet::take_current(
    const std::shared_ptr<MysqlHandle>& handle, bool streaming) {

    MYSQL* mysql = handle->mysql;
    MYSQL_RES* res = streaming ? mysql_use_result(mysql) : mysql_store_result(mysql);

    if (!res && mysql_field_count(mysql) != 0) {
        // Expected a result set but got none
        return Result<std::unique_ptr<MysqlResultSet>>::error(handle->last_error());
    }

    // Row count of an unbuffered result is unknown until it is read
    const uint64_t affected = (res && streaming) ? 0 : static_cast<uint64_t>(mysql_affected_rows(mysql));

    return Result<std::unique_ptr<MysqlResultSet>>::ok(std::make_unique<MysqlResultSet>(
        handle, res, streaming, affected, static_cast<uint64_t>(mysql_insert_id(mysql))));
}

std::unique_ptr<MysqlResultSet> MysqlResultSet::statement_result(
    std::shared_ptr<MysqlHandle> handle,
    std::vector<std::string> columns,
    uint64_t affected_rows,
    uint64_t insert_id) {

    auto result = std::make_unique<MysqlResultSet>(std::move(handle), nullptr, false, affected_rows, insert_id);
    result->columns_ = std::move(columns);
    result->chained_ = false;
    return result;
}

bool MysqlResultSet::owned_locked() const {
    return handle_->mysql != nullptr && handle_->generation.load() == generation_;
}

void MysqlResultSet::free_locked() {
    if (res_) {
        if (owned_locked()) {
            handle_->free_result(res_);
        }
        res_ = nullptr;
    }
}

Result<std::optional<Row>> MysqlResultSet::fetch_locked() {
    if (!res_) {
        return Result<std::optional<Row>>::ok(std::nullopt);
    }

    if (!owned_locked()) {
        // Freed along with the closed session
        res_ = nullptr;
        return Result<std::optional<Row>>::error(closed_connection_error());
    }

    MYSQL_ROW row = mysql_fetch_row(res_);
    if (!row) {
        if (streaming_ && mysql_errno(handle_->mysql) != 0) {
            auto err = handle_->last_error();
            free_locked();
            return Result<std::optional<Row>>::error(std::move(err));
        }
        free_locked();
        return Result<std::optional<Row>>::ok(std::nullopt);
    }

    const unsigned int num_fields = mysql_num_fields(res_);
    const unsigned long* lengths = mysql_fetch_lengths(res_);

    Row out;
    out.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        if (row[i]) {
            out.emplace_back(std::string(row[i], lengths[i]));
        } else {
            out.emplace_back(std::nullopt);
        }
    }
    return Result<std::optional<Row>>::ok(std::move(out));
}

Result<std::vector<Row>> MysqlResultSet::read_all_locked() {
    std::vector<Row> rows;
    while (true) {
        auto row = fetch_locked();
        if (row.is_error()) {
            return Result<std::vector<Row>>::error(row.error());
        }
        if (!row.value()) {
            break;
        }
        rows.push_back(std::move(*row.value()));
    }
    return Result<std::vector<Row>>::ok(std::move(rows));
}

Result<std::optional<Row>> MysqlResultSet::get_row() {
    MysqlHandle::Operation op(*handle_);
    return fetch_locked();
}

Result<std::vector<Row>> MysqlResultSet::get_rows() {
    MysqlHandle::Operation op(*handle_);
    return read_all_locked();
}

Result<std::optional<Row>> MysqlResultSet::get_first_row() {
    MysqlHandle::Operation op(*handle_);
    auto first = fetch_locked();
    if (first.is_ok()) {
        free_locked();
    }
    return first;
}

Result<std::optional<Row>> MysqlResultSet::get_last_row() {
    MysqlHandle::Operation op(*handle_);
    std::optional<Row> last;
    while (true) {
        auto row = fetch_locked();
        if (row.is_error()) {
            return row;
        }
        if (!row.value()) {
            break;
        }
        last = std::move(row.value());
    }
    return Result<std::optional<Row>>::ok(std::move(last));
}

Result<std::unique_ptr<IDbResultSet>> MysqlResultSet::next_result() {
    using NextResult = Result<std::unique_ptr<IDbResultSet>>;

    if (!chained_) {
        return NextResult::ok(nullptr);
    }

    MysqlHandle::Operation op(*handle_);
    free_locked();

    if (!op.usable()) {
        return NextResult::error(closed_connection_error());
    }
    if (!mysql_more_results(op.mysql())) {
        return NextResult::ok(nullptr);
    }

    const int rc = mysql_next_result(op.mysql());
    if (rc > 0) {
        return NextResult::error(handle_->last_error());
    }
    if (rc < 0) {
        return NextResult::ok(nullptr);
    }

    auto next = take_current(handle_, streaming_);
    if (next.is_error()) {
        return NextResult::error(next.error());
    }
    return NextResult::ok(std::move(next.value()));
}

Status MysqlResultSet::end() {
    MysqlHandle::Operation op(*handle_);
    free_locked();
    return Status::ok();
}

Status MysqlResultSet::scan_row(Row& row) {
    MysqlHandle::Operation op(*handle_);
    auto next = fetch_locked();
    if (next.is_error()) {
        return Status::error(next.error());
    }
    if (!next.value()) {
        return Status::error(Error::end_of_stream());
    }
    row = std::move(*next.value());
    return Status::ok();
}

} // namespace sqlpool
