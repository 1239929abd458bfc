#include "db/mysql/mysql_statement.hpp"
#include "db/mysql/mysql_result_set.hpp"
#include <algorithm>
#include <format>
#include <type_traits>

namespace sqlpool {

namespace {

// bool in libmysqlclient 8, my_bool in older clients and MariaDB Connector/C
using NullFlag = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

// Initial receive buffer for a column whose max length is not reported
constexpr unsigned long kDefaultColumnBuffer = 64;

} // anonymous namespace

MysqlStatement::MysqlStatement(std::shared_ptr<MysqlHandle> handle, MYSQL_STMT* stmt)
    : handle_(std::move(handle)),
      stmt_(stmt),
      generation_(handle_->generation.load()),
      param_count_(mysql_stmt_param_count(stmt)) {}

MysqlStatement::~MysqlStatement() {
    if (stmt_) {
        MysqlHandle::Operation op(*handle_);
        mysql_stmt_close(stmt_);
        stmt_ = nullptr;
    }
}

Error MysqlStatement::stmt_error() const {
    const unsigned int code = mysql_stmt_errno(stmt_);
    if (code == 0) {
        return handle_->last_error();
    }
    return Error::driver(code, mysql_stmt_error(stmt_));
}

Result<QueryOutput> MysqlStatement::exec(const std::vector<Field>& params) {
    MysqlHandle::Operation op(*handle_);
    return exec_locked(params);
}

Result<RowOutput> MysqlStatement::exec_first(const std::vector<Field>& params) {
    auto out = exec(params);
    if (out.is_error()) {
        return Result<RowOutput>::error(out.error());
    }

    RowOutput row;
    if (!out.value().rows.empty()) {
        row.row = std::move(out.value().rows.front());
    }
    row.result = std::move(out.value().result);
    return Result<RowOutput>::ok(std::move(row));
}

Result<RowOutput> MysqlStatement::exec_last(const std::vector<Field>& params) {
    auto out = exec(params);
    if (out.is_error()) {
        return Result<RowOutput>::error(out.error());
    }

    RowOutput row;
    if (!out.value().rows.empty()) {
        row.row = std::move(out.value().rows.back());
    }
    row.result = std::move(out.value().result);
    return Result<RowOutput>::ok(std::move(row));
}

Result<QueryOutput> MysqlStatement::exec_locked(const std::vector<Field>& params) {
    if (!stmt_ || !handle_->mysql || handle_->closing.load() ||
        handle_->generation.load() != generation_) {
        return Result<QueryOutput>::error(closed_connection_error());
    }

    if (params.size() != param_count_) {
        return Result<QueryOutput>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Statement expects {} parameters, got {}", param_count_, params.size()));
    }

    std::vector<MYSQL_BIND> binds(params.size());
    std::vector<unsigned long> lengths(params.size());
    for (size_t i = 0; i < params.size(); ++i) {
        if (!params[i]) {
            binds[i].buffer_type = MYSQL_TYPE_NULL;
            continue;
        }
        lengths[i] = static_cast<unsigned long>(params[i]->size());
        binds[i].buffer_type = MYSQL_TYPE_STRING;
        binds[i].buffer = const_cast<char*>(params[i]->data());
        binds[i].buffer_length = lengths[i];
        binds[i].length = &lengths[i];
    }

    if (!binds.empty() && mysql_stmt_bind_param(stmt_, binds.data())) {
        return Result<QueryOutput>::error(stmt_error());
    }

    if (mysql_stmt_execute(stmt_) != 0) {
        return Result<QueryOutput>::error(stmt_error());
    }

    QueryOutput out;
    std::vector<std::string> columns;

    if (MYSQL_RES* meta = mysql_stmt_result_metadata(stmt_)) {
        auto rows = fetch_rows_locked(meta, columns);
        mysql_free_result(meta);
        if (rows.is_error()) {
            mysql_stmt_free_result(stmt_);
            return Result<QueryOutput>::error(rows.error());
        }
        out.rows = std::move(rows.value());
    }

    const auto affected = static_cast<uint64_t>(mysql_stmt_affected_rows(stmt_));
    const auto insert_id = static_cast<uint64_t>(mysql_stmt_insert_id(stmt_));

    // Stored procedures append a status result; discard anything after the first
    mysql_stmt_free_result(stmt_);
    int rc;
    while ((rc = mysql_stmt_next_result(stmt_)) == 0) {
        mysql_stmt_free_result(stmt_);
    }
    if (rc > 0) {
        return Result<QueryOutput>::error(stmt_error());
    }

    out.result = MysqlResultSet::statement_result(handle_, std::move(columns), affected, insert_id);
    return Result<QueryOutput>::ok(std::move(out));
}

Result<std::vector<Row>> MysqlStatement::fetch_rows_locked(MYSQL_RES* meta, std::vector<std::string>& columns) {
    using Rows = Result<std::vector<Row>>;

    // Have store_result report the longest value of each column
    const bool update_max_length = true;
    mysql_stmt_attr_set(stmt_, STMT_ATTR_UPDATE_MAX_LENGTH, &update_max_length);

    if (mysql_stmt_store_result(stmt_) != 0) {
        return Rows::error(stmt_error());
    }

    const unsigned int num_fields = mysql_num_fields(meta);
    const MYSQL_FIELD* fields = mysql_fetch_fields(meta);

    columns.clear();
    columns.reserve(num_fields);

    std::vector<MYSQL_BIND> binds(num_fields);
    std::vector<std::string> buffers(num_fields);
    std::vector<unsigned long> lengths(num_fields);
    auto nulls = std::make_unique<NullFlag[]>(num_fields);

    for (unsigned int i = 0; i < num_fields; ++i) {
        columns.emplace_back(fields[i].name);
        buffers[i].resize(std::max(fields[i].max_length + 1, kDefaultColumnBuffer));
        binds[i].buffer_type = MYSQL_TYPE_STRING;
        binds[i].buffer = buffers[i].data();
        binds[i].buffer_length = static_cast<unsigned long>(buffers[i].size());
        binds[i].length = &lengths[i];
        binds[i].is_null = &nulls[i];
    }

    if (num_fields > 0 && mysql_stmt_bind_result(stmt_, binds.data())) {
        return Rows::error(stmt_error());
    }

    std::vector<Row> rows;
    while (true) {
        const int rc = mysql_stmt_fetch(stmt_);
        if (rc == MYSQL_NO_DATA) {
            break;
        }
        if (rc == 1) {
            return Rows::error(stmt_error());
        }

        Row row;
        row.reserve(num_fields);
        for (unsigned int i = 0; i < num_fields; ++i) {
            if (nulls[i]) {
                row.emplace_back(std::nullopt);
                continue;
            }

            if (lengths[i] <= binds[i].buffer_length) {
                row.emplace_back(std::string(buffers[i].data(), lengths[i]));
                continue;
            }

            // MYSQL_DATA_TRUNCATED: read the whole value into a larger buffer
            std::string value(lengths[i], '\0');
            unsigned long value_length = 0;
            MYSQL_BIND column{};
            column.buffer_type = MYSQL_TYPE_STRING;
            column.buffer = value.data();
            column.buffer_length = static_cast<unsigned long>(value.size());
            column.length = &value_length;
            if (mysql_stmt_fetch_column(stmt_, &column, i, 0) != 0) {
                return Rows::error(stmt_error());
            }
            value.resize(std::min<size_t>(value_length, value.size()));
            row.emplace_back(std::move(value));
        }
        rows.push_back(std::move(row));
    }

    return Rows::ok(std::move(rows));
}

Status MysqlStatement::remove() {
    MysqlHandle::Operation op(*handle_);
    if (!stmt_) {
        return Status::ok();
    }

    // The statement is freed even when closing it fails
    MYSQL_STMT* stmt = stmt_;
    stmt_ = nullptr;
    if (mysql_stmt_close(stmt)) {
        return Status::error(handle_->last_error());
    }
    return Status::ok();
}

} // namespace sqlpool
