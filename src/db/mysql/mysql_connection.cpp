#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_query_format.hpp"
#include "db/mysql/mysql_result_set.hpp"
#include "db/mysql/mysql_statement.hpp"
#include "core/utils.hpp"
#include <charconv>
#include <format>
#include <mutex>

namespace sqlpool {

namespace {

Result<RowOutput> pick_row(Result<QueryOutput> out, bool first) {
    if (out.is_error()) {
        return Result<RowOutput>::error(out.error());
    }

    RowOutput row;
    auto& rows = out.value().rows;
    if (!rows.empty()) {
        row.row = std::move(first ? rows.front() : rows.back());
    }
    row.result = std::move(out.value().result);
    return Result<RowOutput>::ok(std::move(row));
}

} // anonymous namespace

MysqlConnection::MysqlConnection(ConnectionParams params)
    : handle_(std::make_shared<MysqlHandle>()),
      params_(std::move(params)) {}

MysqlConnection::~MysqlConnection() {
    close();
}

Status MysqlConnection::connect() {
    auto endpoint = MysqlConnectionFactory::parse_address(params_.protocol, params_.address);
    if (endpoint.is_error()) {
        return Status::error(endpoint.error());
    }
    const auto& ep = endpoint.value();

    MysqlHandle::Operation op(*handle_);
    handle_->close_locked();
    handle_->closing.store(false);

    MYSQL* mysql = mysql_init(nullptr);
    if (!mysql) {
        utils::log::error("mysql_init failed");
        return Status::error(ErrorCategory::INTERNAL_ERROR, "mysql_init failed");
    }

    if (timeout_.count() > 0) {
        // Whole seconds, rounded up
        unsigned int seconds = static_cast<unsigned int>((timeout_.count() + 999) / 1000);
        mysql_options(mysql, MYSQL_OPT_CONNECT_TIMEOUT, &seconds);
    }

    unsigned int protocol = ep.unix_socket.empty() ? MYSQL_PROTOCOL_TCP : MYSQL_PROTOCOL_SOCKET;
    mysql_options(mysql, MYSQL_OPT_PROTOCOL, &protocol);

    MYSQL* result = mysql_real_connect(
        mysql,
        ep.host.c_str(),
        params_.username.c_str(),
        params_.password.c_str(),
        params_.database.empty() ? nullptr : params_.database.c_str(),
        ep.port,
        ep.unix_socket.empty() ? nullptr : ep.unix_socket.c_str(),
        CLIENT_MULTI_STATEMENTS | CLIENT_MULTI_RESULTS
    );

    if (!result) {
        auto err = Error::driver(mysql_errno(mysql), mysql_error(mysql));
        utils::log::debug(std::format("MySQL connection to {} failed: {}", params_.address, err.to_string()));
        mysql_close(mysql);
        return Status::error(std::move(err));
    }

    handle_->attach_locked(mysql);

    utils::log::debug(std::format("MySQL connected to {} (server {})",
        params_.address, mysql_get_server_info(mysql)));
    return Status::ok();
}

Status MysqlConnection::reconnect() {
    // connect() closes the current handle first
    return connect();
}

void MysqlConnection::close() {
    handle_->close();
}

bool MysqlConnection::is_connected() const {
    return handle_->connected.load() && !handle_->closing.load();
}

Status MysqlConnection::ping() {
    MysqlHandle::Operation op(*handle_);
    if (!op.usable()) {
        return Status::error(closed_connection_error());
    }
    if (mysql_ping(op.mysql()) != 0) {
        return Status::error(handle_->last_error());
    }
    return Status::ok();
}

Status MysqlConnection::send_query_locked(const std::string& sql, const std::vector<Field>& params) {
    MYSQL* mysql = handle_->mysql;

    std::string expanded;
    if (!params.empty()) {
        auto formatted = expand_placeholders(sql, params, [mysql](std::string_view value) -> std::optional<std::string> {
            std::string out(value.size() * 2 + 1, '\0');
            const unsigned long length = mysql_real_escape_string(
                mysql, out.data(), value.data(), static_cast<unsigned long>(value.size()));
            if (length == static_cast<unsigned long>(-1)) {
                return std::nullopt;
            }
            out.resize(length);
            return out;
        });
        if (formatted.is_error()) {
            return Status::error(formatted.error());
        }
        expanded = std::move(formatted.value());
    }

    const std::string& text = params.empty() ? sql : expanded;
    if (mysql_real_query(mysql, text.data(), static_cast<unsigned long>(text.size())) != 0) {
        return Status::error(handle_->last_error());
    }
    return Status::ok();
}

Result<QueryOutput> MysqlConnection::query(const std::string& sql, const std::vector<Field>& params) {
    MysqlHandle::Operation op(*handle_);
    if (!op.usable()) {
        return Result<QueryOutput>::error(closed_connection_error());
    }

    if (auto sent = send_query_locked(sql, params); sent.is_error()) {
        return Result<QueryOutput>::error(sent.error());
    }

    auto current = MysqlResultSet::take_current(handle_, false);
    if (current.is_error()) {
        return Result<QueryOutput>::error(current.error());
    }

    auto rows = current.value()->read_all_locked();
    if (rows.is_error()) {
        return Result<QueryOutput>::error(rows.error());
    }

    QueryOutput out;
    out.rows = std::move(rows.value());
    out.result = std::move(current.value());
    return Result<QueryOutput>::ok(std::move(out));
}

Result<RowOutput> MysqlConnection::query_first(const std::string& sql, const std::vector<Field>& params) {
    return pick_row(query(sql, params), true);
}

Result<RowOutput> MysqlConnection::query_last(const std::string& sql, const std::vector<Field>& params) {
    return pick_row(query(sql, params), false);
}

Result<std::unique_ptr<IDbResultSet>> MysqlConnection::start(const std::string& sql,
                                                             const std::vector<Field>& params) {
    using Started = Result<std::unique_ptr<IDbResultSet>>;

    MysqlHandle::Operation op(*handle_);
    if (!op.usable()) {
        return Started::error(closed_connection_error());
    }

    if (auto sent = send_query_locked(sql, params); sent.is_error()) {
        return Started::error(sent.error());
    }

    auto current = MysqlResultSet::take_current(handle_, true);
    if (current.is_error()) {
        return Started::error(current.error());
    }
    return Started::ok(std::move(current.value()));
}

Result<std::shared_ptr<IDbStatement>> MysqlConnection::prepare(const std::string& sql) {
    using Prepared = Result<std::shared_ptr<IDbStatement>>;

    MysqlHandle::Operation op(*handle_);
    if (!op.usable()) {
        return Prepared::error(closed_connection_error());
    }

    MYSQL_STMT* stmt = mysql_stmt_init(op.mysql());
    if (!stmt) {
        return Prepared::error(handle_->last_error());
    }

    if (mysql_stmt_prepare(stmt, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        auto err = Error::driver(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
        mysql_stmt_close(stmt);
        return Prepared::error(std::move(err));
    }

    return Prepared::ok(std::make_shared<MysqlStatement>(handle_, stmt));
}

Result<std::unique_ptr<IDbTransaction>> MysqlConnection::begin() {
    using Begun = Result<std::unique_ptr<IDbTransaction>>;

    MysqlHandle::Operation op(*handle_);
    if (!op.usable()) {
        return Begun::error(closed_connection_error());
    }

    if (mysql_query(op.mysql(), "START TRANSACTION") != 0) {
        return Begun::error(handle_->last_error());
    }

    return Begun::ok(std::make_unique<MysqlTransaction>(handle_, handle_->generation.load()));
}

Status MysqlConnection::use(const std::string& database) {
    MysqlHandle::Operation op(*handle_);
    if (!op.usable()) {
        return Status::error(closed_connection_error());
    }
    if (mysql_select_db(op.mysql(), database.c_str()) != 0) {
        return Status::error(handle_->last_error());
    }
    params_.database = database;
    return Status::ok();
}

// ============================================================================
// MysqlTransaction
// ============================================================================

MysqlTransaction::MysqlTransaction(std::shared_ptr<MysqlHandle> handle, uint64_t generation)
    : handle_(std::move(handle)), generation_(generation) {}

Status MysqlTransaction::commit() {
    MysqlHandle::Operation op(*handle_);
    if (!op.usable() || handle_->generation.load() != generation_) {
        return Status::error(closed_connection_error());
    }
    if (mysql_commit(op.mysql())) {
        return Status::error(handle_->last_error());
    }
    finished_.store(true);
    return Status::ok();
}

Status MysqlTransaction::rollback() {
    MysqlHandle::Operation op(*handle_);
    if (!op.usable() || handle_->generation.load() != generation_) {
        return Status::error(closed_connection_error());
    }
    if (mysql_rollback(op.mysql())) {
        return Status::error(handle_->last_error());
    }
    finished_.store(true);
    return Status::ok();
}

std::shared_ptr<IDbStatement> MysqlTransaction::bind(std::shared_ptr<IDbStatement> stmt) {
    return stmt;
}

bool MysqlTransaction::is_valid() const {
    return !finished_.load() &&
           handle_->connected.load() &&
           !handle_->closing.load() &&
           handle_->generation.load() == generation_;
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

MysqlConnectionFactory::MysqlConnectionFactory() {
    // mysql_init() would do this lazily, but not thread-safely
    static std::once_flag once;
    std::call_once(once, [] {
        if (mysql_library_init(0, nullptr, nullptr) != 0) {
            utils::log::error("mysql_library_init failed");
        }
    });
}

std::unique_ptr<IDbConnection> MysqlConnectionFactory::create(const ConnectionParams& params) {
    return std::make_unique<MysqlConnection>(params);
}

Result<MysqlEndpoint> MysqlConnectionFactory::parse_address(const std::string& protocol,
                                                            const std::string& address) {
    MysqlEndpoint endpoint;

    if (protocol == "unix") {
        if (address.empty()) {
            return Result<MysqlEndpoint>::error(ErrorCategory::INTERNAL_ERROR, "Empty unix socket path");
        }
        endpoint.host = "localhost";
        endpoint.unix_socket = address;
        return Result<MysqlEndpoint>::ok(std::move(endpoint));
    }

    if (protocol != "tcp") {
        return Result<MysqlEndpoint>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Unsupported protocol '{}'", protocol));
    }

    std::string_view sv(address);
    std::string_view port_str;

    if (sv.starts_with('[')) {
        // [ipv6]:port
        const size_t close = sv.find(']');
        if (close == std::string_view::npos) {
            return Result<MysqlEndpoint>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("Invalid address '{}'", address));
        }
        endpoint.host = std::string(sv.substr(1, close - 1));
        std::string_view rest = sv.substr(close + 1);
        if (!rest.empty()) {
            if (!rest.starts_with(':')) {
                return Result<MysqlEndpoint>::error(ErrorCategory::INTERNAL_ERROR,
                    std::format("Invalid address '{}'", address));
            }
            port_str = rest.substr(1);
        }
    } else {
        const size_t colon = sv.find(':');
        if (colon != std::string_view::npos && sv.find(':', colon + 1) == std::string_view::npos) {
            endpoint.host = std::string(sv.substr(0, colon));
            port_str = sv.substr(colon + 1);
        } else {
            // Host only, or a bare IPv6 address
            endpoint.host = address;
        }
    }

    if (endpoint.host.empty()) {
        return Result<MysqlEndpoint>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Missing host in address '{}'", address));
    }

    if (!port_str.empty()) {
        unsigned int port = 0;
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc() || ptr != port_str.data() + port_str.size() || port == 0 || port > 65535) {
            return Result<MysqlEndpoint>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("Invalid port in address '{}'", address));
        }
        endpoint.port = port;
    }

    return Result<MysqlEndpoint>::ok(std::move(endpoint));
}

} // namespace sqlpool
