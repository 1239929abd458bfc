#include "pool/pooled_connection.hpp"
#include "pool/connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlpool {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, const PoolConfig& config)
    : conn_(std::move(conn)),
      charset_(config.charset),
      collation_(config.collation),
      request_timeout_(config.request_timeout) {
    if (config.max_connection_age.count() > 0) {
        expires_at_ = std::chrono::steady_clock::now() + config.max_connection_age;
    }
}

PooledConnection::~PooledConnection() {
    destroy();
}

void PooledConnection::attach(std::weak_ptr<ConnectionPool> pool) {
    std::lock_guard lock(mutex_);
    pool_ = std::move(pool);
}

void PooledConnection::detach() {
    std::lock_guard lock(mutex_);
    pool_.reset();
    statements_.clear();
}

std::shared_ptr<ConnectionPool> PooledConnection::pool() const {
    std::lock_guard lock(mutex_);
    return pool_.lock();
}

bool PooledConnection::is_in_pool() const {
    return pool() != nullptr;
}

size_t PooledConnection::statement_cache_size() const {
    std::lock_guard lock(mutex_);
    return statements_.size();
}

// ============================================================================
// Lifecycle
// ============================================================================

Status PooledConnection::connect() {
    if (auto status = conn_->connect(); status.is_error()) {
        return status;
    }
    return prepare_session();
}

Status PooledConnection::reconnect() {
    if (!is_in_pool()) {
        return Status::error(ErrorCategory::CONNECTION_NOT_IN_POOL, "Connection not associated with a pool");
    }

    // Statements do not survive the old session
    {
        std::lock_guard lock(mutex_);
        statements_.clear();
    }

    if (auto status = conn_->reconnect(); status.is_error()) {
        return status;
    }
    return prepare_session();
}

Status PooledConnection::prepare_session() {
    std::string sql;

    if (!charset_.empty()) {
        sql = std::format("SET NAMES '{}'", charset_);
    }

    if (!collation_.empty()) {
        if (sql.empty()) {
            return Status::error(ErrorCategory::COLLATION_WITHOUT_CHARSET,
                "Can't set collation without setting charset");
        }
        sql += std::format(" COLLATE '{}'", collation_);
    }

    if (!sql.empty()) {
        auto out = conn_->query(sql, {});
        if (out.is_error()) {
            return Status::error(out.error());
        }
    }

    return Status::ok();
}

Status PooledConnection::release() {
    auto owner = pool();
    if (!owner) {
        return Status::error(ErrorCategory::CONNECTION_NOT_IN_POOL, "Connection not associated with a pool");
    }

    if (owner->config().keep_connections_alive) {
        if (verify()) {
            auto self = shared_from_this();
            if (!owner->return_to_idle(self)) {
                destroy();
            }
        }
        return Status::ok();
    }

    destroy();
    return Status::ok();
}

void PooledConnection::destroy() {
    if (conn_->is_connected()) {
        conn_->close();
    }

    if (auto owner = pool()) {
        owner->on_connection_destroyed(*this);
    } else {
        std::lock_guard lock(mutex_);
        statements_.clear();
    }
}

bool PooledConnection::verify() {
    if (!conn_->is_connected()) {
        utils::log::debug("Connection verification failed: not connected");
        destroy();
        return false;
    }

    if (auto status = conn_->ping(); status.is_error()) {
        utils::log::debug(std::format("Connection verification failed: ping: {}",
            status.error().to_string()));
        destroy();
        return false;
    }

    if (expires_at_ && std::chrono::steady_clock::now() > *expires_at_) {
        utils::log::debug("Connection verification failed: max connection age reached");
        destroy();
        return false;
    }

    return true;
}

// ============================================================================
// Operations
// ============================================================================

Result<QueryRows> PooledConnection::query(const std::string& sql, const std::vector<Field>& params) {
    auto self = shared_from_this();
    auto out = with_timeout([self, sql, params] {
        return self->destroy_on_error([&] { return self->conn_->query(sql, params); });
    });
    if (out.is_error()) {
        return Result<QueryRows>::error(out.error());
    }

    QueryRows rows;
    rows.rows = std::move(out.value().rows);
    if (out.value().result) {
        rows.result = std::make_unique<ResultSet>(self, std::move(out.value().result));
    }
    return Result<QueryRows>::ok(std::move(rows));
}

Result<QueryRow> PooledConnection::query_first(const std::string& sql, const std::vector<Field>& params) {
    auto self = shared_from_this();
    auto out = with_timeout([self, sql, params] {
        return self->destroy_on_error([&] { return self->conn_->query_first(sql, params); });
    });
    if (out.is_error()) {
        return Result<QueryRow>::error(out.error());
    }

    QueryRow row;
    row.row = std::move(out.value().row);
    if (out.value().result) {
        row.result = std::make_unique<ResultSet>(self, std::move(out.value().result));
    }
    return Result<QueryRow>::ok(std::move(row));
}

Result<QueryRow> PooledConnection::query_last(const std::string& sql, const std::vector<Field>& params) {
    auto self = shared_from_this();
    auto out = with_timeout([self, sql, params] {
        return self->destroy_on_error([&] { return self->conn_->query_last(sql, params); });
    });
    if (out.is_error()) {
        return Result<QueryRow>::error(out.error());
    }

    QueryRow row;
    row.row = std::move(out.value().row);
    if (out.value().result) {
        row.result = std::make_unique<ResultSet>(self, std::move(out.value().result));
    }
    return Result<QueryRow>::ok(std::move(row));
}

Result<std::unique_ptr<ResultSet>> PooledConnection::start(const std::string& sql,
                                                          const std::vector<Field>& params) {
    auto self = shared_from_this();
    auto out = with_timeout([self, sql, params] {
        return self->destroy_on_error([&] { return self->conn_->start(sql, params); });
    });
    if (out.is_error()) {
        return Result<std::unique_ptr<ResultSet>>::error(out.error());
    }
    return Result<std::unique_ptr<ResultSet>>::ok(
        std::make_unique<ResultSet>(self, std::move(out.value())));
}

Result<std::shared_ptr<PreparedStatement>> PooledConnection::prepare(const std::string& sql) {
    auto self = shared_from_this();

    {
        std::lock_guard lock(mutex_);
        const auto it = statements_.find(sql);
        if (it != statements_.end()) {
            return Result<std::shared_ptr<PreparedStatement>>::ok(
                std::make_shared<PreparedStatement>(self, it->second, sql));
        }
    }

    auto out = with_timeout([self, sql] {
        return self->destroy_on_error([&] { return self->conn_->prepare(sql); });
    });
    if (out.is_error()) {
        return Result<std::shared_ptr<PreparedStatement>>::error(out.error());
    }

    {
        std::lock_guard lock(mutex_);
        // A destroyed connection keeps no cache
        if (!pool_.expired()) {
            statements_.emplace(sql, out.value());
        }
    }

    return Result<std::shared_ptr<PreparedStatement>>::ok(
        std::make_shared<PreparedStatement>(self, out.value(), sql));
}

Result<std::unique_ptr<Transaction>> PooledConnection::begin() {
    auto self = shared_from_this();
    auto out = with_timeout([self] {
        return self->destroy_on_error([&] { return self->conn_->begin(); });
    });
    if (out.is_error()) {
        return Result<std::unique_ptr<Transaction>>::error(out.error());
    }
    return Result<std::unique_ptr<Transaction>>::ok(
        std::make_unique<Transaction>(self, std::shared_ptr<IDbTransaction>(std::move(out.value()))));
}

Status PooledConnection::use(const std::string& database) {
    auto self = shared_from_this();
    return with_timeout([self, database] {
        return self->destroy_on_error([&] { return self->conn_->use(database); });
    });
}

void PooledConnection::forget_statement(const std::string& sql) {
    std::lock_guard lock(mutex_);
    statements_.erase(sql);
}

} // namespace sqlpool
