#include <catch2/catch_test_macros.hpp>
#include "pool/connection_pool.hpp"
#include "mocks/mock_db_connection.hpp"
#include <chrono>

using namespace sqlpool;
using namespace sqlpool::testing;
using namespace std::chrono_literals;

namespace {

struct Fixture {
    Fixture()
        : factory(std::make_shared<MockConnectionFactory>()) {
        PoolConfig config;
        config.address = "db:3306";
        config.max_connections = 1;
        config.connect_timeout = 200ms;
        config.request_timeout = 2000ms;
        pool = ConnectionPool::create(config, factory);

        auto leased = pool->lease();
        REQUIRE(leased.is_ok());
        conn = leased.value();
        state = factory->state(0);

        std::lock_guard lock(state->mutex);
        state->columns = {"id", "name"};
        state->rows = {
            {Field{"1"}, Field{"alice"}},
            {Field{"2"}, std::nullopt},
            {Field{"3"}, Field{"carol"}},
        };
        state->affected_rows = 3;
        state->insert_id = 42;
    }

    std::shared_ptr<MockConnectionFactory> factory;
    std::shared_ptr<ConnectionPool> pool;
    std::shared_ptr<PooledConnection> conn;
    std::shared_ptr<MockConnectionState> state;
};

} // namespace

// ============================================================================
// Queries and result sets
// ============================================================================

TEST_CASE("ResultSet: buffered query returns rows and metadata", "[decorators][result]") {
    Fixture f;

    auto out = f.conn->query("SELECT id, name FROM users");
    REQUIRE(out.is_ok());
    REQUIRE(out.value().rows.size() == 3);
    CHECK(out.value().rows[0][1] == Field{"alice"});
    CHECK_FALSE(out.value().rows[1][1].has_value());

    REQUIRE(out.value().result);
    const auto& result = *out.value().result;
    CHECK(result.column_names() == std::vector<std::string>{"id", "name"});
    CHECK(result.affected_rows() == 3);
    CHECK(result.insert_id() == 42);
    CHECK(result.connection() == f.conn);
}

TEST_CASE("ResultSet: query_first and query_last pick one row", "[decorators][result]") {
    Fixture f;

    auto first = f.conn->query_first("SELECT id FROM users");
    REQUIRE(first.is_ok());
    REQUIRE(first.value().row.has_value());
    CHECK((*first.value().row)[0] == Field{"1"});

    auto last = f.conn->query_last("SELECT id FROM users");
    REQUIRE(last.is_ok());
    REQUIRE(last.value().row.has_value());
    CHECK((*last.value().row)[0] == Field{"3"});
}

TEST_CASE("ResultSet: query_first on an empty result has no row", "[decorators][result]") {
    Fixture f;
    {
        std::lock_guard lock(f.state->mutex);
        f.state->rows.clear();
    }

    auto first = f.conn->query_first("SELECT id FROM users WHERE 0");
    REQUIRE(first.is_ok());
    CHECK_FALSE(first.value().row.has_value());
}

TEST_CASE("ResultSet: streamed rows end with END_OF_STREAM", "[decorators][result]") {
    Fixture f;

    auto started = f.conn->start("SELECT id, name FROM users");
    REQUIRE(started.is_ok());
    auto& result = *started.value();

    Row row;
    int count = 0;
    Status status = Status::ok();
    while ((status = result.scan_row(row)).is_ok()) {
        ++count;
    }

    CHECK(count == 3);
    CHECK(status.error_category() == ErrorCategory::END_OF_STREAM);
    CHECK(f.conn->is_in_pool());
}

TEST_CASE("ResultSet: fatal error while streaming destroys the connection", "[decorators][result]") {
    Fixture f;
    {
        std::lock_guard lock(f.state->mutex);
        f.state->stream_error = Error::driver(2013, "Lost connection to MySQL server during query");
    }

    auto started = f.conn->start("SELECT id, name FROM users");
    REQUIRE(started.is_ok());

    auto rows = started.value()->get_rows();
    REQUIRE(rows.is_error());
    CHECK(rows.error_code() == 2013);
    CHECK_FALSE(f.conn->is_in_pool());
}

TEST_CASE("ResultSet: get_row, get_first_row and end on a stream", "[decorators][result]") {
    Fixture f;

    SECTION("get_row walks rows then reports exhaustion") {
        auto started = f.conn->start("SELECT id FROM users");
        REQUIRE(started.is_ok());
        auto& result = *started.value();

        for (int i = 0; i < 3; ++i) {
            auto row = result.get_row();
            REQUIRE(row.is_ok());
            CHECK(row.value().has_value());
        }
        auto done = result.get_row();
        REQUIRE(done.is_ok());
        CHECK_FALSE(done.value().has_value());
    }

    SECTION("get_first_row discards the rest") {
        auto started = f.conn->start("SELECT id FROM users");
        REQUIRE(started.is_ok());
        auto first = started.value()->get_first_row();
        REQUIRE(first.is_ok());
        REQUIRE(first.value().has_value());
        CHECK((*first.value())[0] == Field{"1"});

        auto rest = started.value()->get_rows();
        REQUIRE(rest.is_ok());
        CHECK(rest.value().empty());
    }

    SECTION("get_last_row reads to the end") {
        auto started = f.conn->start("SELECT id FROM users");
        REQUIRE(started.is_ok());
        auto last = started.value()->get_last_row();
        REQUIRE(last.is_ok());
        REQUIRE(last.value().has_value());
        CHECK((*last.value())[0] == Field{"3"});
    }

    SECTION("end discards unread rows") {
        auto started = f.conn->start("SELECT id FROM users");
        REQUIRE(started.is_ok());
        REQUIRE(started.value()->end().is_ok());
        Row row;
        CHECK(started.value()->scan_row(row).error_category() == ErrorCategory::END_OF_STREAM);
        CHECK(f.conn->is_in_pool());
    }
}

TEST_CASE("ResultSet: next_result walks a multi-statement batch", "[decorators][result]") {
    Fixture f;
    {
        std::lock_guard lock(f.state->mutex);
        f.state->extra_results.push_back({{Field{"x"}}});
    }

    auto out = f.conn->query("SELECT id FROM users; SELECT 'x'");
    REQUIRE(out.is_ok());
    REQUIRE(out.value().result);

    auto second = out.value().result->next_result();
    REQUIRE(second.is_ok());
    REQUIRE(second.value());
    CHECK(second.value()->connection() == f.conn);

    auto rows = second.value()->get_rows();
    REQUIRE(rows.is_ok());
    REQUIRE(rows.value().size() == 1);
    CHECK(rows.value()[0][0] == Field{"x"});

    auto third = second.value()->next_result();
    REQUIRE(third.is_ok());
    CHECK(third.value() == nullptr);
}

// ============================================================================
// Prepared statements
// ============================================================================

TEST_CASE("PreparedStatement: exec binds parameters", "[decorators][statement]") {
    Fixture f;

    auto stmt = f.conn->prepare("SELECT name FROM users WHERE id = ? AND name = ?");
    REQUIRE(stmt.is_ok());
    CHECK(stmt.value()->param_count() == 2);
    CHECK(stmt.value()->connection() == f.conn);

    auto out = stmt.value()->exec({Field{"1"}, std::nullopt});
    REQUIRE(out.is_ok());
    CHECK(out.value().rows.size() == 3);
    REQUIRE(out.value().result);
    CHECK(out.value().result->insert_id() == 42);

    std::lock_guard lock(f.state->mutex);
    REQUIRE(f.state->executions.size() == 1);
    CHECK(f.state->executions[0] == std::vector<Field>{Field{"1"}, std::nullopt});
}

TEST_CASE("PreparedStatement: exec_first and exec_last", "[decorators][statement]") {
    Fixture f;

    auto stmt = f.conn->prepare("SELECT id FROM users");
    REQUIRE(stmt.is_ok());

    auto first = stmt.value()->exec_first();
    REQUIRE(first.is_ok());
    REQUIRE(first.value().row.has_value());
    CHECK((*first.value().row)[0] == Field{"1"});

    auto last = stmt.value()->exec_last();
    REQUIRE(last.is_ok());
    REQUIRE(last.value().row.has_value());
    CHECK((*last.value().row)[0] == Field{"3"});
}

TEST_CASE("PreparedStatement: errors are classified", "[decorators][statement]") {
    Fixture f;
    auto stmt = f.conn->prepare("INSERT INTO users VALUES (?)");
    REQUIRE(stmt.is_ok());

    SECTION("duplicate key keeps the connection") {
        {
            std::lock_guard lock(f.state->mutex);
            f.state->exec_error = Error::driver(1062, "Duplicate entry '1' for key 'PRIMARY'");
        }
        auto out = stmt.value()->exec({Field{"1"}});
        REQUIRE(out.is_error());
        CHECK(out.error_code() == 1062);
        CHECK(f.conn->is_in_pool());
    }

    SECTION("lost connection destroys it") {
        {
            std::lock_guard lock(f.state->mutex);
            f.state->exec_error = Error::driver(2013, "Lost connection to MySQL server during query");
        }
        auto out = stmt.value()->exec({Field{"1"}});
        REQUIRE(out.is_error());
        CHECK(out.error_code() == 2013);
        CHECK_FALSE(f.conn->is_in_pool());
        CHECK(f.conn->statement_cache_size() == 0);
    }
}

// ============================================================================
// Transactions
// ============================================================================

TEST_CASE("Transaction: begin and commit", "[decorators][transaction]") {
    Fixture f;

    auto trans = f.conn->begin();
    REQUIRE(trans.is_ok());
    CHECK(trans.value()->is_valid());
    CHECK(trans.value()->connection() == f.conn);

    REQUIRE(trans.value()->commit().is_ok());
    CHECK_FALSE(trans.value()->is_valid());

    const auto queries = f.state->recorded_queries();
    REQUIRE(queries.size() == 2);
    CHECK(queries[0] == "START TRANSACTION");
    CHECK(queries[1] == "COMMIT");
}

TEST_CASE("Transaction: rollback", "[decorators][transaction]") {
    Fixture f;

    auto trans = f.conn->begin();
    REQUIRE(trans.is_ok());
    REQUIRE(trans.value()->rollback().is_ok());
    CHECK(f.state->recorded_queries().back() == "ROLLBACK");
}

TEST_CASE("Transaction: bind runs a statement inside the transaction", "[decorators][transaction]") {
    Fixture f;

    auto stmt = f.conn->prepare("UPDATE users SET name = ? WHERE id = ?");
    REQUIRE(stmt.is_ok());
    auto trans = f.conn->begin();
    REQUIRE(trans.is_ok());

    auto bound = trans.value()->bind(*stmt.value());
    REQUIRE(bound);
    CHECK(bound->sql() == stmt.value()->sql());
    CHECK(bound->connection() == f.conn);

    auto out = bound->exec({Field{"bob"}, Field{"2"}});
    REQUIRE(out.is_ok());
    REQUIRE(trans.value()->commit().is_ok());
}

TEST_CASE("Transaction: fatal commit error destroys the connection", "[decorators][transaction]") {
    Fixture f;

    auto trans = f.conn->begin();
    REQUIRE(trans.is_ok());
    {
        std::lock_guard lock(f.state->mutex);
        f.state->commit_error = Error::driver(2006, "MySQL server has gone away");
    }

    auto status = trans.value()->commit();
    REQUIRE(status.is_error());
    CHECK(status.error_code() == 2006);
    CHECK_FALSE(f.conn->is_in_pool());
}

// ============================================================================
// Query parameters
// ============================================================================

TEST_CASE("PooledConnection: query parameters reach the driver", "[decorators][params]") {
    Fixture f;
    const std::vector<Field> params{Field{"alice"}, std::nullopt};

    SECTION("buffered") {
        auto out = f.conn->query("SELECT id FROM users WHERE name = ? OR name = ?", params);
        REQUIRE(out.is_ok());
        std::lock_guard lock(f.state->mutex);
        CHECK(f.state->query_params.back() == params);
    }

    SECTION("first and last row") {
        REQUIRE(f.conn->query_first("SELECT id FROM users WHERE name = ? OR name = ?", params).is_ok());
        REQUIRE(f.conn->query_last("SELECT id FROM users WHERE name = ? OR name = ?", params).is_ok());
        std::lock_guard lock(f.state->mutex);
        REQUIRE(f.state->query_params.size() == 2);
        CHECK(f.state->query_params[0] == params);
        CHECK(f.state->query_params[1] == params);
    }

    SECTION("streamed") {
        auto started = f.conn->start("SELECT id FROM users WHERE name = ? OR name = ?", params);
        REQUIRE(started.is_ok());
        std::lock_guard lock(f.state->mutex);
        CHECK(f.state->query_params.back() == params);
    }

    SECTION("no parameters by default") {
        REQUIRE(f.conn->query("SELECT 1").is_ok());
        std::lock_guard lock(f.state->mutex);
        CHECK(f.state->query_params.back().empty());
    }
}
