#include <catch2/catch_test_macros.hpp>
#include "pool/connection_pool.hpp"
#include "mocks/mock_db_connection.hpp"
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

using namespace sqlpool;
using namespace sqlpool::testing;
using namespace std::chrono_literals;

namespace {

PoolConfig make_config() {
    PoolConfig config;
    config.address = "db:3306";
    config.username = "app";
    config.max_connections = 2;
    config.connect_timeout = 200ms;
    config.request_timeout = 2000ms;
    return config;
}

struct Fixture {
    explicit Fixture(PoolConfig config = make_config())
        : factory(std::make_shared<MockConnectionFactory>()),
          pool(ConnectionPool::create(std::move(config), factory)) {
        auto leased = pool->lease();
        REQUIRE(leased.is_ok());
        conn = leased.value();
        state = factory->state(0);
    }

    std::shared_ptr<MockConnectionFactory> factory;
    std::shared_ptr<ConnectionPool> pool;
    std::shared_ptr<PooledConnection> conn;
    std::shared_ptr<MockConnectionState> state;
};

} // namespace

// ============================================================================
// Request timeout
// ============================================================================

TEST_CASE("PooledConnection: fast query completes within the request timeout", "[connection][timeout]") {
    Fixture f;
    f.state->set_query_delay(20ms);

    auto out = f.conn->query("SELECT 1");
    REQUIRE(out.is_ok());
    REQUIRE(out.value().rows.size() == 1);
    CHECK(out.value().rows[0][0] == Field{"1"});
    CHECK(f.conn->is_in_pool());
}

TEST_CASE("PooledConnection: slow query times out and destroys the connection", "[connection][timeout]") {
    auto config = make_config();
    config.request_timeout = 100ms;
    Fixture f(config);
    f.state->set_query_delay(5000ms);

    const auto start = std::chrono::steady_clock::now();
    auto out = f.conn->query("SELECT SLEEP(5)");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(out.is_error());
    CHECK(out.error_category() == ErrorCategory::REQUEST_TIMEOUT);
    CHECK(out.error_message() == "Query took too long to execute");
    CHECK(elapsed < 2000ms);
    CHECK(f.state->closed.load());
    CHECK_FALSE(f.conn->is_in_pool());
    CHECK(f.pool->size().total == 0);

    // The abandoned query returns once the socket is closed
    std::this_thread::sleep_for(50ms);
    CHECK(f.state->close_calls.load() == 1);
}

TEST_CASE("PooledConnection: request_timeout=0 runs without a deadline", "[connection][timeout]") {
    auto config = make_config();
    config.request_timeout = 0ms;
    Fixture f(config);
    f.state->set_query_delay(150ms);

    auto out = f.conn->query("SELECT 1");
    REQUIRE(out.is_ok());
    CHECK(f.conn->is_in_pool());
}

TEST_CASE("PooledConnection: timeout applies to begin and use", "[connection][timeout]") {
    auto config = make_config();
    config.request_timeout = 100ms;

    SECTION("begin") {
        Fixture f(config);
        f.state->set_query_delay(5000ms);
        auto trans = f.conn->begin();
        REQUIRE(trans.is_error());
        CHECK(trans.error_category() == ErrorCategory::REQUEST_TIMEOUT);
        CHECK_FALSE(f.conn->is_in_pool());
    }

    SECTION("use") {
        Fixture f(config);
        f.state->set_query_delay(5000ms);
        auto status = f.conn->use("reports");
        REQUIRE(status.is_error());
        CHECK(status.error_category() == ErrorCategory::REQUEST_TIMEOUT);
        CHECK_FALSE(f.conn->is_in_pool());
    }
}

// ============================================================================
// Error classification
// ============================================================================

TEST_CASE("PooledConnection: driver errors destroy only when fatal", "[connection][errors]") {
    const std::vector<std::pair<uint32_t, bool>> cases = {
        {1021, true},   // Disk full
        {1022, false},  // Duplicate key
        {1105, false},  // Unknown error
        {1146, false},  // Table doesn't exist
        {1149, false},  // Syntax error
        {1152, true},   // Aborted connection
        {1267, false},  // Illegal mix of collations
        {2005, true},   // Unknown host
        {2006, true},   // Server gone away
        {2056, true},   // Client-side error
    };

    for (const auto& [code, fatal] : cases) {
        Fixture f;
        f.state->set_query_error(Error::driver(code, "scripted"));

        auto out = f.conn->query("SELECT * FROM t");
        REQUIRE(out.is_error());
        CHECK(out.error_code() == code);
        CHECK(out.error_message() == "scripted");
        INFO("code " << code);
        CHECK(f.conn->is_in_pool() == !fatal);
        CHECK(f.state->closed.load() == fatal);
    }
}

TEST_CASE("PooledConnection: non-driver errors are fatal", "[connection][errors]") {
    Fixture f;
    f.state->set_query_error(Error{ErrorCategory::INTERNAL_ERROR, 0, "generic failure"});

    auto out = f.conn->query("SELECT 1");
    REQUIRE(out.is_error());
    CHECK(out.error_category() == ErrorCategory::INTERNAL_ERROR);
    CHECK_FALSE(f.conn->is_in_pool());
}

TEST_CASE("PooledConnection: recoverable error leaves connection releasable", "[connection][errors]") {
    Fixture f;
    f.state->set_query_error(Error::driver(1064, "You have an error in your SQL syntax"));

    auto out = f.conn->query("SELEC 1");
    REQUIRE(out.is_error());

    f.state->set_query_error(std::nullopt);
    REQUIRE(f.pool->release(f.conn).is_ok());
    CHECK(f.pool->size().available == 1);
}

TEST_CASE("PooledConnection: destroyed connection rejects every operation", "[connection][errors]") {
    Fixture f;
    f.conn->destroy();
    const auto queries_before = f.state->recorded_queries().size();

    auto query = f.conn->query("SELECT 1");
    REQUIRE(query.is_error());
    CHECK(query.error_category() == ErrorCategory::CONNECTION_NOT_IN_POOL);

    auto first = f.conn->query_first("SELECT 1");
    REQUIRE(first.is_error());
    CHECK(first.error_category() == ErrorCategory::CONNECTION_NOT_IN_POOL);

    auto stream = f.conn->start("SELECT 1");
    REQUIRE(stream.is_error());
    CHECK(stream.error_category() == ErrorCategory::CONNECTION_NOT_IN_POOL);

    auto stmt = f.conn->prepare("SELECT ?");
    REQUIRE(stmt.is_error());
    CHECK(stmt.error_category() == ErrorCategory::CONNECTION_NOT_IN_POOL);

    auto trans = f.conn->begin();
    REQUIRE(trans.is_error());
    CHECK(trans.error_category() == ErrorCategory::CONNECTION_NOT_IN_POOL);

    auto use = f.conn->use("other");
    REQUIRE(use.is_error());
    CHECK(use.error_category() == ErrorCategory::CONNECTION_NOT_IN_POOL);

    auto reconnect = f.conn->reconnect();
    REQUIRE(reconnect.is_error());
    CHECK(reconnect.error_category() == ErrorCategory::CONNECTION_NOT_IN_POOL);

    CHECK(f.state->recorded_queries().size() == queries_before);
}

// ============================================================================
// Verification
// ============================================================================

TEST_CASE("PooledConnection: verify checks connection, ping and age", "[connection][verify]") {
    SECTION("healthy") {
        Fixture f;
        CHECK(f.conn->verify());
        CHECK(f.conn->is_in_pool());
        CHECK(f.state->ping_calls.load() == 1);
    }

    SECTION("ping fails") {
        Fixture f;
        f.state->set_ping_error(Error::driver(2013, "Lost connection"));
        CHECK_FALSE(f.conn->verify());
        CHECK_FALSE(f.conn->is_in_pool());
    }

    SECTION("not connected") {
        Fixture f;
        f.state->connected = false;
        CHECK_FALSE(f.conn->verify());
        CHECK_FALSE(f.conn->is_in_pool());
        CHECK(f.state->ping_calls.load() == 0);
    }

    SECTION("expired") {
        auto config = make_config();
        config.max_connection_age = std::chrono::seconds(1);
        Fixture f(config);
        REQUIRE(f.conn->expires_at().has_value());
        std::this_thread::sleep_for(1100ms);
        CHECK_FALSE(f.conn->verify());
        CHECK_FALSE(f.conn->is_in_pool());
    }
}

TEST_CASE("PooledConnection: release re-verifies before queueing", "[connection][verify]") {
    Fixture f;
    f.state->set_ping_error(Error::driver(2006, "MySQL server has gone away"));

    REQUIRE(f.conn->release().is_ok());
    CHECK(f.pool->size().total == 0);
    CHECK(f.pool->size().available == 0);
    CHECK_FALSE(f.conn->is_in_pool());
}

// ============================================================================
// Prepared statement cache
// ============================================================================

TEST_CASE("PooledConnection: statements are prepared once per SQL text", "[connection][prepare]") {
    Fixture f;

    auto a = f.conn->prepare("SELECT * FROM t WHERE id = ?");
    auto b = f.conn->prepare("SELECT * FROM t WHERE id = ?");
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    CHECK(f.state->prepare_calls.load() == 1);
    CHECK(f.conn->statement_cache_size() == 1);
    CHECK(a.value()->native() == b.value()->native());
    CHECK(a.value()->sql() == "SELECT * FROM t WHERE id = ?");
    CHECK(a.value()->param_count() == 1);

    auto c = f.conn->prepare("SELECT * FROM u");
    REQUIRE(c.is_ok());
    CHECK(f.state->prepare_calls.load() == 2);
    CHECK(f.conn->statement_cache_size() == 2);
}

TEST_CASE("PooledConnection: removed statement leaves the cache", "[connection][prepare]") {
    Fixture f;

    auto stmt = f.conn->prepare("SELECT ?");
    REQUIRE(stmt.is_ok());
    REQUIRE(stmt.value()->remove().is_ok());
    CHECK(f.state->remove_calls.load() == 1);
    CHECK(f.conn->statement_cache_size() == 0);

    auto again = f.conn->prepare("SELECT ?");
    REQUIRE(again.is_ok());
    CHECK(f.state->prepare_calls.load() == 2);
}

TEST_CASE("PooledConnection: failed removal keeps the statement cached", "[connection][prepare]") {
    Fixture f;

    auto stmt = f.conn->prepare("SELECT ?");
    REQUIRE(stmt.is_ok());
    {
        std::lock_guard lock(f.state->mutex);
        f.state->remove_error = Error::driver(1243, "Unknown prepared statement handler");
    }
    auto status = stmt.value()->remove();
    REQUIRE(status.is_error());
    CHECK(status.error_code() == 1243);
    CHECK(f.conn->is_in_pool());
    CHECK(f.conn->statement_cache_size() == 1);
}

TEST_CASE("PooledConnection: failed prepare is not cached", "[connection][prepare]") {
    Fixture f;
    f.state->set_query_error(Error::driver(1064, "You have an error in your SQL syntax"));

    auto stmt = f.conn->prepare("SELEC ?");
    REQUIRE(stmt.is_error());
    CHECK(stmt.error_code() == 1064);
    CHECK(f.conn->statement_cache_size() == 0);
    CHECK(f.conn->is_in_pool());
}

TEST_CASE("PooledConnection: destroy clears the statement cache", "[connection][prepare]") {
    Fixture f;

    auto stmt = f.conn->prepare("SELECT ?");
    REQUIRE(stmt.is_ok());
    REQUIRE(f.conn->statement_cache_size() == 1);

    f.conn->destroy();
    CHECK(f.conn->statement_cache_size() == 0);
}

// ============================================================================
// Session
// ============================================================================

TEST_CASE("PooledConnection: reconnect reapplies session and drops statements", "[connection][session]") {
    auto config = make_config();
    config.charset = "utf8mb4";
    Fixture f(config);

    auto stmt = f.conn->prepare("SELECT ?");
    REQUIRE(stmt.is_ok());

    REQUIRE(f.conn->reconnect().is_ok());
    CHECK(f.state->connect_calls.load() == 2);
    CHECK(f.conn->statement_cache_size() == 0);
    CHECK(f.conn->is_in_pool());

    const auto queries = f.state->recorded_queries();
    REQUIRE(queries.size() == 2);
    CHECK(queries[0] == "SET NAMES 'utf8mb4'");
    CHECK(queries[1] == "SET NAMES 'utf8mb4'");
}

TEST_CASE("PooledConnection: use selects the database", "[connection][session]") {
    Fixture f;

    REQUIRE(f.conn->use("reports").is_ok());
    std::lock_guard lock(f.state->mutex);
    CHECK(f.state->database == "reports");
}
