#pragma once

#include "pool/iconnection_pool.hpp"

#include <string>
#include <vector>

namespace sqlpool {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// SqlpoolConfig - Complete parsed configuration
// ============================================================================

struct SqlpoolConfig {
    PoolConfig pool;
    LoggingConfig logging;
};

// ============================================================================
// PoolConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads pool configuration from TOML
 *
 * Example:
 * @code
 * [pool]
 * address = "db.internal:3306"
 * username = "app"
 * password = "${DB_PASSWORD}"
 * database = "orders"
 * max_connections = 20
 * max_connection_age_seconds = 3600
 * connect_timeout_seconds = 5
 * request_timeout_seconds = 30
 * charset = "utf8mb4"
 * collation = "utf8mb4_unicode_ci"
 *
 * [logging]
 * level = "debug"
 * @endcode
 *
 * `${VAR}` inside any string value is replaced by the environment variable
 * (empty when unset). `connect_timeout_ms` / `request_timeout_ms` take
 * precedence over their `_seconds` counterparts.
 */
class PoolConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        SqlpoolConfig config;

        static LoadResult ok(SqlpoolConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief All problems found in `config` (empty when valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const SqlpoolConfig& config);

private:
    static LoadResult validate_and_return(SqlpoolConfig config);
};

} // namespace sqlpool
