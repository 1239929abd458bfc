#include "config/pool_config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlpool {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

int64_t non_negative(const toml::table& tbl, std::string_view key, int64_t fallback) {
    const int64_t value = tbl[key].value_or(fallback);
    if (value < 0) {
        throw std::runtime_error(std::format("pool.{} must not be negative, got {}", key, value));
    }
    return value;
}

// <name>_ms wins over <name>_seconds
std::chrono::milliseconds timeout_ms(const toml::table& tbl, std::string_view name,
                                     std::chrono::milliseconds fallback) {
    const std::string ms_key = std::format("{}_ms", name);
    if (tbl.contains(ms_key)) {
        return std::chrono::milliseconds(non_negative(tbl, ms_key, 0));
    }
    const std::string seconds_key = std::format("{}_seconds", name);
    if (tbl.contains(seconds_key)) {
        return std::chrono::seconds(non_negative(tbl, seconds_key, 0));
    }
    return fallback;
}

PoolConfig extract_pool(const toml::table& root) {
    PoolConfig cfg;
    const auto* pool = root["pool"].as_table();
    if (!pool) {
        throw std::runtime_error("Missing [pool] section");
    }
    const auto& p = *pool;

    cfg.address = p["address"].value_or(""s);
    cfg.protocol = utils::to_lower(p["protocol"].value_or("tcp"s));
    cfg.username = p["username"].value_or(""s);
    cfg.password = p["password"].value_or(""s);
    cfg.database = p["database"].value_or(""s);
    cfg.max_connections = static_cast<size_t>(
        non_negative(p, "max_connections", static_cast<int64_t>(cfg.max_connections)));
    cfg.max_connection_age = std::chrono::seconds(non_negative(p, "max_connection_age_seconds", 0));
    cfg.connect_timeout = timeout_ms(p, "connect_timeout", cfg.connect_timeout);
    cfg.request_timeout = timeout_ms(p, "request_timeout", cfg.request_timeout);
    cfg.keep_connections_alive = p["keep_connections_alive"].value_or(cfg.keep_connections_alive);
    cfg.charset = p["charset"].value_or(""s);
    cfg.collation = p["collation"].value_or(""s);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

SqlpoolConfig extract_all_sections(const toml::table& tbl) {
    SqlpoolConfig config;
    config.pool = extract_pool(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// PoolConfigLoader Implementation
// ============================================================================

PoolConfigLoader::LoadResult PoolConfigLoader::validate_and_return(SqlpoolConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return PoolConfigLoader::LoadResult::error(std::move(combined));
    }
    return PoolConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

PoolConfigLoader::LoadResult PoolConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

PoolConfigLoader::LoadResult PoolConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> PoolConfigLoader::validate_config(const SqlpoolConfig& config) {
    std::vector<std::string> errors;
    const auto& pool = config.pool;

    if (pool.address.empty()) {
        errors.push_back("pool.address must not be empty");
    }

    if (pool.protocol != "tcp" && pool.protocol != "unix") {
        errors.push_back(std::format("pool.protocol must be \"tcp\" or \"unix\", got \"{}\"", pool.protocol));
    }

    if (pool.max_connections == 0) {
        errors.push_back("pool.max_connections must be > 0");
    }

    if (!pool.collation.empty() && pool.charset.empty()) {
        errors.push_back("pool.collation requires pool.charset");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got \"{}\"",
            config.logging.level));
    }

    return errors;
}

} // namespace sqlpool
