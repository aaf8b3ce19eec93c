#include "config/config_loader.hpp"
#include "core/database_type.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

using namespace std::string_literals;

namespace sqlorm {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
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

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (auto* s = val.as_string()) {
            auto expanded = expand_env_vars(s->get());
            if (expanded != s->get()) {
                *s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (auto* s = elem.as_string()) {
            auto expanded = expand_env_vars(s->get());
            if (expanded != s->get()) {
                *s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

std::optional<DatabaseType> try_parse_database_type(const std::string& type_str) {
    try {
        return parse_database_type(type_str);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

DatabaseSectionConfig extract_database(const toml::table& root) {
    DatabaseSectionConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.namespace_prefix = d["namespace"].value_or(""s);
    cfg.type = d["type"].value_or("postgresql"s);
    cfg.strict_filters = d["strict-filters"].value_or(false);
    return cfg;
}

// Largest pool size and duration (seconds) a config may ask for
constexpr int64_t kMaxPoolSize = 100000;
constexpr int64_t kMaxSeconds = 365LL * 24 * 3600;

/**
 * @brief Integer key checked against [min, max]
 *
 * A missing key yields @p fallback. A value out of range is reported in
 * @p errors and also yields @p fallback.
 */
int64_t read_integer(const toml::table& p, std::string_view key, int64_t fallback,
                     int64_t min, int64_t max, std::string_view path,
                     std::vector<std::string>& errors) {
    const auto value = p[key].value<int64_t>();
    if (!value) return fallback;
    if (*value < min || *value > max) {
        errors.push_back(std::format("{}.{} ({}) must be between {} and {}",
                                     path, key, *value, min, max));
        return fallback;
    }
    return *value;
}

std::chrono::seconds read_seconds(const toml::table& p, std::string_view key,
                                  std::chrono::seconds fallback, std::string_view path,
                                  std::vector<std::string>& errors) {
    return std::chrono::seconds(
        read_integer(p, key, fallback.count(), 0, kMaxSeconds, path, errors));
}

PoolEntryConfig extract_pool(const toml::table& p, std::string_view path,
                             std::vector<std::string>& errors) {
    PoolEntryConfig cfg;
    cfg.name = p["name"].value_or(cfg.name);
    cfg.database = p["database"].value_or(""s);
    cfg.username = p["username"].value_or(""s);
    cfg.password = p["password"].value_or(""s);
    cfg.host = p["host"].value_or(cfg.host);
    cfg.port = static_cast<uint16_t>(read_integer(p, "port", cfg.port, 1, 65535, path, errors));
    cfg.statement_cache_capacity = static_cast<size_t>(read_integer(
        p, "statement-cache-capacity", 100, 0, kMaxPoolSize, path, errors));
    cfg.max_connections = static_cast<size_t>(read_integer(
        p, "max-connections", 16, 1, kMaxPoolSize, path, errors));
    cfg.min_connections = static_cast<size_t>(read_integer(
        p, "min-connections", 2, 0, kMaxPoolSize, path, errors));
    cfg.max_lifetime = read_seconds(p, "max-lifetime", cfg.max_lifetime, path, errors);
    cfg.idle_timeout = read_seconds(p, "idle-timeout", cfg.idle_timeout, path, errors);
    cfg.acquire_timeout = read_seconds(p, "acquire-timeout", cfg.acquire_timeout, path, errors);
    cfg.health_check_interval = read_seconds(
        p, "health-check-interval", cfg.health_check_interval, path, errors);
    return cfg;
}

std::vector<PoolEntryConfig> extract_pools(const toml::table& root, DatabaseType type,
                                           std::vector<std::string>& errors) {
    std::vector<PoolEntryConfig> result;
    const auto key = database_type_config_key(type);
    const auto* arr = root[key].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* p = elem.as_table();
        if (!p) continue;
        const std::string path = std::format("{}[{}]", key, result.size());
        result.push_back(extract_pool(*p, path, errors));
    }
    return result;
}

OrmConfig extract_all_sections(const toml::table& tbl, std::vector<std::string>& errors) {
    OrmConfig config;
    config.application_name = tbl["name"].value_or(""s);
    config.logging = extract_logging(tbl);
    config.database = extract_database(tbl);
    // An unknown type is reported by validation; no pool table to read then
    if (const auto type = try_parse_database_type(config.database.type)) {
        config.pools = extract_pools(tbl, *type, errors);
    }
    return config;
}

// Extraction errors come first, then those of the typed config
ConfigLoader::LoadResult validate_and_return(OrmConfig config, std::vector<std::string> errors) {
    for (auto& err : ConfigLoader::validate_config(config)) {
        errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const OrmConfig& config) {
    std::vector<std::string> errors;

    if (config.database.namespace_prefix.empty()) {
        errors.push_back("database.namespace is required");
    }

    const auto type = try_parse_database_type(config.database.type);
    if (!type) {
        errors.push_back(std::format("database.type '{}' is not supported", config.database.type));
        return errors;
    }

    const auto key = database_type_config_key(*type);
    if (config.pools.empty()) {
        errors.push_back(std::format("[[{}]] pool array is missing or empty", key));
    }

    for (size_t i = 0; i < config.pools.size(); ++i) {
        const auto& pool = config.pools[i];
        if (pool.database.empty()) {
            errors.push_back(std::format("{}[{}].database must not be empty", key, i));
        }
        if (pool.username.empty()) {
            errors.push_back(std::format("{}[{}].username must not be empty", key, i));
        }
        if (pool.password.empty()) {
            errors.push_back(std::format("{}[{}].password must not be empty", key, i));
        }
        if (pool.max_connections == 0) {
            errors.push_back(std::format("{}[{}].max-connections must be > 0", key, i));
        } else if (pool.max_connections > static_cast<size_t>(kMaxPoolSize)) {
            errors.push_back(std::format("{}[{}].max-connections ({}) exceeds {}",
                                         key, i, pool.max_connections, kMaxPoolSize));
        }
        const std::pair<std::string_view, std::chrono::seconds> durations[] = {
            {"max-lifetime", pool.max_lifetime},
            {"idle-timeout", pool.idle_timeout},
            {"acquire-timeout", pool.acquire_timeout},
            {"health-check-interval", pool.health_check_interval},
        };
        for (const auto& [name, value] : durations) {
            if (value.count() < 0 || value.count() > kMaxSeconds) {
                errors.push_back(std::format("{}[{}].{} ({}s) must be between 0 and {}s",
                                             key, i, name, value.count(), kMaxSeconds));
            }
        }
        if (pool.min_connections > pool.max_connections) {
            errors.push_back(std::format(
                "{}[{}].min-connections ({}) > max-connections ({})",
                key, i, pool.min_connections, pool.max_connections));
        }
    }

    return errors;
}

} // namespace sqlorm
