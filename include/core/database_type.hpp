#pragma once

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sqlorm {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view TIDB = "tidb";
}

/**
 * @brief Target SQL dialect family
 *
 * MariaDB and TiDB speak the MySQL dialect and share its encoder and driver.
 */
enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
        default: return "unknown";
    }
}

/**
 * @brief Key of the pool array in the configuration file for this dialect
 */
[[nodiscard]] inline std::string_view database_type_config_key(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRES;
        case DatabaseType::MYSQL: return keys::MYSQL;
        default: return "unknown";
    }
}

[[nodiscard]] inline DatabaseType parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL},
        {keys::TIDB,       DatabaseType::MYSQL}
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback only when the direct lookup fails
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
            if (match) return value;
        }
    }

    throw std::runtime_error(std::format("Unknown database type: {}", type_str));
}

} // namespace sqlorm
