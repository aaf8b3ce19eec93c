#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlorm {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief One pool entry of the [[postgres]] / [[mysql]] array
 *
 * Durations are whole seconds in the file.
 */
struct PoolEntryConfig {
    std::string name = "main";
    std::string database;
    std::string username;
    std::string password;               // plaintext or PasswordCipher text form
    std::string host = "127.0.0.1";
    uint16_t port = 0;                  // 0 = dialect default
    size_t statement_cache_capacity = 100;
    size_t max_connections = 16;
    size_t min_connections = 2;
    std::chrono::seconds max_lifetime{3600};
    std::chrono::seconds idle_timeout{600};
    std::chrono::seconds acquire_timeout{30};
    std::chrono::seconds health_check_interval{60};
};

struct DatabaseSectionConfig {
    std::string namespace_prefix;       // [database] namespace
    std::string type = "postgresql";
    bool strict_filters = false;
};

/**
 * @brief Top-level ORM configuration
 */
struct OrmConfig {
    std::string application_name;
    LoggingConfig logging;
    DatabaseSectionConfig database;
    std::vector<PoolEntryConfig> pools;
};

} // namespace sqlorm
