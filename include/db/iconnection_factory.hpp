#pragma once

#include "db/idb_connection.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace sqlorm {

/**
 * @brief Parameters for establishing one connection
 *
 * The password is the unwrapped plaintext.
 */
struct ConnectOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    std::string database;
    std::string username;
    std::string password;
    std::string application_name;
    size_t statement_cache_capacity = 100;
};

/**
 * @brief Abstract factory for creating database connections
 *
 * Each backend provides its own factory that wraps the native
 * connection function (PQconnectdb, mysql_real_connect).
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(const ConnectOptions& options) = 0;
};

} // namespace sqlorm
