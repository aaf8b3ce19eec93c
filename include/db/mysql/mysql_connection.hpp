#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"

#include <mysql/mysql.h>
#include <string>

namespace sqlorm {

/**
 * @brief IDbConnection over a MYSQL* handle (libmysqlclient or MariaDB Connector/C)
 *
 * Statements go through the text protocol. Cells keep their exact byte
 * length, so binary columns survive embedded NULs. Losing the server
 * mid-statement (CR_SERVER_GONE_ERROR, CR_SERVER_LOST) leaves the
 * connection reporting !is_connected(), which makes the pool drop it.
 */
class MysqlConnection : public IDbConnection {
public:
    // Takes ownership of the handle
    explicit MysqlConnection(MYSQL* handle);
    ~MysqlConnection() override;

    MysqlConnection(const MysqlConnection&) = delete;
    MysqlConnection& operator=(const MysqlConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

private:
    [[nodiscard]] DbResultSet driver_failure();

    MYSQL* handle_;
    bool lost_ = false;
};

/**
 * @brief Opens MysqlConnection handles (utf8mb4, 5s connect timeout)
 */
class MysqlConnectionFactory : public IConnectionFactory {
public:
    // Affected-row counts report matched rows, as PostgreSQL does
    static constexpr unsigned long kClientFlags = CLIENT_FOUND_ROWS;

    std::unique_ptr<IDbConnection> create(const ConnectOptions& options) override;
};

} // namespace sqlorm
