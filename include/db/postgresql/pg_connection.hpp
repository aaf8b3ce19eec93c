#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"

#include <libpq-fe.h>
#include <string>

namespace sqlorm {

/**
 * @brief IDbConnection over a libpq PGconn*
 *
 * Statements run through PQexec in text format; column types are reported
 * by name through PgTypeMap. A connection whose PQstatus leaves
 * CONNECTION_OK reports !is_connected() and is dropped by the pool.
 */
class PgConnection : public IDbConnection {
public:
    // Takes ownership of the handle
    explicit PgConnection(PGconn* handle);
    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

private:
    PGconn* handle_;
};

/**
 * @brief Opens PgConnection handles with PQconnectdb
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const ConnectOptions& options) override;

    /**
     * @brief Keyword/value conninfo; every value is single-quoted
     */
    [[nodiscard]] static std::string build_conninfo(const ConnectOptions& options);
};

} // namespace sqlorm
