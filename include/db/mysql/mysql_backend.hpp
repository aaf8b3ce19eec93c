#pragma once

#include "db/idb_backend.hpp"

namespace sqlorm {

/**
 * @brief MySQL-family backend (MySQL, MariaDB, TiDB): MysqlConnectionFactory
 * pools and MysqlEncoder
 */
class MysqlBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::MYSQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& pool_name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<DialectEncoder> create_encoder(
        EncoderOptions options = {}) override;
};

} // namespace sqlorm
