#pragma once

#include "db/idb_backend.hpp"

namespace sqlorm {

/**
 * @brief PostgreSQL backend: PgConnectionFactory pools and PgEncoder
 */
class PgBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::POSTGRESQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& pool_name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<DialectEncoder> create_encoder(
        EncoderOptions options = {}) override;
};

} // namespace sqlorm
