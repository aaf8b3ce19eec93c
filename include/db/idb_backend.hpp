#pragma once

#include "core/database_type.hpp"
#include "db/iconnection_pool.hpp"
#include "orm/dialect_encoder.hpp"
#include <memory>
#include <string>

namespace sqlorm {

/**
 * @brief Abstract database backend: creates all dialect-specific components
 *
 * Each dialect family (PostgreSQL, MySQL) provides a concrete implementation
 * that pairs its driver with its SQL encoder.
 *
 * Usage:
 *   auto backends = BackendRegistry::with_builtin_backends();
 *   auto backend = backends.create(DatabaseType::POSTGRESQL);
 *   auto pool = backend->create_pool("main", config);
 *   auto encoder = backend->create_encoder({.strict_filters = true});
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    /** @brief Database type this backend supports */
    [[nodiscard]] virtual DatabaseType type() const = 0;

    /** @brief Create a lazily connected pool */
    [[nodiscard]] virtual std::shared_ptr<IConnectionPool> create_pool(
        const std::string& pool_name,
        const PoolConfig& config) = 0;

    /** @brief Create the SQL encoder for this dialect */
    [[nodiscard]] virtual std::shared_ptr<DialectEncoder> create_encoder(
        EncoderOptions options = {}) = 0;
};

} // namespace sqlorm
