#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_encoder.hpp"
#include "db/generic_connection_pool.hpp"

namespace sqlorm {

std::shared_ptr<IConnectionPool> PgBackend::create_pool(
    const std::string& pool_name,
    const PoolConfig& config) {

    auto factory = std::make_shared<PgConnectionFactory>();
    return std::make_shared<GenericConnectionPool>(pool_name, config, std::move(factory));
}

std::shared_ptr<DialectEncoder> PgBackend::create_encoder(EncoderOptions options) {
    return std::make_shared<PgEncoder>(options);
}

} // namespace sqlorm
