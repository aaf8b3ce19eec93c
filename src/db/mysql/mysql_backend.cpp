#include "db/mysql/mysql_backend.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_encoder.hpp"
#include "db/generic_connection_pool.hpp"

namespace sqlorm {

std::shared_ptr<IConnectionPool> MysqlBackend::create_pool(
    const std::string& pool_name,
    const PoolConfig& config) {

    auto factory = std::make_shared<MysqlConnectionFactory>();
    return std::make_shared<GenericConnectionPool>(pool_name, config, std::move(factory));
}

std::shared_ptr<DialectEncoder> MysqlBackend::create_encoder(EncoderOptions options) {
    return std::make_shared<MysqlEncoder>(options);
}

} // namespace sqlorm
