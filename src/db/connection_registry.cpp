#include "db/connection_registry.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "security/password_cipher.hpp"

#include <format>
#include <mutex>
#include <stdexcept>

namespace sqlorm {

namespace {

constexpr uint16_t kPostgresDefaultPort = 5432;
constexpr uint16_t kMysqlDefaultPort = 3306;

} // anonymous namespace

ConnectionRegistry::ConnectionRegistry(const OrmConfig& config, const BackendRegistry& backends) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Invalid database configuration:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        throw std::invalid_argument(combined);
    }

    if (!utils::log::set_level(config.logging.level)) {
        utils::log::warn(std::format("Unknown log level '{}', keeping current level",
            config.logging.level));
    }

    const DatabaseType type = parse_database_type(config.database.type);
    auto backend = backends.create(type);

    namespace_prefix_ = config.database.namespace_prefix;
    encoder_ = backend->create_encoder({.strict_filters = config.database.strict_filters});

    pools_.reserve(config.pools.size());
    for (const auto& entry : config.pools) {
        auto pool_config = to_pool_config(entry, type, config.application_name);
        pool_config.connect.password = PasswordCipher::unwrap_password(entry);
        pools_.push_back(backend->create_pool(entry.name, pool_config));
    }

    utils::log::info(std::format("ConnectionRegistry ready: namespace '{}', {} {} pool(s)",
        namespace_prefix_, pools_.size(), database_type_to_string(type)));
}

ConnectionRegistry::ConnectionRegistry(std::string namespace_prefix,
                                       std::shared_ptr<DialectEncoder> encoder,
                                       std::vector<std::shared_ptr<IConnectionPool>> pools)
    : namespace_prefix_(std::move(namespace_prefix)),
      encoder_(std::move(encoder)),
      pools_(std::move(pools)) {}

ConnectionRegistry::~ConnectionRegistry() {
    drain();
}

void ConnectionRegistry::add_pool(std::shared_ptr<IConnectionPool> pool) {
    std::unique_lock lock(mutex_);
    pools_.push_back(std::move(pool));
}

std::shared_ptr<IConnectionPool> ConnectionRegistry::get_pool(const std::string& name) const {
    std::shared_lock lock(mutex_);
    std::shared_ptr<IConnectionPool> fallback;
    for (const auto& pool : pools_) {
        if (pool->name() != name) continue;
        if (pool->is_available()) {
            return pool;
        }
        fallback = pool;
    }
    return fallback;
}

std::vector<std::shared_ptr<IConnectionPool>> ConnectionRegistry::pools() const {
    std::shared_lock lock(mutex_);
    return pools_;
}

void ConnectionRegistry::drain() {
    std::shared_lock lock(mutex_);
    for (const auto& pool : pools_) {
        pool->drain();
    }
}

PoolConfig ConnectionRegistry::to_pool_config(const PoolEntryConfig& entry,
                                              DatabaseType type,
                                              const std::string& application_name) {
    PoolConfig config;
    config.connect.host = entry.host;
    config.connect.port = entry.port != 0 ? entry.port
        : (type == DatabaseType::MYSQL ? kMysqlDefaultPort : kPostgresDefaultPort);
    config.connect.database = entry.database;
    config.connect.username = entry.username;
    config.connect.password = entry.password;
    config.connect.application_name = application_name;
    config.connect.statement_cache_capacity = entry.statement_cache_capacity;
    config.min_connections = entry.min_connections;
    config.max_connections = entry.max_connections;
    config.max_lifetime = entry.max_lifetime;
    config.idle_timeout = entry.idle_timeout;
    config.acquire_timeout = entry.acquire_timeout;
    config.health_check_interval = entry.health_check_interval;
    return config;
}

} // namespace sqlorm
