#pragma once

#include "config/config_types.hpp"
#include "db/backend_registry.hpp"
#include "db/iconnection_pool.hpp"
#include "orm/dialect_encoder.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sqlorm {

/**
 * @brief Owns the pools, the table namespace and the dialect encoder
 *
 * Built once from configuration in a fixed order: config validation,
 * password unwrapping, then pool construction. Pools are lazy, so
 * construction performs no network I/O.
 *
 * Several pools may share a name; get_pool() prefers the first available
 * one and otherwise falls back to the last unavailable one.
 *
 * Thread-safe via shared_mutex (lookups >> registrations).
 */
class ConnectionRegistry {
public:
    /**
     * @throws std::invalid_argument when the config fails validation
     * @throws std::runtime_error when no backend serves the configured type
     */
    ConnectionRegistry(const OrmConfig& config, const BackendRegistry& backends);

    /**
     * @brief Assemble from already constructed parts (tests, custom drivers)
     */
    ConnectionRegistry(std::string namespace_prefix,
                       std::shared_ptr<DialectEncoder> encoder,
                       std::vector<std::shared_ptr<IConnectionPool>> pools);

    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    void add_pool(std::shared_ptr<IConnectionPool> pool);

    /**
     * @brief First available pool named @p name, else the last unavailable
     *        one, nullptr only when no pool has that name
     */
    [[nodiscard]] std::shared_ptr<IConnectionPool> get_pool(const std::string& name) const;

    [[nodiscard]] std::vector<std::shared_ptr<IConnectionPool>> pools() const;

    [[nodiscard]] const std::string& namespace_prefix() const { return namespace_prefix_; }
    [[nodiscard]] std::shared_ptr<const DialectEncoder> encoder() const { return encoder_; }

    /**
     * @brief Drain every pool
     */
    void drain();

    /**
     * @brief Pool settings for one config entry (password used as given)
     */
    [[nodiscard]] static PoolConfig to_pool_config(const PoolEntryConfig& entry,
                                                   DatabaseType type,
                                                   const std::string& application_name);

private:
    std::string namespace_prefix_;
    std::shared_ptr<DialectEncoder> encoder_;
    std::vector<std::shared_ptr<IConnectionPool>> pools_;
    mutable std::shared_mutex mutex_;
};

} // namespace sqlorm
