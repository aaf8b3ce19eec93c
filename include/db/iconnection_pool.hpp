#pragma once

#include "core/error.hpp"
#include "db/iconnection_factory.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace sqlorm {

// Forward declarations
class PooledConnection;

/**
 * @brief Pool configuration (database-agnostic)
 */
struct PoolConfig {
    ConnectOptions connect;
    size_t min_connections = 2;
    size_t max_connections = 16;
    std::chrono::seconds max_lifetime{3600};             // 0 = disabled
    std::chrono::seconds idle_timeout{600};              // 0 = never reap
    std::chrono::milliseconds acquire_timeout{30000};
    std::chrono::seconds health_check_interval{60};      // idle time before a ping
    std::string health_check_query{"SELECT 1"};
    std::chrono::milliseconds maintenance_interval{30000};  // 0 = no maintenance thread
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t acquire_timeouts = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
    size_t connections_reaped = 0;
    bool available = true;
};

using AcquireResult = Result<std::unique_ptr<PooledConnection>>;

/**
 * @brief Abstract connection pool interface
 *
 * Several pools may share a name (e.g. primary and replica serving the
 * same role); ConnectionRegistry picks among them by availability.
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Acquire a connection, waiting at most the configured acquire timeout
     *
     * Fails with ACQUIRE_TIMEOUT when no slot frees up in time and with
     * POOL_UNAVAILABLE when the pool is drained, cannot connect, or the
     * before-acquire health check fails.
     */
    [[nodiscard]] virtual AcquireResult acquire() = 0;

    [[nodiscard]] virtual AcquireResult acquire_for(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Get pool statistics (thread-safe)
     */
    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Close all idle connections and refuse further acquisitions
     */
    virtual void drain() = 0;

    // Logical pool name (non-unique)
    [[nodiscard]] virtual const std::string& name() const = 0;

    [[nodiscard]] virtual const std::string& database() const = 0;

    /**
     * @brief Best-effort health flag; readers may observe a stale value
     */
    [[nodiscard]] virtual bool is_available() const = 0;

    virtual void set_available(bool available) = 0;
};

} // namespace sqlorm
