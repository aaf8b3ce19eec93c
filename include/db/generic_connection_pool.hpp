#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <thread>
#include <unordered_map>

namespace sqlorm {

/**
 * @brief Database-agnostic, lazily connected connection pool
 *
 * Design:
 * - Lazy: no connection is opened at construction; the first acquire
 *   connects, so the process starts even when the database is down
 * - Bounded: max_connections enforced via counting_semaphore (C++20)
 * - Before-acquire health check: a connection idle longer than
 *   health_check_interval is pinged; a failed ping marks the pool
 *   unavailable and fails that acquisition
 * - Lifetime: connections older than max_lifetime are replaced on acquire
 * - Maintenance thread reaps idle and expired connections independently
 *   of callers
 * - RAII: PooledConnection auto-returns on destruction
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param name Logical pool name (may be shared with other pools)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    AcquireResult acquire() override;
    AcquireResult acquire_for(std::chrono::milliseconds timeout) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return name_; }
    const std::string& database() const override { return config_.connect.database; }

    bool is_available() const override {
        return available_.load(std::memory_order_acquire);
    }

    void set_available(bool available) override;

    const PoolConfig& config() const { return config_; }

    /**
     * @brief One maintenance pass: reap idle and expired connections
     *
     * Runs periodically on the maintenance thread; public for tests.
     */
    void run_maintenance();

private:
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Forget and close a connection owned by the pool
     */
    void discard_connection(std::unique_ptr<IDbConnection> conn);

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn, bool broken);

    void maintenance_loop(std::stop_token stop);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;

    // Semaphore for bounded pool (C++20)
    std::counting_semaphore<> semaphore_;

    std::atomic<bool> available_{true};
    std::atomic<bool> connected_once_{false};

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> acquire_timeouts_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<size_t> connections_reaped_{0};

    // Shutdown flag
    std::atomic<bool> shutdown_{false};

    // Connection lifetime tracking
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> last_used_;

    // Declared last: stopped before the state it reads is destroyed
    std::jthread maintenance_thread_;
};

} // namespace sqlorm
