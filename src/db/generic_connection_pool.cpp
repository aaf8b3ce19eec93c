#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <vector>

namespace sqlorm {

GenericConnectionPool::GenericConnectionPool(
    std::string name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // No connection is opened here; the first acquire connects
    if (config_.maintenance_interval.count() > 0) {
        maintenance_thread_ = std::jthread([this](std::stop_token stop) {
            maintenance_loop(std::move(stop));
        });
    }

    utils::log::info(std::format("ConnectionPool '{}' created for database '{}' (lazy, min={}, max={})",
        name_, config_.connect.database, config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.request_stop();
        maintenance_thread_.join();
    }
    drain();
}

AcquireResult GenericConnectionPool::acquire() {
    return acquire_for(config_.acquire_timeout);
}

AcquireResult GenericConnectionPool::acquire_for(std::chrono::milliseconds timeout) {
    if (shutdown_.load(std::memory_order_acquire)) {
        return AcquireResult::error(ErrorCategory::POOL_UNAVAILABLE,
            std::format("pool '{}' is drained", name_));
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        acquire_timeouts_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Acquire timeout on pool '{}' after {}ms",
            name_, timeout.count()));
        return AcquireResult::error(ErrorCategory::ACQUIRE_TIMEOUT,
            std::format("timed out after {}ms waiting for a connection from pool '{}'",
                        timeout.count(), name_));
    }

    // Re-check shutdown after acquiring the semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return AcquireResult::error(ErrorCategory::POOL_UNAVAILABLE,
            std::format("pool '{}' is drained", name_));
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point birth{};
    std::chrono::steady_clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (const auto it = created_at_.find(conn.get()); it != created_at_.end()) {
                birth = it->second;
            }
            if (const auto it = last_used_.find(conn.get()); it != last_used_.end()) {
                last_used = it->second;
            }
        }
    }

    if (conn) {
        const auto now = std::chrono::steady_clock::now();
        if (config_.max_lifetime.count() > 0 && now - birth > config_.max_lifetime) {
            // Too old: replace with a fresh connection below
            discard_connection(std::move(conn));
            connections_recycled_.fetch_add(1, std::memory_order_relaxed);
            utils::log::debug(std::format("Recycled connection past max lifetime in pool '{}'", name_));
        } else if (now - last_used >= config_.health_check_interval) {
            if (!conn->is_healthy(config_.health_check_query)) {
                health_check_failures_.fetch_add(1, std::memory_order_relaxed);
                failed_acquires_.fetch_add(1, std::memory_order_relaxed);
                discard_connection(std::move(conn));
                set_available(false);
                semaphore_.release();
                return AcquireResult::error(ErrorCategory::POOL_UNAVAILABLE,
                    std::format("health check failed for pool '{}'", name_));
            }
            // A good ping alone is not enough: the pool must also hold idle connections
            bool has_idle = false;
            {
                std::lock_guard lock(mutex_);
                has_idle = !idle_connections_.empty();
            }
            if (has_idle) {
                set_available(true);
            }
        }
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            set_available(false);
            return AcquireResult::error(ErrorCategory::POOL_UNAVAILABLE,
                std::format("cannot connect to database '{}' for pool '{}'",
                            config_.connect.database, name_));
        }
        if (!connected_once_.exchange(true)) {
            utils::log::info(std::format("ConnectionPool '{}' connected to database '{}'",
                name_, config_.connect.database));
        }
        set_available(true);
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c, bool broken) {
        this->return_connection(std::move(c), broken);
    };

    return AcquireResult::ok(std::make_unique<PooledConnection>(std::move(conn), return_fn));
}

void GenericConnectionPool::set_available(bool available) {
    const bool previous = available_.exchange(available, std::memory_order_acq_rel);
    if (previous == available) {
        return;
    }
    if (available) {
        utils::log::info(std::format("ConnectionPool '{}' is available again", name_));
    } else {
        utils::log::warn(std::format("ConnectionPool '{}' marked unavailable", name_));
    }
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections >= stats.idle_connections
        ? stats.total_connections - stats.idle_connections : 0;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.acquire_timeouts = acquire_timeouts_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.connections_reaped = connections_reaped_.load(std::memory_order_relaxed);
    stats.available = available_.load(std::memory_order_acquire);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);

    for (auto& conn : idle_connections_) {
        if (conn) {
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    idle_connections_.clear();
    created_at_.clear();
    last_used_.clear();

    utils::log::info(std::format("ConnectionPool '{}' drained", name_));
}

void GenericConnectionPool::run_maintenance() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::unique_ptr<IDbConnection>> expired;
    size_t reaped = 0;
    size_t recycled = 0;

    {
        std::lock_guard lock(mutex_);
        const size_t total = total_connections_.load(std::memory_order_relaxed);
        for (auto it = idle_connections_.begin(); it != idle_connections_.end();) {
            IDbConnection* raw = it->get();
            const auto birth = created_at_[raw];
            const auto used = last_used_[raw];

            const bool too_old = config_.max_lifetime.count() > 0
                && now - birth > config_.max_lifetime;
            // Idle reaping stops at min_connections
            const bool too_idle = config_.idle_timeout.count() > 0
                && now - used > config_.idle_timeout
                && total - expired.size() > config_.min_connections;

            if (too_old || too_idle) {
                if (too_old) {
                    ++recycled;
                } else {
                    ++reaped;
                }
                expired.push_back(std::move(*it));
                it = idle_connections_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& conn : expired) {
        discard_connection(std::move(conn));
    }

    connections_recycled_.fetch_add(recycled, std::memory_order_relaxed);
    connections_reaped_.fetch_add(reaped, std::memory_order_relaxed);
    if (!expired.empty()) {
        utils::log::debug(std::format("ConnectionPool '{}' maintenance: {} reaped, {} expired",
            name_, reaped, recycled));
    }
}

void GenericConnectionPool::maintenance_loop(std::stop_token stop) {
    const auto ticks = std::max<int64_t>(1, config_.maintenance_interval.count() / 100);
    while (!stop.stop_requested()) {
        // Sleep in 100ms increments for responsive shutdown
        for (int64_t i = 0; i < ticks && !stop.stop_requested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
        if (stop.stop_requested() || shutdown_.load(std::memory_order_acquire)) break;

        run_maintenance();
    }
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connect);
    if (!conn) {
        return nullptr;
    }
    total_connections_.fetch_add(1, std::memory_order_relaxed);

    const auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(mutex_);
    created_at_[conn.get()] = now;
    last_used_[conn.get()] = now;
    return conn;
}

void GenericConnectionPool::discard_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) return;
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool broken) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    // Closed or shut down: do not reuse
    if (shutdown_.load(std::memory_order_acquire) || broken || !conn->is_connected()) {
        discard_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace sqlorm
