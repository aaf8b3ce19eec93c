#pragma once

#include "db/idb_connection.hpp"

#include <functional>
#include <memory>

namespace sqlorm {

/**
 * @brief RAII wrapper for a pooled database connection
 *
 * Returns the connection to its pool on destruction. A connection marked
 * broken is closed by the pool instead of being reused.
 * Move-only.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool broken)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Discard the connection on return rather than reusing it
     */
    void mark_broken() { broken_ = true; }

private:
    void release();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool broken_ = false;
};

} // namespace sqlorm
