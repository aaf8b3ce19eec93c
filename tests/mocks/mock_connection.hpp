#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sqlorm::testing {

/**
 * @brief State shared by a MockConnectionFactory and every connection it made
 *
 * Records each statement executed on any connection and replays queued
 * result sets in order. With nothing queued a statement succeeds with no
 * rows and no affected rows. A responder, when set, answers first; it runs
 * under the database lock.
 */
struct ScriptedDatabase {
    void queue(DbResultSet result) {
        std::lock_guard lock(mutex);
        responses.push_back(std::move(result));
    }

    DbResultSet next(const std::string& sql) {
        std::lock_guard lock(mutex);
        statements.push_back(sql);
        if (responder) {
            if (auto answer = responder(sql)) {
                return std::move(*answer);
            }
        }
        if (responses.empty()) {
            DbResultSet ok;
            ok.success = true;
            return ok;
        }
        DbResultSet result = std::move(responses.front());
        responses.pop_front();
        return result;
    }

    std::vector<std::string> executed() const {
        std::lock_guard lock(mutex);
        return statements;
    }

    mutable std::mutex mutex;
    std::vector<std::string> statements;
    std::deque<DbResultSet> responses;
    std::function<std::optional<DbResultSet>(const std::string&)> responder;

    std::atomic<bool> refuse_connections{false};
    std::atomic<bool> healthy{true};
    std::atomic<int> connections_created{0};
    std::atomic<int> health_checks{0};
};

class MockConnection : public IDbConnection {
public:
    MockConnection(int id, std::shared_ptr<ScriptedDatabase> db)
        : id_(id), db_(std::move(db)) {}

    DbResultSet execute(const std::string& sql) override {
        return db_->next(sql);
    }

    bool is_healthy(const std::string&) override {
        db_->health_checks.fetch_add(1);
        return connected_ && db_->healthy.load();
    }

    bool is_connected() const override { return connected_; }
    void close() override { connected_ = false; }

    int id() const { return id_; }

private:
    int id_;
    std::shared_ptr<ScriptedDatabase> db_;
    bool connected_ = true;
};

class MockConnectionFactory : public IConnectionFactory {
public:
    explicit MockConnectionFactory(std::shared_ptr<ScriptedDatabase> db = std::make_shared<ScriptedDatabase>())
        : db_(std::move(db)) {}

    std::unique_ptr<IDbConnection> create(const ConnectOptions& options) override {
        {
            std::lock_guard lock(db_->mutex);
            last_options_ = options;
        }
        if (db_->refuse_connections.load()) {
            return nullptr;
        }
        const int id = db_->connections_created.fetch_add(1);
        return std::make_unique<MockConnection>(id, db_);
    }

    const std::shared_ptr<ScriptedDatabase>& db() const { return db_; }

    ConnectOptions last_options() const {
        std::lock_guard lock(db_->mutex);
        return last_options_;
    }

private:
    std::shared_ptr<ScriptedDatabase> db_;
    ConnectOptions last_options_;
};

// ============================================================================
// Result set builders
// ============================================================================

inline DbResultSet rows_result(std::vector<std::string> names,
                               std::vector<std::string> types,
                               std::vector<std::vector<DbValue>> rows) {
    DbResultSet rs;
    rs.success = true;
    rs.has_rows = true;
    rs.column_names = std::move(names);
    rs.column_types = std::move(types);
    rs.rows = std::move(rows);
    rs.affected_rows = rs.rows.size();
    return rs;
}

inline DbResultSet affected_result(uint64_t n) {
    DbResultSet rs;
    rs.success = true;
    rs.affected_rows = n;
    return rs;
}

inline DbResultSet error_result(std::string message) {
    DbResultSet rs;
    rs.success = false;
    rs.error_message = std::move(message);
    return rs;
}

} // namespace sqlorm::testing
