#pragma once

#include "db/idb_backend.hpp"
#include "core/database_type.hpp"
#include <memory>
#include <unordered_map>
#include <functional>

namespace sqlorm {

/**
 * @brief Registry for database backends
 *
 * An explicitly owned object rather than a process-wide singleton: the
 * caller builds one (usually via with_builtin_backends()), optionally
 * registers extra backends, and hands it to ConnectionRegistry.
 *
 * Usage:
 *   auto backends = BackendRegistry::with_builtin_backends();
 *   backends.register_backend(DatabaseType::MYSQL,
 *       [] { return std::make_unique<MyBackend>(); });
 *   auto backend = backends.create(DatabaseType::MYSQL);
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDbBackend>()>;

    BackendRegistry() = default;

    /**
     * @brief Registry pre-populated with the PostgreSQL and MySQL backends
     */
    [[nodiscard]] static BackendRegistry with_builtin_backends();

    void register_backend(DatabaseType type, Factory factory);

    /**
     * @throws std::runtime_error when no backend is registered for the type
     */
    [[nodiscard]] std::unique_ptr<IDbBackend> create(DatabaseType type) const;

    [[nodiscard]] bool has_backend(DatabaseType type) const;

private:
    // Use a simple struct hash for DatabaseType
    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

} // namespace sqlorm
