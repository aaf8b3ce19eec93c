#include "db/backend_registry.hpp"
#include "db/postgresql/pg_backend.hpp"
#include "db/mysql/mysql_backend.hpp"

#include <format>
#include <stdexcept>

namespace sqlorm {

BackendRegistry BackendRegistry::with_builtin_backends() {
    BackendRegistry registry;
    registry.register_backend(DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgBackend>(); });
    registry.register_backend(DatabaseType::MYSQL,
        [] { return std::make_unique<MysqlBackend>(); });
    return registry;
}

void BackendRegistry::register_backend(DatabaseType type, Factory factory) {
    factories_[type] = std::move(factory);
}

std::unique_ptr<IDbBackend> BackendRegistry::create(DatabaseType type) const {
    const auto it = factories_.find(type);
    if (it == factories_.end()) {
        throw std::runtime_error(std::format(
            "No backend registered for database type: {}", database_type_to_string(type)));
    }
    return it->second();
}

bool BackendRegistry::has_backend(DatabaseType type) const {
    return factories_.contains(type);
}

} // namespace sqlorm
