#include "orm/schema.hpp"
#include "db/pooled_connection.hpp"
#include "model/document.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlorm {

namespace {

// Replace a key (or each key of an array) with its associated document
void splice_associations(Map& doc, const std::vector<std::string>& columns,
                         const Map& associations) {
    for (const auto& col : columns) {
        const auto it = doc.find(col);
        if (it == doc.end()) continue;

        Map& value = *it;
        if (value.is_array()) {
            for (auto& entry : value) {
                if (!entry.is_string() && !entry.is_number()) continue;
                const auto found = associations.find(scalar_to_string(entry));
                if (found != associations.end()) {
                    entry = *found;
                }
            }
        } else if (value.is_string() || value.is_number()) {
            const auto found = associations.find(scalar_to_string(value));
            if (found != associations.end()) {
                value = *found;
            }
        }
    }
}

void collect_keys(const Map& doc, const std::vector<std::string>& columns,
                  std::vector<std::string>& keys) {
    for (const auto& col : columns) {
        const auto it = doc.find(col);
        if (it == doc.end()) continue;
        for (auto& key : parse_key_list(*it)) {
            if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
                keys.push_back(std::move(key));
            }
        }
    }
}

// Rename keys from physical column names to field names, keeping their order
Map restore_field_names(const EntitySchema& entity, Map& row) {
    const auto& columns = entity.columns();
    Map renamed = Map::object();
    for (auto it = row.begin(); it != row.end(); ++it) {
        const auto col = std::find_if(columns.begin(), columns.end(),
            [&](const Column& c) { return c.column_name() == it.key(); });
        renamed[col != columns.end() ? col->name() : it.key()] = std::move(it.value());
    }
    return renamed;
}

} // anonymous namespace

Schema::Schema(EntitySchema entity, ConnectionRegistry& registry)
    : compiler_(std::move(entity), registry.encoder(), registry.namespace_prefix()),
      registry_(registry) {}

std::string Schema::model_namespace() const {
    return entity().model_namespace(compiler_.namespace_prefix());
}

// ============================================================================
// Execution
// ============================================================================

Result<DbResultSet> Schema::run(const std::string& pool_name, const std::string& sql) {
    auto pool = registry_.get_pool(pool_name);
    if (!pool) {
        return Result<DbResultSet>::error(ErrorCategory::POOL_UNAVAILABLE,
            std::format("no connection pool named '{}'", pool_name));
    }

    auto acquired = pool->acquire();
    if (acquired.is_error()) {
        return Result<DbResultSet>::error_from(acquired);
    }
    auto& conn = acquired.value();

    utils::Timer timer;
    auto result = conn->get()->execute(sql);
    if (!result.success) {
        if (!conn->is_valid()) {
            conn->mark_broken();
        }
        utils::log::debug(std::format("Statement failed on pool '{}' after {}ms: {} | SQL: {}",
            pool_name, timer.elapsed_ms().count(),
            utils::trim(result.error_message), utils::abbreviate(sql)));
        return Result<DbResultSet>::error(ErrorCategory::DRIVER_ERROR,
            std::move(result.error_message));
    }
    return Result<DbResultSet>::ok(std::move(result));
}

Result<uint64_t> Schema::run_mutation(const std::string& sql) {
    auto result = run(entity().writer_name(), sql);
    if (result.is_error()) {
        return Result<uint64_t>::error_from(result);
    }
    return Result<uint64_t>::ok(result.value().affected_rows);
}

Result<std::vector<Map>> Schema::run_select(const std::string& sql) {
    auto result = run(entity().reader_name(), sql);
    if (result.is_error()) {
        return Result<std::vector<Map>>::error_from(result);
    }
    return compiler_.encoder().decode_rows(result.value());
}

Result<std::vector<Map>> Schema::run_entity_select(const std::string& sql) {
    auto rows = run_select(sql);
    if (rows.is_error()) {
        return rows;
    }
    for (auto& row : rows.value()) {
        row = restore_field_names(entity(), row);
    }
    return rows;
}

// ============================================================================
// DDL
// ============================================================================

Result<uint64_t> Schema::create_table() {
    return run_mutation(compiler_.create_table());
}

Result<uint64_t> Schema::create_indexes() {
    uint64_t created = 0;
    for (const auto& sql : compiler_.create_indexes()) {
        auto result = run_mutation(sql);
        if (result.is_error()) {
            return result;
        }
        ++created;
    }
    return Result<uint64_t>::ok(created);
}

// ============================================================================
// Mutations
// ============================================================================

Result<uint64_t> Schema::insert(const Map& doc) {
    return run_mutation(compiler_.insert(doc));
}

Result<uint64_t> Schema::insert_many(const std::vector<Map>& docs) {
    const auto sql = compiler_.insert_many(docs);
    if (sql.empty()) {
        return Result<uint64_t>::ok(0);
    }
    return run_mutation(sql);
}

Result<uint64_t> Schema::update(const Map& doc) {
    const auto sql = compiler_.update(doc);
    if (sql.empty()) {
        return Result<uint64_t>::ok(0);
    }
    return run_mutation(sql);
}

Result<uint64_t> Schema::update_one(const Query& query, const Mutation& mutation) {
    const auto sql = compiler_.update_one(query, mutation);
    if (sql.empty()) {
        return Result<uint64_t>::ok(0);
    }
    return run_mutation(sql);
}

Result<uint64_t> Schema::update_many(const Query& query, const Mutation& mutation) {
    const auto sql = compiler_.update_many(query, mutation);
    if (sql.empty()) {
        return Result<uint64_t>::ok(0);
    }
    return run_mutation(sql);
}

Result<uint64_t> Schema::upsert(const Map& doc) {
    return run_mutation(compiler_.upsert(doc));
}

Result<uint64_t> Schema::delete_entity(const Map& doc) {
    return run_mutation(compiler_.delete_entity(doc));
}

Result<uint64_t> Schema::delete_one(const Query& query) {
    return run_mutation(compiler_.delete_one(query));
}

Result<uint64_t> Schema::delete_many(const Query& query) {
    return run_mutation(compiler_.delete_many(query));
}

// ============================================================================
// Selects
// ============================================================================

Result<std::vector<Map>> Schema::find(const Query& query) {
    return run_entity_select(compiler_.find(query));
}

Result<std::optional<Map>> Schema::find_one(const Query& query) {
    auto rows = run_entity_select(compiler_.find_one(query));
    if (rows.is_error()) {
        return Result<std::optional<Map>>::error_from(rows);
    }
    if (rows.value().empty()) {
        return Result<std::optional<Map>>::ok(std::nullopt);
    }
    return Result<std::optional<Map>>::ok(std::move(rows.value().front()));
}

Result<uint64_t> Schema::count(const Query& query) {
    auto rows = run_select(compiler_.count(query));
    if (rows.is_error()) {
        return Result<uint64_t>::error_from(rows);
    }
    if (rows.value().empty()) {
        return Result<uint64_t>::ok(0);
    }

    const Map& row = rows.value().front();
    const auto it = row.find("count");
    if (it == row.end() || !it->is_number_integer() || it->get<int64_t>() < 0) {
        return Result<uint64_t>::error(ErrorCategory::DECODE_ERROR,
            "column 'count': expected a non-negative integer");
    }
    return Result<uint64_t>::ok(it->get<uint64_t>());
}

Result<Map> Schema::load_associations(Query query, const std::vector<std::string>& keys) {
    const auto& primary_key = entity().primary_key();
    Map key_list = Map::array();
    for (const auto& key : keys) {
        key_list.push_back(key);
    }
    query.add_filter(primary_key, Map{{"$in", std::move(key_list)}});
    if (!query.fields().empty()) {
        query.add_field(primary_key);
    }

    auto rows = run_entity_select(compiler_.fetch(query));
    if (rows.is_error()) {
        return Result<Map>::error_from(rows);
    }

    Map associations = Map::object();
    for (auto& row : rows.value()) {
        const auto it = row.find(primary_key);
        if (it == row.end() || it->is_null()) continue;
        const std::string key = scalar_to_string(*it);
        associations[key] = std::move(row);
    }
    return Result<Map>::ok(std::move(associations));
}

Result<uint64_t> Schema::fetch(Query query, std::vector<Map>& data,
                               const std::vector<std::string>& columns) {
    std::vector<std::string> keys;
    for (const auto& row : data) {
        collect_keys(row, columns, keys);
    }
    if (keys.empty()) {
        return Result<uint64_t>::ok(0);
    }

    auto associations = load_associations(std::move(query), keys);
    if (associations.is_error()) {
        return Result<uint64_t>::error_from(associations);
    }

    for (auto& row : data) {
        splice_associations(row, columns, associations.value());
    }
    return Result<uint64_t>::ok(associations.value().size());
}

Result<uint64_t> Schema::fetch_one(Query query, Map& data, const std::vector<std::string>& columns) {
    std::vector<std::string> keys;
    collect_keys(data, columns, keys);
    if (keys.empty()) {
        return Result<uint64_t>::ok(0);
    }

    auto associations = load_associations(std::move(query), keys);
    if (associations.is_error()) {
        return Result<uint64_t>::error_from(associations);
    }

    splice_associations(data, columns, associations.value());
    return Result<uint64_t>::ok(associations.value().size());
}

Result<Map> Schema::try_get_model(std::string_view primary_key) {
    auto rows = run_entity_select(compiler_.select_by_primary_key(primary_key));
    if (rows.is_error()) {
        return Result<Map>::error_from(rows);
    }
    if (rows.value().empty()) {
        return Result<Map>::error(ErrorCategory::ROW_NOT_FOUND,
            std::format("no row in '{}' with {} = '{}'",
                        table_name(), entity().primary_key(), primary_key));
    }
    return Result<Map>::ok(std::move(rows.value().front()));
}

// ============================================================================
// Raw SQL
// ============================================================================

Result<uint64_t> Schema::execute(const std::string& sql) {
    return run_mutation(sql);
}

Result<std::vector<Map>> Schema::query(const std::string& sql) {
    return run_select(sql);
}

Result<std::optional<Map>> Schema::query_one(const std::string& sql) {
    auto rows = run_select(sql);
    if (rows.is_error()) {
        return Result<std::optional<Map>>::error_from(rows);
    }
    if (rows.value().empty()) {
        return Result<std::optional<Map>>::ok(std::nullopt);
    }
    return Result<std::optional<Map>>::ok(std::move(rows.value().front()));
}

} // namespace sqlorm
