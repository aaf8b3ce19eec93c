#pragma once

#include "core/error.hpp"
#include "db/connection_registry.hpp"
#include "model/query.hpp"
#include "orm/entity_schema.hpp"
#include "orm/sql_compiler.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlorm {

/**
 * @brief Executes compiled statements for one entity
 *
 * Pairs a SqlCompiler with the pools of a ConnectionRegistry. Selects run on
 * the entity's reader pool, DDL and mutations on its writer pool. Execution
 * blocks the calling thread; the only wait is the bounded pool acquisition.
 *
 * Every operation returns a Result: POOL_UNAVAILABLE or ACQUIRE_TIMEOUT when
 * no connection could be had, DRIVER_ERROR when the statement failed,
 * DECODE_ERROR when a row could not be turned into a document.
 *
 * The registry must outlive the Schema.
 */
class Schema {
public:
    Schema(EntitySchema entity, ConnectionRegistry& registry);

    [[nodiscard]] const SqlCompiler& compiler() const { return compiler_; }
    [[nodiscard]] const EntitySchema& entity() const { return compiler_.entity(); }
    [[nodiscard]] const std::string& table_name() const { return compiler_.table_name(); }
    [[nodiscard]] std::string model_namespace() const;

    // ========================================================================
    // DDL
    // ========================================================================

    [[nodiscard]] Result<uint64_t> create_table();

    /**
     * @return Number of index statements executed
     */
    [[nodiscard]] Result<uint64_t> create_indexes();

    // ========================================================================
    // Mutations (rows affected)
    // ========================================================================

    [[nodiscard]] Result<uint64_t> insert(const Map& doc);
    [[nodiscard]] Result<uint64_t> insert_many(const std::vector<Map>& docs);
    [[nodiscard]] Result<uint64_t> update(const Map& doc);

    // At most one row: the first under the query's sort order
    [[nodiscard]] Result<uint64_t> update_one(const Query& query, const Mutation& mutation);
    [[nodiscard]] Result<uint64_t> update_many(const Query& query, const Mutation& mutation);
    [[nodiscard]] Result<uint64_t> upsert(const Map& doc);
    [[nodiscard]] Result<uint64_t> delete_entity(const Map& doc);
    [[nodiscard]] Result<uint64_t> delete_one(const Query& query);
    [[nodiscard]] Result<uint64_t> delete_many(const Query& query);

    // ========================================================================
    // Selects
    // ========================================================================

    [[nodiscard]] Result<std::vector<Map>> find(const Query& query);
    [[nodiscard]] Result<std::optional<Map>> find_one(const Query& query);
    [[nodiscard]] Result<uint64_t> count(const Query& query);

    /**
     * @brief Replace foreign-key values in @p data with the documents of
     *        this entity they reference
     *
     * Collects the keys held by @p columns across all rows (a string or an
     * array of keys), loads them with a single IN query and splices each
     * associated document in place. Keys without a match are left as is.
     *
     * @return Number of distinct associated documents loaded
     */
    [[nodiscard]] Result<uint64_t> fetch(Query query, std::vector<Map>& data,
                                         const std::vector<std::string>& columns);

    /**
     * @brief fetch() for a single document
     */
    [[nodiscard]] Result<uint64_t> fetch_one(Query query, Map& data,
                                             const std::vector<std::string>& columns);

    /**
     * @brief Row by primary key; ROW_NOT_FOUND when there is none
     */
    [[nodiscard]] Result<Map> try_get_model(std::string_view primary_key);

    // ========================================================================
    // Raw SQL
    // ========================================================================

    [[nodiscard]] Result<uint64_t> execute(const std::string& sql);
    [[nodiscard]] Result<std::vector<Map>> query(const std::string& sql);
    [[nodiscard]] Result<std::optional<Map>> query_one(const std::string& sql);

private:
    /**
     * @brief Acquire from the named pool and run one statement
     */
    [[nodiscard]] Result<DbResultSet> run(const std::string& pool_name, const std::string& sql);

    [[nodiscard]] Result<uint64_t> run_mutation(const std::string& sql);
    [[nodiscard]] Result<std::vector<Map>> run_select(const std::string& sql);

    /**
     * @brief run_select() with physical column names mapped back to field names
     */
    [[nodiscard]] Result<std::vector<Map>> run_entity_select(const std::string& sql);

    /**
     * @brief Load the documents for @p keys, keyed by primary-key text
     */
    [[nodiscard]] Result<Map> load_associations(Query query, const std::vector<std::string>& keys);

    SqlCompiler compiler_;
    ConnectionRegistry& registry_;
};

} // namespace sqlorm
