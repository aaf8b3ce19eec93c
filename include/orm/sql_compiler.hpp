#pragma once

#include "model/query.hpp"
#include "orm/dialect_encoder.hpp"
#include "orm/entity_schema.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sqlorm {

/**
 * @brief Builds complete SQL statements for one entity
 *
 * Pure string generation: no I/O, no errors. Compiling the same input
 * twice yields byte-identical text. Methods that may have nothing to do
 * (no rows, no assignable fields) return an empty string.
 */
class SqlCompiler {
public:
    SqlCompiler(EntitySchema entity, std::shared_ptr<const DialectEncoder> encoder,
                std::string namespace_prefix);

    [[nodiscard]] const EntitySchema& entity() const { return entity_; }
    [[nodiscard]] const DialectEncoder& encoder() const { return *encoder_; }
    [[nodiscard]] const std::string& table_name() const { return table_name_; }
    [[nodiscard]] const std::string& namespace_prefix() const { return namespace_prefix_; }

    // ========================================================================
    // DDL
    // ========================================================================

    [[nodiscard]] std::string create_table() const;

    /**
     * @brief One statement per indexed column plus one per text-search language
     */
    [[nodiscard]] std::vector<std::string> create_indexes() const;

    // ========================================================================
    // DML
    // ========================================================================

    [[nodiscard]] std::string insert(const Map& doc) const;
    [[nodiscard]] std::string insert_many(const std::vector<Map>& docs) const;
    [[nodiscard]] std::string update(const Map& doc) const;
    [[nodiscard]] std::string update_one(const Query& query, const Mutation& mutation) const;
    [[nodiscard]] std::string update_many(const Query& query, const Mutation& mutation) const;
    [[nodiscard]] std::string upsert(const Map& doc) const;
    [[nodiscard]] std::string delete_entity(const Map& doc) const;
    [[nodiscard]] std::string delete_one(const Query& query) const;
    [[nodiscard]] std::string delete_many(const Query& query) const;

    // ========================================================================
    // Selects
    // ========================================================================

    [[nodiscard]] std::string find(const Query& query) const;
    [[nodiscard]] std::string find_one(const Query& query) const;
    [[nodiscard]] std::string count(const Query& query) const;

    /**
     * @brief Unpaginated select used to load associations
     */
    [[nodiscard]] std::string fetch(const Query& query) const;

    [[nodiscard]] std::string select_by_primary_key(std::string_view key) const;

    // ========================================================================
    // Fragments
    // ========================================================================

    // Projection list, "*" when the query selects all columns
    [[nodiscard]] std::string format_fields(const Query& query) const;

    // "WHERE ..." or ""
    [[nodiscard]] std::string format_filters(const Query& query) const;

    // "ORDER BY ..." or ""
    [[nodiscard]] std::string format_sort(const Query& query) const;

    // "a = 1, b = 'x'"; fields without a column are skipped
    [[nodiscard]] std::string format_update(const Mutation& mutation) const;

private:
    [[nodiscard]] std::string column_list() const;
    [[nodiscard]] std::string value_tuple(const Map& doc) const;
    [[nodiscard]] std::vector<std::string> snapshot_assignments(const Map& doc) const;
    [[nodiscard]] std::string primary_key_condition(const Map& doc) const;
    [[nodiscard]] std::string bounded_condition(const Query& query) const;

    EntitySchema entity_;
    std::shared_ptr<const DialectEncoder> encoder_;
    std::string namespace_prefix_;
    std::string table_name_;
};

} // namespace sqlorm
