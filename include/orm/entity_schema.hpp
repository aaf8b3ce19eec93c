#pragma once

#include "model/column.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sqlorm {

struct EntityOptions {
    std::string primary_key = "id";
    std::string reader_name = "main";   // pool used for selects
    std::string writer_name = "main";   // pool used for DDL and mutations
};

/**
 * @brief Static schema of one persisted entity type
 *
 * Throws std::invalid_argument when column names collide or the primary
 * key is not a declared column.
 */
class EntitySchema {
public:
    EntitySchema(std::string entity_name, std::vector<Column> columns, EntityOptions options = {});

    [[nodiscard]] const std::string& entity_name() const { return entity_name_; }
    [[nodiscard]] const std::vector<Column>& columns() const { return columns_; }
    [[nodiscard]] const std::string& primary_key() const { return options_.primary_key; }
    [[nodiscard]] const std::string& reader_name() const { return options_.reader_name; }
    [[nodiscard]] const std::string& writer_name() const { return options_.writer_name; }

    /**
     * @brief Column declared for a field, nullptr when there is none
     */
    [[nodiscard]] const Column* get_column(std::string_view name) const;

    [[nodiscard]] const Column& primary_key_column() const;

    /**
     * @brief "{namespace}_{entity}" with non-alphanumeric characters replaced by '_'
     */
    [[nodiscard]] std::string table_name(std::string_view namespace_prefix) const;

    /**
     * @brief "{namespace}:{entity}"
     */
    [[nodiscard]] std::string model_namespace(std::string_view namespace_prefix) const;

    [[nodiscard]] static std::string format_table_name(std::string_view namespace_prefix,
                                                       std::string_view entity_name);

private:
    std::string entity_name_;
    std::vector<Column> columns_;
    EntityOptions options_;
    size_t primary_key_index_ = 0;
};

} // namespace sqlorm
