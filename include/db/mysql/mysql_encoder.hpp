#pragma once

#include "orm/dialect_encoder.hpp"

namespace sqlorm {

/**
 * @brief MySQL-family dialect (MySQL, MariaDB, TiDB): JSON columns for
 * arrays and maps, LIMIT m, n, ON DUPLICATE KEY upserts
 */
class MysqlEncoder final : public DialectEncoder {
public:
    using DialectEncoder::DialectEncoder;

    [[nodiscard]] DatabaseType type() const override { return DatabaseType::MYSQL; }

    // TEXT cannot carry a default or a full index, so such strings are VARCHAR(255)
    [[nodiscard]] std::string column_type(const Column& col) const override;

    // Backslashes are escapes in MySQL string literals
    [[nodiscard]] std::string escape_string(std::string_view value) const override;

    [[nodiscard]] std::optional<std::string> parse_text_search(const Map& filter) const override;
    [[nodiscard]] std::string format_pagination(const Query& query) const override;
    [[nodiscard]] std::string auto_increment_clause(const Column& col) const override;
    [[nodiscard]] std::string create_index(std::string_view table, const Column& col) const override;
    [[nodiscard]] std::string create_text_search_index(
        std::string_view table, std::string_view language,
        const std::vector<std::string>& columns) const override;
    [[nodiscard]] std::string upsert_clause(std::string_view primary_key,
                                            const std::vector<std::string>& assignments) const override;
    [[nodiscard]] std::string bounded_primary_key(std::string_view table,
                                                  std::string_view primary_key,
                                                  std::string_view conditions) const override;

    [[nodiscard]] Result<Map> decode_value(std::string_view native_type,
                                           const DbValue& value) const override;

protected:
    [[nodiscard]] const TypeTable& type_table() const override;
    [[nodiscard]] char identifier_quote() const override { return '`'; }
    [[nodiscard]] std::optional<std::string> temporal_keyword(
        SemanticType type, std::string_view keyword) const override;
    [[nodiscard]] std::string bytes_literal(std::string_view hex) const override;
    [[nodiscard]] std::string array_literal(const Column& col,
                                            const std::vector<std::string>& elements) const override;
    [[nodiscard]] std::string json_literal(std::string_view json_text) const override;
    [[nodiscard]] std::string array_overlaps(std::string_view field,
                                             std::string_view literal) const override;
    [[nodiscard]] std::string array_contains(std::string_view field,
                                             std::string_view literal) const override;
    [[nodiscard]] std::string array_length(std::string_view field) const override;
    [[nodiscard]] std::string map_contains(std::string_view field,
                                           std::string_view literal) const override;
    [[nodiscard]] std::string map_path_exists(std::string_view field,
                                              std::string_view path) const override;
    [[nodiscard]] std::optional<std::string> pattern_operator(std::string_view prefix) const override;
};

} // namespace sqlorm
