#pragma once

#include "core/database_type.hpp"
#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include "model/column.hpp"
#include "model/query.hpp"
#include "orm/type_table.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlorm {

struct EncoderOptions {
    // Malformed filter values and unknown $-operators compile to FALSE
    bool strict_filters = false;
};

/**
 * @brief Per-dialect strategy for literals, DDL tokens, filter predicates
 * and row decoding
 *
 * The shared algorithms (value encoding, the filter operator compiler,
 * row decoding) live here; concrete encoders supply the dialect tables
 * and syntax through the protected hooks. Encoding never fails: malformed
 * input degrades to NULL or a best-effort predicate (FALSE in strict mode).
 *
 * Thread-safe: instances are immutable after construction.
 */
class DialectEncoder {
public:
    explicit DialectEncoder(EncoderOptions options = {});
    virtual ~DialectEncoder() = default;

    [[nodiscard]] virtual DatabaseType type() const = 0;
    [[nodiscard]] bool strict_filters() const { return options_.strict_filters; }

    // ========================================================================
    // Column model
    // ========================================================================

    /**
     * @brief DDL type token; unknown semantic types pass through verbatim
     */
    [[nodiscard]] virtual std::string column_type(const Column& col) const;

    // ========================================================================
    // Values
    // ========================================================================

    /**
     * @brief SQL literal for an optional document value
     * @param value nullptr when the field is absent
     */
    [[nodiscard]] std::string encode_value(const Column& col, const Map* value) const;

    /**
     * @brief Type-directed literal for a textual value, NULL on parse failure
     */
    [[nodiscard]] std::string format_value(const Column& col, std::string_view value) const;

    /**
     * @brief Escaped string literal ('it''s')
     */
    [[nodiscard]] virtual std::string escape_string(std::string_view value) const;

    /**
     * @brief Identifier, quoted only when it is not a plain lowercase name
     */
    [[nodiscard]] std::string format_field(std::string_view field) const;

    // ========================================================================
    // Filters
    // ========================================================================

    /**
     * @brief Boolean SQL expression for one filter entry, empty = no constraint
     */
    [[nodiscard]] std::string format_filter(const Column& col, std::string_view field,
                                            const Map& value) const;

    /**
     * @brief Full-text predicate for a {"$fields","$search","$language"} object
     */
    [[nodiscard]] virtual std::optional<std::string> parse_text_search(const Map& filter) const = 0;

    // ========================================================================
    // Statement fragments used by SqlCompiler
    // ========================================================================

    [[nodiscard]] virtual std::string format_pagination(const Query& query) const = 0;

    // "" or " AUTO_INCREMENT"
    [[nodiscard]] virtual std::string auto_increment_clause(const Column& col) const = 0;

    [[nodiscard]] virtual std::string create_index(std::string_view table, const Column& col) const = 0;

    [[nodiscard]] virtual std::string create_text_search_index(
        std::string_view table, std::string_view language,
        const std::vector<std::string>& columns) const = 0;

    // Trailing clause of an upsert given "col = value" assignments
    [[nodiscard]] virtual std::string upsert_clause(std::string_view primary_key,
                                                    const std::vector<std::string>& assignments) const = 0;

    /**
     * @brief "pk IN (...)" predicate selecting at most one row
     * @param conditions WHERE/ORDER BY fragments already rendered ("" allowed)
     */
    [[nodiscard]] virtual std::string bounded_primary_key(std::string_view table,
                                                          std::string_view primary_key,
                                                          std::string_view conditions) const = 0;

    // ========================================================================
    // Row decoding
    // ========================================================================

    /**
     * @brief Convert one cell by its native type name
     *
     * NULL cells decode to null, unknown native types to null.
     */
    [[nodiscard]] virtual Result<Map> decode_value(std::string_view native_type,
                                                   const DbValue& value) const = 0;

    /**
     * @brief Decode one row into a document keyed by column name
     */
    [[nodiscard]] Result<Map> decode_row(const DbResultSet& result, size_t row_index) const;

    [[nodiscard]] Result<std::vector<Map>> decode_rows(const DbResultSet& result) const;

protected:
    [[nodiscard]] virtual const TypeTable& type_table() const = 0;

    [[nodiscard]] virtual char identifier_quote() const = 0;

    /**
     * @brief SQL expression for a temporal keyword ("now", "today", ...)
     * @return nullopt when the value is not a keyword for this type
     */
    [[nodiscard]] virtual std::optional<std::string> temporal_keyword(
        SemanticType type, std::string_view keyword) const = 0;

    // hex is validated, lowercase or uppercase digits
    [[nodiscard]] virtual std::string bytes_literal(std::string_view hex) const = 0;

    // elements are already rendered literals
    [[nodiscard]] virtual std::string array_literal(const Column& col,
                                                    const std::vector<std::string>& elements) const = 0;

    // json_text is serialized JSON (object or array)
    [[nodiscard]] virtual std::string json_literal(std::string_view json_text) const = 0;

    // Array column predicates: any-of (overlap) and all-of (containment)
    [[nodiscard]] virtual std::string array_overlaps(std::string_view field,
                                                     std::string_view literal) const = 0;
    [[nodiscard]] virtual std::string array_contains(std::string_view field,
                                                     std::string_view literal) const = 0;
    [[nodiscard]] virtual std::string array_length(std::string_view field) const = 0;

    // Map column predicates
    [[nodiscard]] virtual std::string map_contains(std::string_view field,
                                                   std::string_view literal) const = 0;
    [[nodiscard]] virtual std::string map_path_exists(std::string_view field,
                                                      std::string_view path) const = 0;

    /**
     * @brief Dialect form of a string match prefix ("~", "~*", "!~", "!~*", "!")
     * @return nullopt when the prefix is not a supported operator
     */
    [[nodiscard]] virtual std::optional<std::string> pattern_operator(std::string_view prefix) const = 0;

    // Shared decoding helpers
    [[nodiscard]] static Result<Map> decode_integer(std::string_view text, bool is_unsigned);
    [[nodiscard]] static Result<Map> decode_float(std::string_view text);
    [[nodiscard]] static Result<Map> decode_json(std::string_view text);
    [[nodiscard]] static Map bytes_to_array(std::string_view raw);

private:
    [[nodiscard]] std::optional<std::string> try_format_value(const Column& col,
                                                              std::string_view value) const;
    [[nodiscard]] std::string encode_array(const Column& col, const Map& value) const;
    [[nodiscard]] std::string format_operator_filter(const Column& col, const std::string& field,
                                                     const Map& operators) const;
    [[nodiscard]] std::string format_ordered_filter(const Column& col, const std::string& field,
                                                    std::string_view value) const;
    [[nodiscard]] std::string format_string_filter(const Column& col, const std::string& field,
                                                   std::string_view value) const;
    [[nodiscard]] std::string format_uuid_filter(const Column& col, const std::string& field,
                                                 std::string_view value) const;
    [[nodiscard]] std::string format_array_filter(const Column& col, const std::string& field,
                                                  std::string_view value) const;
    [[nodiscard]] std::string format_list(const Column& col, const Map& values) const;
    [[nodiscard]] std::string reject_filter(std::string_view field, std::string_view reason) const;

    EncoderOptions options_;
};

} // namespace sqlorm
