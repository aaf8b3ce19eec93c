#pragma once

#include "model/document.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sqlorm {

/**
 * @brief Semantic type resolved from a column's type tag
 *
 * UNKNOWN keeps the raw tag, which is then used verbatim as the DDL token.
 */
enum class SemanticType : uint8_t {
    BOOL,
    I8, I16, I32, I64,
    U8, U16, U32, U64,
    F32, F64,
    STRING,
    DATE_TIME,          // timestamp with time zone
    NAIVE_DATE_TIME,    // timestamp without time zone
    DATE,
    TIME,
    UUID,
    BYTES,
    STRING_ARRAY,
    UUID_ARRAY,
    MAP,
    UNKNOWN
};

inline constexpr size_t kSemanticTypeCount = static_cast<size_t>(SemanticType::UNKNOWN) + 1;

/**
 * @brief Resolve a type tag such as "u64", "Vec<String>" or "Option<Uuid>"
 */
[[nodiscard]] SemanticType parse_semantic_type(std::string_view tag);

[[nodiscard]] const char* semantic_type_to_string(SemanticType type);

[[nodiscard]] constexpr bool is_unsigned_type(SemanticType t) {
    return t == SemanticType::U8 || t == SemanticType::U16
        || t == SemanticType::U32 || t == SemanticType::U64;
}

[[nodiscard]] constexpr bool is_integer_type(SemanticType t) {
    return t == SemanticType::I8 || t == SemanticType::I16
        || t == SemanticType::I32 || t == SemanticType::I64 || is_unsigned_type(t);
}

[[nodiscard]] constexpr bool is_float_type(SemanticType t) {
    return t == SemanticType::F32 || t == SemanticType::F64;
}

[[nodiscard]] constexpr bool is_temporal_type(SemanticType t) {
    return t == SemanticType::DATE_TIME || t == SemanticType::NAIVE_DATE_TIME
        || t == SemanticType::DATE || t == SemanticType::TIME;
}

// Types whose scalar filters accept "min,max" ranges and comparison prefixes
[[nodiscard]] constexpr bool is_ordered_type(SemanticType t) {
    return is_integer_type(t) || is_float_type(t) || is_temporal_type(t);
}

[[nodiscard]] constexpr bool is_array_type(SemanticType t) {
    return t == SemanticType::STRING_ARRAY || t == SemanticType::UUID_ARRAY;
}

/**
 * @brief Index kind declared on a column
 */
enum class IndexKind : uint8_t {
    NONE,
    HASH,
    BTREE,
    GIN,
    TEXT        // full-text search, grouped per language
};

/**
 * @brief Foreign-key target of a column
 */
struct Reference {
    std::string target_entity;
    std::string target_column = "id";
};

/**
 * @brief Construction parameters for a Column
 *
 * Example:
 *   Column col({.name = "age", .type_name = "u32", .nullable = false});
 */
struct ColumnSpec {
    std::string name;
    std::string type_name;
    bool nullable = true;
    std::optional<std::string> default_value;
    std::optional<std::string> index_type;   // "hash", "btree", "gin", "text" or "text:<language>"
    bool auto_increment = false;
    std::optional<Reference> reference;
    Map extra = Map::object();               // opaque bag: column_name, on_delete, on_update, ...
};

/**
 * @brief Schema metadata for one persisted field of an entity
 *
 * Immutable after construction.
 */
class Column {
public:
    explicit Column(ColumnSpec spec);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& type_name() const { return type_name_; }
    [[nodiscard]] SemanticType semantic_type() const { return semantic_type_; }
    [[nodiscard]] bool is_nullable() const { return nullable_; }
    [[nodiscard]] bool is_not_null() const { return !nullable_; }
    [[nodiscard]] const std::optional<std::string>& default_value() const { return default_value_; }
    [[nodiscard]] bool has_default() const { return default_value_.has_value(); }
    [[nodiscard]] const std::optional<std::string>& index_type() const { return index_type_; }
    [[nodiscard]] IndexKind index_kind() const { return index_kind_; }
    [[nodiscard]] bool auto_increment() const { return auto_increment_; }
    [[nodiscard]] const std::optional<Reference>& reference() const { return reference_; }
    [[nodiscard]] const Map& extra() const { return extra_; }

    /**
     * @brief Physical column name: extra.column_name when set, else the field name
     */
    [[nodiscard]] const std::string& column_name() const { return column_name_; }

    /**
     * @brief Language of a text index ("text:german" → "german"), "english" by default
     *
     * Only lowercase letters, digits and '_' are accepted; anything else
     * falls back to "english".
     */
    [[nodiscard]] std::string text_search_language() const;

    [[nodiscard]] std::optional<std::string> extra_string(std::string_view key) const;

private:
    std::string name_;
    std::string type_name_;
    SemanticType semantic_type_;
    bool nullable_;
    std::optional<std::string> default_value_;
    std::optional<std::string> index_type_;
    IndexKind index_kind_ = IndexKind::NONE;
    bool auto_increment_;
    std::optional<Reference> reference_;
    Map extra_;
    std::string column_name_;
};

} // namespace sqlorm
