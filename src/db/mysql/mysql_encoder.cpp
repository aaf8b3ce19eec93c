#include "db/mysql/mysql_encoder.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlorm {

namespace {

constexpr std::array<std::pair<SemanticType, std::string_view>, 21> kMysqlTypeTokens = {{
    {SemanticType::BOOL, "BOOLEAN"},
    {SemanticType::I8, "TINYINT"},
    {SemanticType::I16, "SMALLINT"},
    {SemanticType::I32, "INT"},
    {SemanticType::I64, "BIGINT"},
    {SemanticType::U8, "TINYINT UNSIGNED"},
    {SemanticType::U16, "SMALLINT UNSIGNED"},
    {SemanticType::U32, "INT UNSIGNED"},
    {SemanticType::U64, "BIGINT UNSIGNED"},
    {SemanticType::F32, "FLOAT"},
    {SemanticType::F64, "DOUBLE"},
    {SemanticType::STRING, "TEXT"},
    {SemanticType::DATE_TIME, "TIMESTAMP(6)"},
    {SemanticType::NAIVE_DATE_TIME, "DATETIME(6)"},
    {SemanticType::DATE, "DATE"},
    {SemanticType::TIME, "TIME"},
    {SemanticType::UUID, "VARCHAR(36)"},
    {SemanticType::BYTES, "BLOB"},
    {SemanticType::STRING_ARRAY, "JSON"},
    {SemanticType::UUID_ARRAY, "JSON"},
    {SemanticType::MAP, "JSON"}
}};

constexpr TypeTable kMysqlTypes = make_type_table(kMysqlTypeTokens);

} // anonymous namespace

const TypeTable& MysqlEncoder::type_table() const {
    return kMysqlTypes;
}

std::string MysqlEncoder::column_type(const Column& col) const {
    if (col.semantic_type() == SemanticType::STRING
        && (col.has_default() || col.index_kind() != IndexKind::NONE)) {
        return "VARCHAR(255)";
    }
    return DialectEncoder::column_type(col);
}

// ============================================================================
// Literals
// ============================================================================

std::string MysqlEncoder::escape_string(std::string_view value) const {
    std::string result;
    result.reserve(value.size() + 2);
    result += '\'';
    for (const char c : value) {
        if (c == '\'') {
            result += "''";
        } else if (c == '\\') {
            result += "\\\\";
        } else {
            result += c;
        }
    }
    result += '\'';
    return result;
}

std::optional<std::string> MysqlEncoder::temporal_keyword(SemanticType type,
                                                          std::string_view keyword) const {
    if (type == SemanticType::DATE) {
        if (keyword == "epoch") return "'1970-01-01'";
        if (keyword == "now" || keyword == "today") return "curdate()";
        if (keyword == "tomorrow") return "curdate() + INTERVAL 1 DAY";
        if (keyword == "yesterday") return "curdate() - INTERVAL 1 DAY";
        return std::nullopt;
    }
    if (type == SemanticType::TIME) {
        if (keyword == "now") return "curtime()";
        if (keyword == "midnight") return "'00:00:00'";
        return std::nullopt;
    }

    if (keyword == "epoch") return "from_unixtime(0)";
    if (keyword == "now") return "current_timestamp(6)";
    if (keyword == "today" || keyword == "midnight") return "curdate()";
    if (keyword == "tomorrow") return "curdate() + INTERVAL 1 DAY";
    if (keyword == "yesterday") return "curdate() - INTERVAL 1 DAY";
    return std::nullopt;
}

std::string MysqlEncoder::bytes_literal(std::string_view hex) const {
    return std::format("X'{}'", hex);
}

std::string MysqlEncoder::array_literal(const Column&,
                                        const std::vector<std::string>& elements) const {
    return std::format("json_array({})", utils::join(elements, ", "));
}

std::string MysqlEncoder::json_literal(std::string_view json_text) const {
    return escape_string(json_text);
}

// ============================================================================
// Predicates
// ============================================================================

std::string MysqlEncoder::array_overlaps(std::string_view field, std::string_view literal) const {
    return std::format("json_overlaps({}, {})", field, literal);
}

std::string MysqlEncoder::array_contains(std::string_view field, std::string_view literal) const {
    return std::format("json_contains({}, {})", field, literal);
}

std::string MysqlEncoder::array_length(std::string_view field) const {
    return std::format("json_length({})", field);
}

std::string MysqlEncoder::map_contains(std::string_view field, std::string_view literal) const {
    return std::format("json_overlaps({}, {})", field, literal);
}

std::string MysqlEncoder::map_path_exists(std::string_view field, std::string_view path) const {
    return std::format("json_contains_path({}, 'one', {})", field, path);
}

std::optional<std::string> MysqlEncoder::pattern_operator(std::string_view prefix) const {
    if (prefix == "~" || prefix == "~*") return "REGEXP";
    if (prefix == "!~" || prefix == "!~*") return "NOT REGEXP";
    if (prefix == "!") return "<>";
    return std::nullopt;
}

std::optional<std::string> MysqlEncoder::parse_text_search(const Map& filter) const {
    if (!filter.is_object()) return std::nullopt;

    const auto fields_it = filter.find("$fields");
    const auto search_it = filter.find("$search");
    if (fields_it == filter.end() || search_it == filter.end() || !search_it->is_string()) {
        return std::nullopt;
    }
    const auto fields = parse_str_array(&*fields_it);
    if (fields.empty()) return std::nullopt;

    // The language is a property of the FULLTEXT index parser, not the query
    std::vector<std::string> columns;
    for (const auto& field : fields) {
        columns.push_back(format_field(field));
    }
    return std::format("match({}) against({})", utils::join(columns, ","),
                       escape_string(search_it->get_ref<const std::string&>()));
}

// ============================================================================
// Statement fragments
// ============================================================================

std::string MysqlEncoder::format_pagination(const Query& query) const {
    if (!query.sort_field().empty() && query.has_filter(query.sort_field())) {
        return std::format("LIMIT {}", query.limit());
    }
    return std::format("LIMIT {}, {}", query.offset(), query.limit());
}

std::string MysqlEncoder::auto_increment_clause(const Column& col) const {
    return col.auto_increment() ? " AUTO_INCREMENT" : "";
}

std::string MysqlEncoder::create_index(std::string_view table, const Column& col) const {
    // InnoDB has no GIN; fall back to BTREE
    const char* kind = col.index_kind() == IndexKind::HASH ? "HASH" : "BTREE";
    return std::format("CREATE INDEX {}_{}_index ON {} ({}) USING {};",
        table, utils::replace_all(col.column_name(), '.', '_'), table,
        format_field(col.column_name()), kind);
}

std::string MysqlEncoder::create_text_search_index(std::string_view table, std::string_view language,
                                                   const std::vector<std::string>& columns) const {
    std::vector<std::string> parts;
    for (const auto& column : columns) {
        parts.push_back(format_field(column));
    }
    return std::format("CREATE FULLTEXT INDEX {}_text_search_{}_index ON {} ({});",
                       table, language, table, utils::join(parts, ", "));
}

std::string MysqlEncoder::upsert_clause(std::string_view primary_key,
                                        const std::vector<std::string>& assignments) const {
    if (assignments.empty()) {
        return std::format("ON DUPLICATE KEY UPDATE {} = {}", primary_key, primary_key);
    }
    return std::format("ON DUPLICATE KEY UPDATE {}", utils::join(assignments, ", "));
}

std::string MysqlEncoder::bounded_primary_key(std::string_view table, std::string_view primary_key,
                                              std::string_view conditions) const {
    // MySQL rejects LIMIT inside IN and reading the table being mutated,
    // so the bounded selection is materialized as a derived table
    const std::string inner = conditions.empty()
        ? std::format("SELECT {} FROM {} LIMIT 1", primary_key, table)
        : std::format("SELECT {} FROM {} {} LIMIT 1", primary_key, table, conditions);
    return std::format("{} IN (SELECT {} FROM ({}) AS t_bounded)", primary_key, primary_key, inner);
}

// ============================================================================
// Row decoding
// ============================================================================

Result<Map> MysqlEncoder::decode_value(std::string_view native_type, const DbValue& value) const {
    if (!value) {
        return Result<Map>::ok(Map(nullptr));
    }
    const std::string& text = *value;

    if (native_type == "BOOLEAN") {
        // TINYINT(1) holds any integer; non-zero is true
        if (const auto flag = utils::try_parse_int<int64_t>(text)) {
            return Result<Map>::ok(Map(*flag != 0));
        }
        return Result<Map>::error(ErrorCategory::DECODE_ERROR,
            std::format("invalid boolean '{}'", utils::abbreviate(text, 64)));
    }

    const bool is_unsigned = native_type.ends_with(" UNSIGNED");
    const std::string_view base = is_unsigned
        ? native_type.substr(0, native_type.size() - 9) : native_type;

    if (base == "TINYINT" || base == "SMALLINT" || base == "MEDIUMINT"
        || base == "INT" || base == "BIGINT") {
        return decode_integer(text, is_unsigned);
    }
    if (base == "FLOAT" || base == "DOUBLE" || base == "DECIMAL") {
        return decode_float(text);
    }
    if (native_type == "TEXT" || native_type == "VARCHAR" || native_type == "CHAR"
        || native_type == "TIMESTAMP" || native_type == "DATETIME"
        || native_type == "DATE" || native_type == "TIME") {
        return Result<Map>::ok(Map(text));
    }
    if (native_type == "BLOB" || native_type == "VARBINARY" || native_type == "BINARY") {
        return Result<Map>::ok(bytes_to_array(text));
    }
    if (native_type == "JSON") {
        return decode_json(text);
    }

    // Unknown native types decode to a placeholder
    return Result<Map>::ok(Map(nullptr));
}

} // namespace sqlorm
