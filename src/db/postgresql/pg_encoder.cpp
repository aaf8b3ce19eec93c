#include "db/postgresql/pg_encoder.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlorm {

namespace {

constexpr std::array<std::pair<SemanticType, std::string_view>, 21> kPgTypeTokens = {{
    {SemanticType::BOOL, "BOOLEAN"},
    {SemanticType::I8, "SMALLINT"},
    {SemanticType::I16, "SMALLINT"},
    {SemanticType::I32, "INT"},
    {SemanticType::I64, "BIGINT"},
    {SemanticType::U8, "SMALLINT"},
    {SemanticType::U16, "SMALLINT"},
    {SemanticType::U32, "INT"},
    {SemanticType::U64, "BIGINT"},
    {SemanticType::F32, "REAL"},
    {SemanticType::F64, "DOUBLE PRECISION"},
    {SemanticType::STRING, "TEXT"},
    {SemanticType::DATE_TIME, "TIMESTAMPTZ"},
    {SemanticType::NAIVE_DATE_TIME, "TIMESTAMP"},
    {SemanticType::DATE, "DATE"},
    {SemanticType::TIME, "TIME"},
    {SemanticType::UUID, "UUID"},
    {SemanticType::BYTES, "BYTEA"},
    {SemanticType::STRING_ARRAY, "TEXT[]"},
    {SemanticType::UUID_ARRAY, "UUID[]"},
    {SemanticType::MAP, "JSONB"}
}};

constexpr TypeTable kPgTypes = make_type_table(kPgTypeTokens);

} // anonymous namespace

const TypeTable& PgEncoder::type_table() const {
    return kPgTypes;
}

// ============================================================================
// Literals
// ============================================================================

std::optional<std::string> PgEncoder::temporal_keyword(SemanticType type,
                                                       std::string_view keyword) const {
    if (type == SemanticType::DATE) {
        if (keyword == "epoch") return "'epoch'";
        if (keyword == "now" || keyword == "today") return "current_date";
        if (keyword == "tomorrow") return "current_date + INTERVAL '1 day'";
        if (keyword == "yesterday") return "current_date - INTERVAL '1 day'";
        return std::nullopt;
    }
    if (type == SemanticType::TIME) {
        if (keyword == "now") return "current_time";
        if (keyword == "midnight") return "'allballs'";
        return std::nullopt;
    }

    if (keyword == "epoch") return "'epoch'";
    if (keyword == "now") return "now()";
    if (keyword == "today" || keyword == "midnight") return "date_trunc('day', now())";
    if (keyword == "tomorrow") return "date_trunc('day', now()) + '1 day'::INTERVAL";
    if (keyword == "yesterday") return "date_trunc('day', now()) - '1 day'::INTERVAL";
    return std::nullopt;
}

std::string PgEncoder::bytes_literal(std::string_view hex) const {
    return std::format("'\\x{}'", hex);
}

std::string PgEncoder::array_literal(const Column& col,
                                     const std::vector<std::string>& elements) const {
    std::string literal = std::format("ARRAY[{}]", utils::join(elements, ", "));
    if (is_array_type(col.semantic_type())) {
        literal += "::";
        literal += column_type(col);
    }
    return literal;
}

std::string PgEncoder::json_literal(std::string_view json_text) const {
    return escape_string(json_text) + "::JSONB";
}

// ============================================================================
// Predicates
// ============================================================================

std::string PgEncoder::array_overlaps(std::string_view field, std::string_view literal) const {
    return std::format("{} && {}", field, literal);
}

std::string PgEncoder::array_contains(std::string_view field, std::string_view literal) const {
    return std::format("{} @> {}", field, literal);
}

std::string PgEncoder::array_length(std::string_view field) const {
    return std::format("array_length({}, 1)", field);
}

std::string PgEncoder::map_contains(std::string_view field, std::string_view literal) const {
    return std::format("{} @> {}", field, literal);
}

std::string PgEncoder::map_path_exists(std::string_view field, std::string_view path) const {
    return std::format("{} @? {}", field, path);
}

std::optional<std::string> PgEncoder::pattern_operator(std::string_view prefix) const {
    if (prefix == "~" || prefix == "~*" || prefix == "!~" || prefix == "!~*") {
        return std::string(prefix);
    }
    if (prefix == "!") return "<>";
    return std::nullopt;
}

std::optional<std::string> PgEncoder::parse_text_search(const Map& filter) const {
    if (!filter.is_object()) return std::nullopt;

    const auto fields_it = filter.find("$fields");
    const auto search_it = filter.find("$search");
    if (fields_it == filter.end() || search_it == filter.end() || !search_it->is_string()) {
        return std::nullopt;
    }
    const auto fields = parse_str_array(&*fields_it);
    if (fields.empty()) return std::nullopt;

    std::string language = "english";
    if (const auto it = filter.find("$language"); it != filter.end() && it->is_string()) {
        language = it->get<std::string>();
    }

    std::vector<std::string> columns;
    for (const auto& field : fields) {
        columns.push_back(format_field(field));
    }
    const std::string lang = escape_string(language);
    return std::format("to_tsvector({}, {}) @@ websearch_to_tsquery({}, {})",
        lang, utils::join(columns, " || ' ' || "), lang,
        escape_string(search_it->get_ref<const std::string&>()));
}

// ============================================================================
// Statement fragments
// ============================================================================

std::string PgEncoder::format_pagination(const Query& query) const {
    // Cursor-style continuation: the filter already bounds the sort field
    if (!query.sort_field().empty() && query.has_filter(query.sort_field())) {
        return std::format("LIMIT {}", query.limit());
    }
    return std::format("LIMIT {} OFFSET {}", query.limit(), query.offset());
}

std::string PgEncoder::auto_increment_clause(const Column&) const {
    return "";
}

std::string PgEncoder::create_index(std::string_view table, const Column& col) const {
    const std::string column = format_field(col.column_name());
    std::string kind = "btree";
    std::string target = column + " DESC";
    if (col.index_kind() == IndexKind::HASH) {
        kind = "hash";
        target = column;
    } else if (col.index_kind() == IndexKind::GIN) {
        kind = "gin";
        target = column;
    }
    return std::format("CREATE INDEX CONCURRENTLY IF NOT EXISTS {}_{}_index ON {} USING {}({});",
        table, utils::replace_all(col.column_name(), '.', '_'), table, kind, target);
}

std::string PgEncoder::create_text_search_index(std::string_view table, std::string_view language,
                                                const std::vector<std::string>& columns) const {
    std::vector<std::string> parts;
    for (const auto& column : columns) {
        parts.push_back(std::format("coalesce({}, '')", format_field(column)));
    }
    return std::format(
        "CREATE INDEX CONCURRENTLY IF NOT EXISTS {}_text_search_{}_index ON {} "
        "USING gin(to_tsvector({}, {}));",
        table, language, table, escape_string(language), utils::join(parts, " || ' ' || "));
}

std::string PgEncoder::upsert_clause(std::string_view primary_key,
                                     const std::vector<std::string>& assignments) const {
    if (assignments.empty()) {
        return std::format("ON CONFLICT ({}) DO NOTHING", primary_key);
    }
    return std::format("ON CONFLICT ({}) DO UPDATE SET {}", primary_key,
                       utils::join(assignments, ", "));
}

std::string PgEncoder::bounded_primary_key(std::string_view table, std::string_view primary_key,
                                           std::string_view conditions) const {
    if (conditions.empty()) {
        return std::format("{} IN (SELECT {} FROM {} LIMIT 1)", primary_key, primary_key, table);
    }
    return std::format("{} IN (SELECT {} FROM {} {} LIMIT 1)",
                       primary_key, primary_key, table, conditions);
}

// ============================================================================
// Row decoding
// ============================================================================

std::optional<Map> PgEncoder::parse_array_literal(std::string_view text) {
    if (text.size() < 2 || text.front() != '{' || text.back() != '}') {
        return std::nullopt;
    }
    text = text.substr(1, text.size() - 2);

    Map result = Map::array();
    if (text.empty()) return result;

    size_t pos = 0;
    while (pos <= text.size()) {
        if (pos < text.size() && text[pos] == '"') {
            std::string element;
            ++pos;
            bool closed = false;
            while (pos < text.size()) {
                const char c = text[pos++];
                if (c == '\\' && pos < text.size()) {
                    element += text[pos++];
                } else if (c == '"') {
                    closed = true;
                    break;
                } else {
                    element += c;
                }
            }
            if (!closed) return std::nullopt;
            result.push_back(std::move(element));
        } else {
            const size_t end = std::min(text.find(',', pos), text.size());
            const std::string_view element = text.substr(pos, end - pos);
            // Nested arrays are not supported
            if (element.empty() || element.front() == '{') return std::nullopt;
            if (element == "NULL") {
                result.push_back(nullptr);
            } else {
                result.push_back(std::string(element));
            }
            pos = end;
        }

        if (pos >= text.size()) break;
        if (text[pos] != ',') return std::nullopt;
        ++pos;
    }
    return result;
}

Result<Map> PgEncoder::decode_value(std::string_view native_type, const DbValue& value) const {
    if (!value) {
        return Result<Map>::ok(Map(nullptr));
    }
    const std::string& text = *value;

    if (native_type == "BOOL") {
        if (text == "t" || text == "true") return Result<Map>::ok(Map(true));
        if (text == "f" || text == "false") return Result<Map>::ok(Map(false));
        return Result<Map>::error(ErrorCategory::DECODE_ERROR,
            std::format("invalid boolean '{}'", utils::abbreviate(text, 64)));
    }
    if (native_type == "INT2" || native_type == "INT4" || native_type == "INT8") {
        return decode_integer(text, false);
    }
    if (native_type == "FLOAT4" || native_type == "FLOAT8" || native_type == "NUMERIC") {
        return decode_float(text);
    }
    if (native_type == "TEXT" || native_type == "VARCHAR" || native_type == "CHAR"
        || native_type == "BPCHAR" || native_type == "NAME" || native_type == "UUID"
        || native_type == "TIMESTAMPTZ" || native_type == "TIMESTAMP"
        || native_type == "DATE" || native_type == "TIME") {
        return Result<Map>::ok(Map(text));
    }
    if (native_type == "BYTEA") {
        // Hex output format (bytea_output = 'hex')
        if (text.starts_with("\\x")) {
            const std::string_view hex = std::string_view(text).substr(2);
            const auto bytes = utils::hex_to_bytes(hex);
            if (bytes.empty() && !hex.empty()) {
                return Result<Map>::error(ErrorCategory::DECODE_ERROR, "invalid bytea hex");
            }
            Map array = Map::array();
            for (const uint8_t b : bytes) array.push_back(b);
            return Result<Map>::ok(std::move(array));
        }
        return Result<Map>::ok(bytes_to_array(text));
    }
    if (native_type == "JSON" || native_type == "JSONB") {
        return decode_json(text);
    }
    if (native_type == "TEXT[]" || native_type == "VARCHAR[]" || native_type == "UUID[]") {
        auto array = parse_array_literal(text);
        if (!array) {
            return Result<Map>::error(ErrorCategory::DECODE_ERROR,
                std::format("invalid array literal '{}'", utils::abbreviate(text, 64)));
        }
        return Result<Map>::ok(std::move(*array));
    }

    // Unknown native types decode to a placeholder
    return Result<Map>::ok(Map(nullptr));
}

} // namespace sqlorm
