#include "orm/dialect_encoder.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>
#include <unordered_map>
#include <unordered_set>

namespace sqlorm {

namespace {

// Keywords that must be quoted when used as identifiers
const std::unordered_set<std::string_view>& reserved_words() {
    static const std::unordered_set<std::string_view> words = {
        "all", "and", "any", "as", "asc", "between", "by", "case", "check",
        "column", "constraint", "create", "default", "delete", "desc",
        "distinct", "else", "end", "exists", "false", "for", "foreign", "from",
        "grant", "group", "having", "in", "index", "insert", "into", "is",
        "join", "key", "like", "limit", "not", "null", "offset", "on", "or",
        "order", "primary", "range", "references", "select", "set", "table",
        "then", "to", "true", "union", "unique", "update", "user", "using",
        "values", "when", "where", "with"
    };
    return words;
}

bool is_plain_identifier(std::string_view segment) {
    if (segment.empty()) return false;
    const char first = segment.front();
    if (!((first >= 'a' && first <= 'z') || first == '_')) return false;
    for (const char c : segment) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return !reserved_words().contains(segment);
}

const std::unordered_map<std::string_view, std::string_view>& comparison_operators() {
    static const std::unordered_map<std::string_view, std::string_view> ops = {
        {"$eq", "="},
        {"$ne", "<>"},
        {"$lt", "<"},
        {"$lte", "<="},
        {"$gt", ">"},
        {"$gte", ">="}
    };
    return ops;
}

bool is_comparison_prefix(std::string_view op) {
    return op == "<" || op == "<=" || op == ">" || op == ">=" || op == "=" || op == "<>";
}

} // anonymous namespace

DialectEncoder::DialectEncoder(EncoderOptions options)
    : options_(options) {}

// ============================================================================
// Column model
// ============================================================================

std::string DialectEncoder::column_type(const Column& col) const {
    const auto token = type_table().ddl_token(col.semantic_type());
    if (token.empty()) {
        return col.type_name();
    }
    return std::string(token);
}

// ============================================================================
// Values
// ============================================================================

std::string DialectEncoder::escape_string(std::string_view value) const {
    std::string result;
    result.reserve(value.size() + 2);
    result += '\'';
    for (const char c : value) {
        if (c == '\'') result += '\'';
        result += c;
    }
    result += '\'';
    return result;
}

std::string DialectEncoder::format_field(std::string_view field) const {
    const char quote = identifier_quote();
    std::string result;
    for (const auto& segment : utils::split(field, '.')) {
        if (!result.empty()) result += '.';
        if (is_plain_identifier(segment)) {
            result += segment;
            continue;
        }
        result += quote;
        for (const char c : segment) {
            if (c == quote) result += quote;
            result += c;
        }
        result += quote;
    }
    return result;
}

std::optional<std::string> DialectEncoder::try_format_value(const Column& col,
                                                            std::string_view value) const {
    const SemanticType type = col.semantic_type();
    switch (type) {
        case SemanticType::BOOL: {
            const std::string lower = utils::to_lower(value);
            if (lower == "true" || lower == "t" || lower == "1") return "TRUE";
            if (lower == "false" || lower == "f" || lower == "0") return "FALSE";
            return std::nullopt;
        }
        case SemanticType::I8:
        case SemanticType::I16:
        case SemanticType::I32:
        case SemanticType::I64: {
            const auto parsed = utils::try_parse_int<int64_t>(value);
            if (!parsed) return std::nullopt;
            return std::to_string(*parsed);
        }
        case SemanticType::U8:
        case SemanticType::U16:
        case SemanticType::U32:
        case SemanticType::U64: {
            const auto parsed = utils::try_parse_int<uint64_t>(value);
            if (!parsed) return std::nullopt;
            return std::to_string(*parsed);
        }
        case SemanticType::F32:
        case SemanticType::F64: {
            const auto parsed = utils::try_parse_double(value);
            if (!parsed || !std::isfinite(*parsed)) return std::nullopt;
            return std::string(value.front() == '+' ? value.substr(1) : value);
        }
        case SemanticType::DATE_TIME:
        case SemanticType::NAIVE_DATE_TIME:
        case SemanticType::DATE:
        case SemanticType::TIME: {
            if (auto keyword = temporal_keyword(type, value)) {
                return keyword;
            }
            return escape_string(value);
        }
        case SemanticType::BYTES: {
            std::string_view hex = value;
            if (hex.starts_with("\\x") || hex.starts_with("0x")) hex.remove_prefix(2);
            if (hex.size() % 2 != 0 || !utils::is_hex(hex)) return std::nullopt;
            return bytes_literal(hex);
        }
        case SemanticType::STRING_ARRAY:
        case SemanticType::UUID_ARRAY: {
            std::vector<std::string> elements;
            for (const auto& item : parse_key_list(Map(std::string(value)))) {
                elements.push_back(escape_string(item));
            }
            return array_literal(col, elements);
        }
        case SemanticType::MAP: {
            if (!Map::accept(value.begin(), value.end())) return std::nullopt;
            return json_literal(value);
        }
        case SemanticType::STRING:
        case SemanticType::UUID:
        case SemanticType::UNKNOWN:
        default:
            return escape_string(value);
    }
}

std::string DialectEncoder::format_value(const Column& col, std::string_view value) const {
    return try_format_value(col, value).value_or("NULL");
}

std::string DialectEncoder::encode_value(const Column& col, const Map* value) const {
    if (!value) {
        return col.has_default() ? "DEFAULT" : "NULL";
    }
    if (value->is_null()) {
        return "NULL";
    }
    if (value->is_boolean()) {
        return value->get<bool>() ? "TRUE" : "FALSE";
    }
    if (value->is_number()) {
        const SemanticType type = col.semantic_type();
        if (is_ordered_type(type) && !is_temporal_type(type)) {
            return value->dump();
        }
        if (type == SemanticType::UNKNOWN) {
            return value->dump();
        }
        return format_value(col, value->dump());
    }
    if (value->is_string()) {
        const auto& text = value->get_ref<const std::string&>();
        if (text == "null") {
            return "NULL";
        }
        if (text.empty() && col.default_value()) {
            return format_value(col, *col.default_value());
        }
        return format_value(col, text);
    }
    if (value->is_array()) {
        return encode_array(col, *value);
    }
    return json_literal(value->dump());
}

std::string DialectEncoder::encode_array(const Column& col, const Map& value) const {
    const SemanticType type = col.semantic_type();
    if (type == SemanticType::MAP) {
        return json_literal(value.dump());
    }
    if (type == SemanticType::BYTES) {
        std::string hex;
        hex.reserve(value.size() * 2);
        for (const auto& byte : value) {
            if (!byte.is_number_integer() || byte.get<int64_t>() < 0 || byte.get<int64_t>() > 0xFF) {
                return "NULL";
            }
            hex += std::format("{:02x}", byte.get<int64_t>());
        }
        return bytes_literal(hex);
    }

    std::vector<std::string> elements;
    elements.reserve(value.size());
    for (const auto& item : value) {
        if (item.is_string()) {
            elements.push_back(escape_string(item.get_ref<const std::string&>()));
        } else if (item.is_number() || item.is_boolean()) {
            elements.push_back(item.dump());
        } else if (item.is_null()) {
            elements.emplace_back("NULL");
        } else {
            elements.push_back(escape_string(item.dump()));
        }
    }
    return array_literal(col, elements);
}

// ============================================================================
// Filters
// ============================================================================

std::string DialectEncoder::reject_filter(std::string_view field, std::string_view reason) const {
    utils::log::warn(std::format("Rejected filter on {}: {}", field, reason));
    return "FALSE";
}

std::string DialectEncoder::format_filter(const Column& col, std::string_view field,
                                          const Map& value) const {
    const std::string f = format_field(field);
    const SemanticType type = col.semantic_type();

    if (value.is_object()) {
        if (type == SemanticType::MAP) {
            return map_contains(f, encode_value(col, &value));
        }
        return format_operator_filter(col, f, value);
    }

    if (type == SemanticType::BOOL) {
        if (value.is_boolean()) {
            return std::format("{} {}", f, value.get<bool>() ? "IS TRUE" : "IS NOT TRUE");
        }
        if (value.is_string()) {
            const auto literal = try_format_value(col, value.get_ref<const std::string&>());
            if (!literal && options_.strict_filters) {
                return reject_filter(field, "not a boolean");
            }
            return std::format("{} {}", f, literal == "TRUE" ? "IS TRUE" : "IS NOT TRUE");
        }
    }

    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (is_ordered_type(type)) {
            return format_ordered_filter(col, f, text);
        }
        switch (type) {
            case SemanticType::STRING:
                return format_string_filter(col, f, text);
            case SemanticType::UUID:
                return format_uuid_filter(col, f, text);
            case SemanticType::STRING_ARRAY:
            case SemanticType::UUID_ARRAY:
                return format_array_filter(col, f, text);
            case SemanticType::MAP:
                return map_path_exists(f, escape_string(text));
            default: {
                const auto literal = try_format_value(col, text);
                if (!literal && options_.strict_filters) {
                    return reject_filter(field, "malformed value");
                }
                return std::format("{} = {}", f, literal.value_or("NULL"));
            }
        }
    }

    if (value.is_array()) {
        if (is_array_type(type)) {
            return array_overlaps(f, encode_value(col, &value));
        }
        const std::string list = format_list(col, value);
        if (list.empty()) {
            return "";
        }
        return std::format("{} IN ({})", f, list);
    }

    if (value.is_null()) {
        return std::format("{} IS NULL", f);
    }
    return std::format("{} = {}", f, encode_value(col, &value));
}

std::string DialectEncoder::format_list(const Column& col, const Map& values) const {
    std::vector<std::string> items;
    if (values.is_array()) {
        for (const auto& item : values) {
            items.push_back(encode_value(col, &item));
        }
    } else if (values.is_string()) {
        for (const auto& item : parse_key_list(values)) {
            items.push_back(format_value(col, item));
        }
    } else if (!values.is_null()) {
        items.push_back(encode_value(col, &values));
    }
    return utils::join(items, ", ");
}

std::string DialectEncoder::format_operator_filter(const Column& col, const std::string& field,
                                                   const Map& operators) const {
    std::vector<std::string> conditions;
    const SemanticType type = col.semantic_type();

    for (const auto& [key, operand] : operators.items()) {
        if (key == "$in" || key == "$nin") {
            // Empty operand lists are dropped rather than made into a tautology
            const std::string list = format_list(col, operand);
            if (list.empty()) {
                continue;
            }
            conditions.push_back(std::format("{} {} ({})", field,
                key == "$in" ? "IN" : "NOT IN", list));
            continue;
        }

        if (const auto it = comparison_operators().find(key); it != comparison_operators().end()) {
            if (operand.is_null()) {
                if (key == "$eq") {
                    conditions.push_back(std::format("{} IS NULL", field));
                    continue;
                }
                if (key == "$ne") {
                    conditions.push_back(std::format("{} IS NOT NULL", field));
                    continue;
                }
            }
            std::string literal;
            if (operand.is_string()) {
                const auto formatted = try_format_value(col, operand.get_ref<const std::string&>());
                if (!formatted && options_.strict_filters) {
                    return reject_filter(field, std::format("malformed operand for {}", key));
                }
                literal = formatted.value_or("NULL");
            } else {
                literal = encode_value(col, &operand);
            }
            conditions.push_back(std::format("{} {} {}", field, it->second, literal));
            continue;
        }

        if (key == "$all" && is_array_type(type)) {
            conditions.push_back(array_contains(field, encode_value(col, &operand)));
            continue;
        }

        if (key == "$size" && is_array_type(type)) {
            std::optional<uint64_t> size;
            if (operand.is_number_integer() && operand.get<int64_t>() >= 0) {
                size = operand.get<uint64_t>();
            } else if (operand.is_string()) {
                size = utils::try_parse_int<uint64_t>(operand.get_ref<const std::string&>());
            }
            if (!size) {
                if (options_.strict_filters) {
                    return reject_filter(field, "$size expects a non-negative integer");
                }
                continue;
            }
            conditions.push_back(std::format("{} = {}", array_length(field), *size));
            continue;
        }

        if (options_.strict_filters) {
            return reject_filter(field, std::format("unsupported operator {}", key));
        }
        conditions.push_back(std::format("{} = {}", field, encode_value(col, &operand)));
    }

    return utils::join(conditions, " AND ");
}

std::string DialectEncoder::format_ordered_filter(const Column& col, const std::string& field,
                                                  std::string_view value) const {
    if (value == "null") {
        return std::format("{} IS NULL", field);
    }
    if (value == "notnull") {
        return std::format("{} IS NOT NULL", field);
    }

    // "min,max" is the half-open range [min, max)
    if (const auto range = utils::split_once(value, ',')) {
        const std::string min = utils::trim(std::string(range->first));
        const std::string max = utils::trim(std::string(range->second));
        std::vector<std::string> conditions;
        if (!min.empty()) {
            const auto lower = try_format_value(col, min);
            if (!lower && options_.strict_filters) {
                return reject_filter(field, "malformed range");
            }
            conditions.push_back(std::format("{} >= {}", field, lower.value_or("NULL")));
        }
        if (!max.empty()) {
            const auto upper = try_format_value(col, max);
            if (!upper && options_.strict_filters) {
                return reject_filter(field, "malformed range");
            }
            conditions.push_back(std::format("{} < {}", field, upper.value_or("NULL")));
        }
        return utils::join(conditions, " AND ");
    }

    const size_t split = value.find_first_not_of("<>=");
    if (split != 0 && split != std::string_view::npos) {
        const std::string_view op = value.substr(0, split);
        const std::string_view operand = value.substr(split);
        if (is_comparison_prefix(op)) {
            const auto literal = try_format_value(col, operand);
            if (!literal && options_.strict_filters) {
                return reject_filter(field, "malformed comparison operand");
            }
            return std::format("{} {} {}", field, op, literal.value_or("NULL"));
        }
        if (options_.strict_filters) {
            return reject_filter(field, std::format("unsupported comparison {}", op));
        }
    }

    const auto literal = try_format_value(col, value);
    if (!literal && options_.strict_filters) {
        return reject_filter(field, "malformed value");
    }
    return std::format("{} = {}", field, literal.value_or("NULL"));
}

std::string DialectEncoder::format_string_filter(const Column& col, const std::string& field,
                                                 std::string_view value) const {
    // Empty and absent strings are treated alike
    if (value == "null") {
        return std::format("({} = '') IS NOT FALSE", field);
    }
    if (value == "notnull") {
        return std::format("({} = '') IS FALSE", field);
    }

    const size_t split = value.find_first_not_of("!~*");
    if (split != 0 && split != std::string_view::npos) {
        if (const auto op = pattern_operator(value.substr(0, split))) {
            return std::format("{} {} {}", field, *op, escape_string(value.substr(split)));
        }
        if (options_.strict_filters) {
            return reject_filter(field, std::format("unsupported match operator {}",
                value.substr(0, split)));
        }
    }
    return std::format("{} = {}", field, format_value(col, value));
}

std::string DialectEncoder::format_uuid_filter(const Column& col, const std::string& field,
                                               std::string_view value) const {
    if (value == "null") {
        return std::format("{} IS NULL", field);
    }
    if (value == "notnull") {
        return std::format("{} IS NOT NULL", field);
    }
    if (value.find(',') != std::string_view::npos) {
        const std::string list = format_list(col, Map(std::string(value)));
        if (list.empty()) {
            return "";
        }
        return std::format("{} IN ({})", field, list);
    }
    return std::format("{} = {}", field, escape_string(value));
}

std::string DialectEncoder::format_array_filter(const Column& col, const std::string& field,
                                                std::string_view value) const {
    const auto groups = utils::split(value, ';');
    if (groups.size() == 1) {
        return array_overlaps(field, format_value(col, value));
    }

    // Groups are AND-ed; values inside a comma group are alternatives
    std::vector<std::string> conditions;
    for (const auto& group : groups) {
        const auto members = parse_key_list(Map(group));
        if (members.empty()) continue;
        const std::string literal = format_value(col, group);
        if (members.size() > 1) {
            conditions.push_back(array_overlaps(field, literal));
        } else {
            conditions.push_back(array_contains(field, literal));
        }
    }
    return utils::join(conditions, " AND ");
}

// ============================================================================
// Row decoding
// ============================================================================

Result<Map> DialectEncoder::decode_integer(std::string_view text, bool is_unsigned) {
    if (is_unsigned) {
        if (const auto v = utils::try_parse_int<uint64_t>(text)) {
            return Result<Map>::ok(Map(*v));
        }
    } else if (const auto v = utils::try_parse_int<int64_t>(text)) {
        return Result<Map>::ok(Map(*v));
    }
    return Result<Map>::error(ErrorCategory::DECODE_ERROR,
        std::format("invalid integer '{}'", utils::abbreviate(text, 64)));
}

Result<Map> DialectEncoder::decode_float(std::string_view text) {
    if (const auto v = utils::try_parse_double(text)) {
        return Result<Map>::ok(Map(*v));
    }
    return Result<Map>::error(ErrorCategory::DECODE_ERROR,
        std::format("invalid number '{}'", utils::abbreviate(text, 64)));
}

Result<Map> DialectEncoder::decode_json(std::string_view text) {
    Map parsed = Map::parse(text.begin(), text.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return Result<Map>::error(ErrorCategory::DECODE_ERROR,
            std::format("invalid JSON '{}'", utils::abbreviate(text, 64)));
    }
    return Result<Map>::ok(std::move(parsed));
}

Map DialectEncoder::bytes_to_array(std::string_view raw) {
    Map bytes = Map::array();
    for (const char c : raw) {
        bytes.push_back(static_cast<uint8_t>(c));
    }
    return bytes;
}

Result<Map> DialectEncoder::decode_row(const DbResultSet& result, size_t row_index) const {
    const auto& row = result.rows[row_index];
    Map doc = Map::object();
    for (size_t i = 0; i < result.column_names.size() && i < row.size(); ++i) {
        const std::string_view native_type =
            i < result.column_types.size() ? std::string_view(result.column_types[i]) : "";
        auto decoded = decode_value(native_type, row[i]);
        if (decoded.is_error()) {
            return Result<Map>::error(ErrorCategory::DECODE_ERROR,
                std::format("column '{}' ({}): {}", result.column_names[i], native_type,
                            decoded.error_message()));
        }
        doc[result.column_names[i]] = std::move(decoded.value());
    }
    return Result<Map>::ok(std::move(doc));
}

Result<std::vector<Map>> DialectEncoder::decode_rows(const DbResultSet& result) const {
    std::vector<Map> docs;
    docs.reserve(result.rows.size());
    for (size_t i = 0; i < result.rows.size(); ++i) {
        auto doc = decode_row(result, i);
        if (doc.is_error()) {
            return Result<std::vector<Map>>::error_from(doc);
        }
        docs.push_back(std::move(doc.value()));
    }
    return Result<std::vector<Map>>::ok(std::move(docs));
}

} // namespace sqlorm
