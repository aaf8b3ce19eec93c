#include "model/column.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>

namespace sqlorm {

SemanticType parse_semantic_type(std::string_view tag) {
    static const std::unordered_map<std::string_view, SemanticType> lookup = {
        {"bool", SemanticType::BOOL},
        {"i8", SemanticType::I8},
        {"i16", SemanticType::I16},
        {"i32", SemanticType::I32},
        {"i64", SemanticType::I64},
        {"isize", SemanticType::I64},
        {"u8", SemanticType::U8},
        {"u16", SemanticType::U16},
        {"u32", SemanticType::U32},
        {"u64", SemanticType::U64},
        {"usize", SemanticType::U64},
        {"f32", SemanticType::F32},
        {"f64", SemanticType::F64},
        {"String", SemanticType::STRING},
        {"DateTime", SemanticType::DATE_TIME},
        {"NaiveDateTime", SemanticType::NAIVE_DATE_TIME},
        {"Date", SemanticType::DATE},
        {"NaiveDate", SemanticType::DATE},
        {"Time", SemanticType::TIME},
        {"NaiveTime", SemanticType::TIME},
        {"Uuid", SemanticType::UUID},
        {"Option<Uuid>", SemanticType::UUID},
        {"Vec<u8>", SemanticType::BYTES},
        {"Vec<String>", SemanticType::STRING_ARRAY},
        {"Vec<Uuid>", SemanticType::UUID_ARRAY},
        {"Map", SemanticType::MAP}
    };

    const auto it = lookup.find(tag);
    return it != lookup.end() ? it->second : SemanticType::UNKNOWN;
}

const char* semantic_type_to_string(SemanticType type) {
    switch (type) {
        case SemanticType::BOOL: return "bool";
        case SemanticType::I8: return "i8";
        case SemanticType::I16: return "i16";
        case SemanticType::I32: return "i32";
        case SemanticType::I64: return "i64";
        case SemanticType::U8: return "u8";
        case SemanticType::U16: return "u16";
        case SemanticType::U32: return "u32";
        case SemanticType::U64: return "u64";
        case SemanticType::F32: return "f32";
        case SemanticType::F64: return "f64";
        case SemanticType::STRING: return "String";
        case SemanticType::DATE_TIME: return "DateTime";
        case SemanticType::NAIVE_DATE_TIME: return "NaiveDateTime";
        case SemanticType::DATE: return "Date";
        case SemanticType::TIME: return "Time";
        case SemanticType::UUID: return "Uuid";
        case SemanticType::BYTES: return "Vec<u8>";
        case SemanticType::STRING_ARRAY: return "Vec<String>";
        case SemanticType::UUID_ARRAY: return "Vec<Uuid>";
        case SemanticType::MAP: return "Map";
        default: return "unknown";
    }
}

namespace {

IndexKind parse_index_kind(const std::optional<std::string>& index_type) {
    if (!index_type) return IndexKind::NONE;
    const std::string kind = utils::to_lower(*index_type);
    if (kind.starts_with("text")) return IndexKind::TEXT;
    if (kind == "hash") return IndexKind::HASH;
    if (kind == "gin") return IndexKind::GIN;
    // Unrecognized kinds get the default access method
    return IndexKind::BTREE;
}

} // anonymous namespace

Column::Column(ColumnSpec spec)
    : name_(std::move(spec.name)),
      type_name_(std::move(spec.type_name)),
      semantic_type_(parse_semantic_type(type_name_)),
      nullable_(spec.nullable),
      default_value_(std::move(spec.default_value)),
      index_type_(std::move(spec.index_type)),
      index_kind_(parse_index_kind(index_type_)),
      auto_increment_(spec.auto_increment),
      reference_(std::move(spec.reference)),
      extra_(spec.extra.is_object() ? std::move(spec.extra) : Map::object()) {
    const auto physical = extra_string("column_name");
    column_name_ = physical.value_or(name_);
}

std::string Column::text_search_language() const {
    if (index_kind_ != IndexKind::TEXT || !index_type_) {
        return "english";
    }
    const auto parts = utils::split_once(*index_type_, ':');
    if (!parts || parts->second.empty()) {
        return "english";
    }
    // Text search configuration names end up in index names and DDL
    const std::string_view language = parts->second;
    const bool plain = std::all_of(language.begin(), language.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    });
    if (!plain) {
        utils::log::warn(std::format("Column '{}': invalid text search language '{}', using english",
                                     name_, language));
        return "english";
    }
    return std::string(language);
}

std::optional<std::string> Column::extra_string(std::string_view key) const {
    const auto it = extra_.find(std::string(key));
    if (it == extra_.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace sqlorm
