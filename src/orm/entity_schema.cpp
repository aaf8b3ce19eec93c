#include "orm/entity_schema.hpp"

#include <cctype>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace sqlorm {

EntitySchema::EntitySchema(std::string entity_name, std::vector<Column> columns,
                           EntityOptions options)
    : entity_name_(std::move(entity_name)),
      columns_(std::move(columns)),
      options_(std::move(options)) {
    std::unordered_set<std::string_view> seen;
    bool has_primary_key = false;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (!seen.insert(columns_[i].name()).second) {
            throw std::invalid_argument(std::format(
                "entity '{}' declares column '{}' twice", entity_name_, columns_[i].name()));
        }
        if (columns_[i].name() == options_.primary_key) {
            primary_key_index_ = i;
            has_primary_key = true;
        }
    }
    if (!has_primary_key) {
        throw std::invalid_argument(std::format(
            "entity '{}' has no primary key column '{}'", entity_name_, options_.primary_key));
    }
}

const Column* EntitySchema::get_column(std::string_view name) const {
    for (const auto& col : columns_) {
        if (col.name() == name) {
            return &col;
        }
    }
    return nullptr;
}

const Column& EntitySchema::primary_key_column() const {
    return columns_[primary_key_index_];
}

std::string EntitySchema::table_name(std::string_view namespace_prefix) const {
    return format_table_name(namespace_prefix, entity_name_);
}

std::string EntitySchema::format_table_name(std::string_view namespace_prefix,
                                            std::string_view entity_name) {
    std::string name = namespace_prefix.empty()
        ? std::string(entity_name)
        : std::format("{}_{}", namespace_prefix, entity_name);
    for (char& c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_') {
            c = '_';
        }
    }
    return name;
}

std::string EntitySchema::model_namespace(std::string_view namespace_prefix) const {
    if (namespace_prefix.empty()) {
        return entity_name_;
    }
    return std::format("{}:{}", namespace_prefix, entity_name_);
}

} // namespace sqlorm
