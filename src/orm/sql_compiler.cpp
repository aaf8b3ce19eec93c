#include "orm/sql_compiler.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <optional>

namespace sqlorm {

namespace {

// Join the non-empty parts of a statement with single spaces
std::string assemble(std::initializer_list<std::string_view> parts) {
    std::string sql;
    for (const auto part : parts) {
        if (part.empty()) continue;
        if (!sql.empty()) sql += ' ';
        sql += part;
    }
    sql += ';';
    return sql;
}

const Map* find_value(const Map& doc, const std::string& key) {
    if (!doc.is_object()) return nullptr;
    const auto it = doc.find(key);
    return it != doc.end() ? &*it : nullptr;
}

// Referential action keyword, or nullopt when not one of the SQL actions
std::optional<std::string> referential_action(const Column& col, std::string_view key) {
    const auto action = col.extra_string(key);
    if (!action) {
        return std::nullopt;
    }
    std::string keyword = utils::to_upper(utils::trim(*action));
    for (auto& c : keyword) {
        if (c == '_') c = ' ';
    }
    static constexpr std::string_view kActions[] = {
        "CASCADE", "RESTRICT", "NO ACTION", "SET NULL", "SET DEFAULT"};
    if (std::find(std::begin(kActions), std::end(kActions), keyword) == std::end(kActions)) {
        utils::log::warn(std::format("Column '{}': ignoring unknown {} action '{}'",
                                     col.name(), key, *action));
        return std::nullopt;
    }
    return keyword;
}

} // anonymous namespace

SqlCompiler::SqlCompiler(EntitySchema entity, std::shared_ptr<const DialectEncoder> encoder,
                         std::string namespace_prefix)
    : entity_(std::move(entity)),
      encoder_(std::move(encoder)),
      namespace_prefix_(std::move(namespace_prefix)),
      table_name_(entity_.table_name(namespace_prefix_)) {}

// ============================================================================
// DDL
// ============================================================================

std::string SqlCompiler::create_table() const {
    const auto& enc = *encoder_;
    std::vector<std::string> definitions;

    for (const auto& col : entity_.columns()) {
        std::string def = std::format("{} {}{}", enc.format_field(col.column_name()),
                                      enc.column_type(col), enc.auto_increment_clause(col));
        const bool generated = col.auto_increment() && !enc.auto_increment_clause(col).empty();
        if (col.default_value() && !generated) {
            def += " DEFAULT ";
            def += enc.format_value(col, *col.default_value());
        } else if (col.is_not_null()) {
            def += " NOT NULL";
        }
        definitions.push_back(std::move(def));
    }

    definitions.push_back(std::format("CONSTRAINT {}_pkey PRIMARY KEY ({})", table_name_,
        enc.format_field(entity_.primary_key_column().column_name())));

    for (const auto& col : entity_.columns()) {
        const auto& reference = col.reference();
        if (!reference) continue;
        std::string constraint = std::format(
            "CONSTRAINT {}_{}_fkey FOREIGN KEY ({}) REFERENCES {}({})",
            table_name_, col.column_name(), enc.format_field(col.column_name()),
            EntitySchema::format_table_name(namespace_prefix_, reference->target_entity),
            enc.format_field(reference->target_column));
        if (const auto action = referential_action(col, "on_delete")) {
            constraint += " ON DELETE " + *action;
        }
        if (const auto action = referential_action(col, "on_update")) {
            constraint += " ON UPDATE " + *action;
        }
        definitions.push_back(std::move(constraint));
    }

    return std::format("CREATE TABLE IF NOT EXISTS {} (\n  {}\n);",
                       table_name_, utils::join(definitions, ",\n  "));
}

std::vector<std::string> SqlCompiler::create_indexes() const {
    std::vector<std::string> statements;
    // Text-search columns grouped per language, in declaration order
    std::vector<std::pair<std::string, std::vector<std::string>>> text_groups;

    for (const auto& col : entity_.columns()) {
        switch (col.index_kind()) {
            case IndexKind::NONE:
                break;
            case IndexKind::TEXT: {
                const std::string language = col.text_search_language();
                auto it = std::find_if(text_groups.begin(), text_groups.end(),
                    [&](const auto& group) { return group.first == language; });
                if (it == text_groups.end()) {
                    text_groups.emplace_back(language, std::vector<std::string>{});
                    it = std::prev(text_groups.end());
                }
                it->second.push_back(col.column_name());
                break;
            }
            default:
                statements.push_back(encoder_->create_index(table_name_, col));
                break;
        }
    }

    for (const auto& [language, columns] : text_groups) {
        statements.push_back(encoder_->create_text_search_index(table_name_, language, columns));
    }
    return statements;
}

// ============================================================================
// DML
// ============================================================================

std::string SqlCompiler::column_list() const {
    std::vector<std::string> names;
    names.reserve(entity_.columns().size());
    for (const auto& col : entity_.columns()) {
        names.push_back(encoder_->format_field(col.column_name()));
    }
    return utils::join(names, ", ");
}

std::string SqlCompiler::value_tuple(const Map& doc) const {
    // Every declared column gets a value expression, in declaration order
    std::vector<std::string> values;
    values.reserve(entity_.columns().size());
    for (const auto& col : entity_.columns()) {
        values.push_back(encoder_->encode_value(col, find_value(doc, col.name())));
    }
    return std::format("({})", utils::join(values, ", "));
}

std::vector<std::string> SqlCompiler::snapshot_assignments(const Map& doc) const {
    std::vector<std::string> assignments;
    for (const auto& col : entity_.columns()) {
        if (col.name() == entity_.primary_key()) continue;
        assignments.push_back(std::format("{} = {}", encoder_->format_field(col.column_name()),
            encoder_->encode_value(col, find_value(doc, col.name()))));
    }
    return assignments;
}

std::string SqlCompiler::primary_key_condition(const Map& doc) const {
    const Column& pk = entity_.primary_key_column();
    const Map* value = find_value(doc, pk.name());
    const std::string literal = value ? encoder_->encode_value(pk, value) : "NULL";
    return std::format("WHERE {} = {}", encoder_->format_field(pk.column_name()), literal);
}

std::string SqlCompiler::bounded_condition(const Query& query) const {
    const std::string where = format_filters(query);
    const std::string sort = format_sort(query);
    std::string conditions = where;
    if (!sort.empty()) {
        if (!conditions.empty()) conditions += ' ';
        conditions += sort;
    }
    const std::string predicate = encoder_->bounded_primary_key(
        table_name_, encoder_->format_field(entity_.primary_key_column().column_name()), conditions);
    return "WHERE " + predicate;
}

std::string SqlCompiler::insert(const Map& doc) const {
    return std::format("INSERT INTO {} ({}) VALUES {};", table_name_, column_list(), value_tuple(doc));
}

std::string SqlCompiler::insert_many(const std::vector<Map>& docs) const {
    if (docs.empty()) {
        return "";
    }
    std::vector<std::string> tuples;
    tuples.reserve(docs.size());
    for (const auto& doc : docs) {
        tuples.push_back(value_tuple(doc));
    }
    return std::format("INSERT INTO {} ({}) VALUES {};",
                       table_name_, column_list(), utils::join(tuples, ", "));
}

std::string SqlCompiler::update(const Map& doc) const {
    const auto assignments = snapshot_assignments(doc);
    if (assignments.empty()) {
        return "";
    }
    return assemble({"UPDATE", table_name_, "SET", utils::join(assignments, ", "),
                     primary_key_condition(doc)});
}

std::string SqlCompiler::update_one(const Query& query, const Mutation& mutation) const {
    const std::string sets = format_update(mutation);
    if (sets.empty()) {
        return "";
    }
    return assemble({"UPDATE", table_name_, "SET", sets, bounded_condition(query)});
}

std::string SqlCompiler::update_many(const Query& query, const Mutation& mutation) const {
    const std::string sets = format_update(mutation);
    if (sets.empty()) {
        return "";
    }
    return assemble({"UPDATE", table_name_, "SET", sets, format_filters(query)});
}

std::string SqlCompiler::upsert(const Map& doc) const {
    const std::string clause = encoder_->upsert_clause(
        encoder_->format_field(entity_.primary_key_column().column_name()),
        snapshot_assignments(doc));
    return std::format("INSERT INTO {} ({}) VALUES {} {};",
                       table_name_, column_list(), value_tuple(doc), clause);
}

std::string SqlCompiler::delete_entity(const Map& doc) const {
    return assemble({"DELETE FROM", table_name_, primary_key_condition(doc)});
}

std::string SqlCompiler::delete_one(const Query& query) const {
    return assemble({"DELETE FROM", table_name_, bounded_condition(query)});
}

std::string SqlCompiler::delete_many(const Query& query) const {
    return assemble({"DELETE FROM", table_name_, format_filters(query)});
}

// ============================================================================
// Selects
// ============================================================================

std::string SqlCompiler::find(const Query& query) const {
    return assemble({"SELECT", format_fields(query), "FROM", table_name_,
                     format_filters(query), format_sort(query),
                     encoder_->format_pagination(query)});
}

std::string SqlCompiler::find_one(const Query& query) const {
    return assemble({"SELECT", format_fields(query), "FROM", table_name_,
                     format_filters(query), format_sort(query), "LIMIT 1"});
}

std::string SqlCompiler::count(const Query& query) const {
    return assemble({"SELECT count(*) AS count FROM", table_name_, format_filters(query)});
}

std::string SqlCompiler::fetch(const Query& query) const {
    return assemble({"SELECT", format_fields(query), "FROM", table_name_,
                     format_filters(query)});
}

std::string SqlCompiler::select_by_primary_key(std::string_view key) const {
    const Column& pk = entity_.primary_key_column();
    return std::format("SELECT * FROM {} WHERE {} = {};", table_name_,
                       encoder_->format_field(pk.column_name()), encoder_->format_value(pk, key));
}

// ============================================================================
// Fragments
// ============================================================================

std::string SqlCompiler::format_fields(const Query& query) const {
    if (query.fields().empty()) {
        return "*";
    }
    std::vector<std::string> fields;
    fields.reserve(query.fields().size());
    for (const auto& field : query.fields()) {
        const Column* col = entity_.get_column(field);
        fields.push_back(encoder_->format_field(col ? col->column_name() : field));
    }
    return utils::join(fields, ", ");
}

std::string SqlCompiler::format_filters(const Query& query) const {
    std::vector<std::string> conditions;
    for (const auto& [key, value] : query.filters().items()) {
        std::string condition;
        if (key == "$text") {
            condition = encoder_->parse_text_search(value).value_or("");
        } else if (key.starts_with('$')) {
            continue;
        } else if (const Column* col = entity_.get_column(key)) {
            condition = encoder_->format_filter(*col, col->column_name(), value);
        }
        // Unknown fields and empty conditions are no constraint
        if (!condition.empty()) {
            conditions.push_back(std::move(condition));
        }
    }
    if (conditions.empty()) {
        return "";
    }
    return "WHERE " + utils::join(conditions, " AND ");
}

std::string SqlCompiler::format_sort(const Query& query) const {
    if (query.sort_field().empty()) {
        return "";
    }
    const Column* col = entity_.get_column(query.sort_field());
    return std::format("ORDER BY {} {}",
                       encoder_->format_field(col ? col->column_name() : query.sort_field()),
                       query.descending() ? "DESC" : "ASC");
}

std::string SqlCompiler::format_update(const Mutation& mutation) const {
    std::vector<std::string> assignments;
    for (const auto& [key, value] : mutation.updates().items()) {
        const Column* col = entity_.get_column(key);
        if (!col) continue;
        assignments.push_back(std::format("{} = {}", encoder_->format_field(col->column_name()),
                                          encoder_->encode_value(*col, &value)));
    }
    return utils::join(assignments, ", ");
}

} // namespace sqlorm
