#pragma once

#include "model/document.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sqlorm {

/**
 * @brief Document-oriented description of a selection
 *
 * Filter keys are field names (or "$text" for full-text search); values
 * are scalars, "min,max" ranges, comparison-prefixed strings, the
 * "null"/"notnull" sentinels, or objects keyed by $-operators.
 */
class Query {
public:
    Query() = default;
    explicit Query(Map filters);

    // Projection (empty = all columns)
    [[nodiscard]] const std::vector<std::string>& fields() const { return fields_; }
    void set_fields(std::vector<std::string> fields) { fields_ = std::move(fields); }
    void add_field(std::string field);

    [[nodiscard]] const Map& filters() const { return filters_; }
    void add_filter(const std::string& key, Map value);
    void append_filters(const Map& filters);
    void remove_filter(const std::string& key);
    [[nodiscard]] bool has_filter(const std::string& key) const;

    // Sort (empty field = unordered)
    [[nodiscard]] const std::string& sort_field() const { return sort_field_; }
    [[nodiscard]] bool descending() const { return descending_; }
    void set_sort(std::string field, bool descending = true);

    [[nodiscard]] uint64_t offset() const { return offset_; }
    [[nodiscard]] uint64_t limit() const { return limit_; }
    void set_offset(uint64_t offset) { offset_ = offset; }
    void set_limit(uint64_t limit) { limit_ = limit; }

private:
    std::vector<std::string> fields_;
    Map filters_ = Map::object();
    std::string sort_field_;
    bool descending_ = true;
    uint64_t offset_ = 0;
    uint64_t limit_ = 10;
};

/**
 * @brief Field assignments for an UPDATE
 */
class Mutation {
public:
    Mutation() = default;
    explicit Mutation(Map updates);

    [[nodiscard]] const Map& updates() const { return updates_; }
    void set(const std::string& key, Map value);
    [[nodiscard]] bool empty() const { return updates_.empty(); }

private:
    Map updates_ = Map::object();
};

} // namespace sqlorm
