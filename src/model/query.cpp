#include "model/query.hpp"

#include <algorithm>

namespace sqlorm {

Query::Query(Map filters)
    : filters_(filters.is_object() ? std::move(filters) : Map::object()) {}

void Query::add_field(std::string field) {
    if (std::find(fields_.begin(), fields_.end(), field) == fields_.end()) {
        fields_.emplace_back(std::move(field));
    }
}

void Query::add_filter(const std::string& key, Map value) {
    filters_[key] = std::move(value);
}

void Query::append_filters(const Map& filters) {
    if (!filters.is_object()) return;
    for (const auto& [key, value] : filters.items()) {
        filters_[key] = value;
    }
}

void Query::remove_filter(const std::string& key) {
    filters_.erase(key);
}

bool Query::has_filter(const std::string& key) const {
    return filters_.contains(key);
}

void Query::set_sort(std::string field, bool descending) {
    sort_field_ = std::move(field);
    descending_ = descending;
}

Mutation::Mutation(Map updates)
    : updates_(updates.is_object() ? std::move(updates) : Map::object()) {}

void Mutation::set(const std::string& key, Map value) {
    updates_[key] = std::move(value);
}

} // namespace sqlorm
