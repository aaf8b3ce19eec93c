#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sqlorm {

/**
 * @brief Dynamically-typed document (JSON object with insertion order kept)
 *
 * Used for query filters, mutations, entity snapshots and decoded rows.
 */
using Map = nlohmann::ordered_json;

/**
 * @brief Text form of a scalar document value used as a lookup key
 *
 * Strings are returned verbatim, numbers and booleans in their JSON form,
 * null as an empty string.
 */
[[nodiscard]] std::string scalar_to_string(const Map& value);

/**
 * @brief Collect key values from a field: a comma separated string or an array
 *
 * Non-scalar array entries are skipped.
 */
[[nodiscard]] std::vector<std::string> parse_key_list(const Map& value);

/**
 * @brief Collect the strings of a JSON string array (or a comma separated string)
 */
[[nodiscard]] std::vector<std::string> parse_str_array(const Map* value);

} // namespace sqlorm
