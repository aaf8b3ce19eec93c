#pragma once

#include "model/column.hpp"

#include <array>
#include <string_view>

namespace sqlorm {

/**
 * @brief Semantic type → DDL token table of one dialect
 *
 * Defined once per dialect; adding a dialect means adding a table, not
 * touching compiler logic. An empty token (UNKNOWN) means "use the raw
 * type tag".
 */
struct TypeTable {
    std::array<std::string_view, kSemanticTypeCount> ddl_tokens{};

    [[nodiscard]] constexpr std::string_view ddl_token(SemanticType type) const {
        return ddl_tokens[static_cast<size_t>(type)];
    }
};

/**
 * @brief Build a table from (type, token) pairs; unlisted types map to ""
 */
template<size_t N>
[[nodiscard]] constexpr TypeTable make_type_table(
    const std::array<std::pair<SemanticType, std::string_view>, N>& entries) {
    TypeTable table;
    for (const auto& [type, token] : entries) {
        table.ddl_tokens[static_cast<size_t>(type)] = token;
    }
    return table;
}

} // namespace sqlorm
