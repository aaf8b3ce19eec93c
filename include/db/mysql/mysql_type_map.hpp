#pragma once

#include <mysql/mysql.h>
#include <string>

namespace sqlorm {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps result field metadata to the native type names the row decoder
 * dispatches on ("BIGINT UNSIGNED", "DATETIME", "BLOB", ...).
 */
class MysqlTypeMap {
public:
    /**
     * @brief Map a MySQL result field to its native type name
     * @param field Field metadata from mysql_fetch_fields()
     * @return Uppercase type name, or empty string for an unmapped type
     */
    [[nodiscard]] static std::string field_type_name(const MYSQL_FIELD& field);
};

} // namespace sqlorm
