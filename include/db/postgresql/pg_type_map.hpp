#pragma once

#include <cstdint>
#include <string>

namespace sqlorm {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps result column OIDs to the native type names the row decoder
 * dispatches on ("INT8", "TIMESTAMPTZ", "TEXT[]", ...).
 */
class PgTypeMap {
public:
    /**
     * @brief Map a PostgreSQL type OID to its native type name
     * @return Uppercase type name, or empty string for an unknown OID
     */
    [[nodiscard]] static std::string oid_to_type_name(uint32_t oid);
};

} // namespace sqlorm
