#include "db/postgresql/pg_type_map.hpp"

#include <unordered_map>

namespace sqlorm {

std::string PgTypeMap::oid_to_type_name(uint32_t oid) {
    // OIDs from pg_type.dat
    static const std::unordered_map<uint32_t, std::string> OID_TO_NAME = {
        {16, "BOOL"},
        {17, "BYTEA"},
        {18, "CHAR"},
        {19, "NAME"},
        {20, "INT8"},
        {21, "INT2"},
        {23, "INT4"},
        {25, "TEXT"},
        {26, "INT8"},          // oid
        {114, "JSON"},
        {700, "FLOAT4"},
        {701, "FLOAT8"},
        {1009, "TEXT[]"},
        {1015, "VARCHAR[]"},
        {1042, "BPCHAR"},
        {1043, "VARCHAR"},
        {1082, "DATE"},
        {1083, "TIME"},
        {1114, "TIMESTAMP"},
        {1184, "TIMESTAMPTZ"},
        {1700, "NUMERIC"},
        {2950, "UUID"},
        {2951, "UUID[]"},
        {3802, "JSONB"},
    };

    const auto it = OID_TO_NAME.find(oid);
    return it != OID_TO_NAME.end() ? it->second : std::string{};
}

} // namespace sqlorm
