#include "db/mysql/mysql_type_map.hpp"

namespace sqlorm {

namespace {

// binary collation: BLOB and VARBINARY share field types with TEXT and VARCHAR
constexpr unsigned int kBinaryCharset = 63;

std::string integer_name(const char* base, const MYSQL_FIELD& field) {
    std::string name = base;
    if (field.flags & UNSIGNED_FLAG) {
        name += " UNSIGNED";
    }
    return name;
}

} // anonymous namespace

std::string MysqlTypeMap::field_type_name(const MYSQL_FIELD& field) {
    const bool binary = field.charsetnr == kBinaryCharset;

    switch (field.type) {
        case MYSQL_TYPE_TINY:
            // BOOLEAN is stored as TINYINT(1)
            if (field.length == 1 && !(field.flags & UNSIGNED_FLAG)) {
                return "BOOLEAN";
            }
            return integer_name("TINYINT", field);
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_YEAR:
            return integer_name("SMALLINT", field);
        case MYSQL_TYPE_INT24:
            return integer_name("MEDIUMINT", field);
        case MYSQL_TYPE_LONG:
            return integer_name("INT", field);
        case MYSQL_TYPE_LONGLONG:
            return integer_name("BIGINT", field);

        case MYSQL_TYPE_FLOAT:
            return "FLOAT";
        case MYSQL_TYPE_DOUBLE:
            return "DOUBLE";
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return "DECIMAL";

        case MYSQL_TYPE_TIMESTAMP:
            return "TIMESTAMP";
        case MYSQL_TYPE_DATETIME:
            return "DATETIME";
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
            return "DATE";
        case MYSQL_TYPE_TIME:
            return "TIME";

        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
        case MYSQL_TYPE_BLOB:
            return binary ? "BLOB" : "TEXT";
        case MYSQL_TYPE_VARCHAR:
        case MYSQL_TYPE_VAR_STRING:
            return binary ? "VARBINARY" : "VARCHAR";
        case MYSQL_TYPE_STRING:
            return binary ? "BINARY" : "CHAR";
        case MYSQL_TYPE_ENUM:
        case MYSQL_TYPE_SET:
            return "VARCHAR";

        case MYSQL_TYPE_JSON:
            return "JSON";

        default:
            return {};
    }
}

} // namespace sqlorm
