#include <catch2/catch_test_macros.hpp>
#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_encoder.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "db/postgresql/pg_encoder.hpp"
#include "mocks/mock_connection.hpp"

using namespace sqlorm;
using sqlorm::testing::rows_result;

namespace {

const PgEncoder& pg() {
    static const PgEncoder encoder;
    return encoder;
}

const MysqlEncoder& mysql() {
    static const MysqlEncoder encoder;
    return encoder;
}

Map pg_decode(std::string_view type, DbValue value) {
    auto result = pg().decode_value(type, value);
    REQUIRE(result.is_ok());
    return result.value();
}

Map mysql_decode(std::string_view type, DbValue value) {
    auto result = mysql().decode_value(type, value);
    REQUIRE(result.is_ok());
    return result.value();
}

} // anonymous namespace

// ============================================================================
// PostgreSQL
// ============================================================================

TEST_CASE("RowDecoder: PostgreSQL scalars", "[decoder][pg]") {
    CHECK(pg_decode("BOOL", "t") == Map(true));
    CHECK(pg_decode("BOOL", "f") == Map(false));
    CHECK(pg_decode("INT8", "-42") == Map(-42));
    CHECK(pg_decode("INT4", "7").is_number_integer());
    CHECK(pg_decode("FLOAT8", "2.5") == Map(2.5));
    CHECK(pg_decode("NUMERIC", "10.25") == Map(10.25));
    CHECK(pg_decode("TEXT", "hello") == Map("hello"));
    CHECK(pg_decode("UUID", "6f1c0c4e-0000-4000-8000-000000000000")
          == Map("6f1c0c4e-0000-4000-8000-000000000000"));
    CHECK(pg_decode("TIMESTAMPTZ", "2024-01-01 00:00:00+00") == Map("2024-01-01 00:00:00+00"));
}

TEST_CASE("RowDecoder: NULL cells and unknown types decode to null", "[decoder][pg]") {
    CHECK(pg_decode("INT8", std::nullopt).is_null());
    CHECK(pg_decode("TEXT", std::nullopt).is_null());
    CHECK(pg_decode("POINT", "(1,2)").is_null());
    CHECK(pg_decode("", "x").is_null());
}

TEST_CASE("RowDecoder: bytea hex output", "[decoder][pg]") {
    CHECK(pg_decode("BYTEA", "\\x00ff10") == Map::array({0, 255, 16}));
    CHECK(pg_decode("BYTEA", "\\x") == Map::array());
    CHECK(pg().decode_value("BYTEA", "\\xzz").is_error());
}

TEST_CASE("RowDecoder: json and arrays", "[decoder][pg]") {
    CHECK(pg_decode("JSONB", R"({"a":[1,2]})") == Map{{"a", Map::array({1, 2})}});
    CHECK(pg().decode_value("JSON", "{broken").error_category() == ErrorCategory::DECODE_ERROR);

    CHECK(pg_decode("TEXT[]", R"({a,"b c",NULL})") == Map::array({"a", "b c", nullptr}));
    CHECK(pg_decode("UUID[]", "{}") == Map::array());
}

TEST_CASE("RowDecoder: array literal parsing", "[decoder][pg]") {
    REQUIRE(PgEncoder::parse_array_literal(R"({"x\"y","a,b"})"));
    CHECK(*PgEncoder::parse_array_literal(R"({"x\"y","a,b"})") == Map::array({"x\"y", "a,b"}));
    CHECK(*PgEncoder::parse_array_literal("{\"NULL\"}") == Map::array({"NULL"}));

    CHECK_FALSE(PgEncoder::parse_array_literal("a,b"));
    CHECK_FALSE(PgEncoder::parse_array_literal("{\"open}"));
    CHECK_FALSE(PgEncoder::parse_array_literal("{{1,2},{3,4}}"));
    CHECK_FALSE(PgEncoder::parse_array_literal("{a,,b}"));
}

TEST_CASE("RowDecoder: malformed values are decode errors", "[decoder][pg]") {
    CHECK(pg().decode_value("BOOL", "maybe").error_category() == ErrorCategory::DECODE_ERROR);
    CHECK(pg().decode_value("INT4", "12x").error_category() == ErrorCategory::DECODE_ERROR);
    CHECK(pg().decode_value("FLOAT8", "abc").error_category() == ErrorCategory::DECODE_ERROR);
    CHECK(pg().decode_value("TEXT[]", "{a").error_category() == ErrorCategory::DECODE_ERROR);
}

// ============================================================================
// MySQL
// ============================================================================

TEST_CASE("RowDecoder: MySQL scalars", "[decoder][mysql]") {
    CHECK(mysql_decode("BOOLEAN", "1") == Map(true));
    CHECK(mysql_decode("BOOLEAN", "0") == Map(false));
    CHECK(mysql_decode("TINYINT", "-3") == Map(-3));
    CHECK(mysql_decode("BIGINT UNSIGNED", "18446744073709551615")
          == Map(static_cast<uint64_t>(18446744073709551615ULL)));
    CHECK(mysql_decode("DECIMAL", "1.50") == Map(1.5));
    CHECK(mysql_decode("DATETIME", "2024-01-01 10:00:00") == Map("2024-01-01 10:00:00"));
    CHECK(mysql_decode("VARCHAR", "") == Map(""));
    CHECK(mysql_decode("JSON", R"(["a","b"])") == Map::array({"a", "b"}));
}

TEST_CASE("RowDecoder: MySQL TINYINT(1) is true for any non-zero value", "[decoder][mysql]") {
    CHECK(mysql_decode("BOOLEAN", "2") == Map(true));
    CHECK(mysql_decode("BOOLEAN", "-1") == Map(true));
    CHECK(mysql_decode("BOOLEAN", "127") == Map(true));
    CHECK(mysql_decode("BOOLEAN", "00") == Map(false));
}

TEST_CASE("RowDecoder: MySQL binary columns decode to byte arrays", "[decoder][mysql]") {
    CHECK(mysql_decode("BLOB", std::string("\x01\x00\xff", 3)) == Map::array({1, 0, 255}));
    CHECK(mysql_decode("VARBINARY", "") == Map::array());
}

TEST_CASE("RowDecoder: MySQL signedness is enforced", "[decoder][mysql]") {
    CHECK(mysql().decode_value("INT UNSIGNED", "-1").is_error());
    CHECK(mysql().decode_value("BOOLEAN", "yes").is_error());
    CHECK(mysql_decode("GEOMETRY", "xx").is_null());
    CHECK(mysql_decode("INT", std::nullopt).is_null());
}

TEST_CASE("RowDecoder: MySQL field metadata maps to native type names", "[decoder][mysql]") {
    const auto field = [](enum_field_types type, unsigned long length = 11,
                          unsigned int flags = 0, unsigned int charset = 45) {
        MYSQL_FIELD f{};
        f.type = type;
        f.length = length;
        f.flags = flags;
        f.charsetnr = charset;
        return MysqlTypeMap::field_type_name(f);
    };

    CHECK(field(MYSQL_TYPE_TINY, 1) == "BOOLEAN");
    CHECK(field(MYSQL_TYPE_TINY, 4) == "TINYINT");
    CHECK(field(MYSQL_TYPE_LONGLONG, 20, UNSIGNED_FLAG) == "BIGINT UNSIGNED");
    CHECK(field(MYSQL_TYPE_NEWDECIMAL) == "DECIMAL");
    CHECK(field(MYSQL_TYPE_BLOB) == "TEXT");
    CHECK(field(MYSQL_TYPE_BLOB, 65535, 0, 63) == "BLOB");
    CHECK(field(MYSQL_TYPE_VAR_STRING, 255, 0, 63) == "VARBINARY");
    CHECK(field(MYSQL_TYPE_ENUM) == "VARCHAR");
    CHECK(field(MYSQL_TYPE_GEOMETRY).empty());
}

// ============================================================================
// Rows
// ============================================================================

TEST_CASE("RowDecoder: decode_rows builds documents keyed by column", "[decoder]") {
    const auto rs = rows_result({"id", "age", "tags"}, {"INT8", "INT4", "TEXT[]"}, {
        {"1", "30", "{a,b}"},
        {"2", std::nullopt, "{}"},
    });

    const auto docs = pg().decode_rows(rs);
    REQUIRE(docs.is_ok());
    REQUIRE(docs.value().size() == 2);
    CHECK(docs.value()[0] == Map{{"id", 1}, {"age", 30}, {"tags", Map::array({"a", "b"})}});
    CHECK(docs.value()[1]["age"].is_null());
    CHECK(docs.value()[1]["tags"] == Map::array());
}

TEST_CASE("RowDecoder: a bad cell fails the whole result and names the column", "[decoder]") {
    const auto rs = rows_result({"id", "score"}, {"INT8", "FLOAT8"}, {
        {"1", "1.0"},
        {"2", "oops"},
    });

    const auto docs = pg().decode_rows(rs);
    REQUIRE(docs.is_error());
    CHECK(docs.error_category() == ErrorCategory::DECODE_ERROR);
    CHECK(docs.error_message().find("column 'score' (FLOAT8)") != std::string::npos);
}

TEST_CASE("MysqlConnection: affected rows count matched rows", "[mysql]") {
    // An UPDATE that rewrites a value unchanged still reports the row
    CHECK((MysqlConnectionFactory::kClientFlags & CLIENT_FOUND_ROWS) != 0);
}
