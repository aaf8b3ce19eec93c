#include <catch2/catch_test_macros.hpp>
#include "db/mysql/mysql_encoder.hpp"
#include "db/postgresql/pg_encoder.hpp"
#include "model/column.hpp"

using namespace sqlorm;

namespace {

const char* const kAllTags[] = {
    "bool", "i8", "i16", "i32", "i64", "isize", "u8", "u16", "u32", "u64", "usize",
    "f32", "f64", "String", "DateTime", "NaiveDateTime", "Date", "NaiveDate",
    "Time", "NaiveTime", "Uuid", "Option<Uuid>", "Vec<u8>", "Vec<String>",
    "Vec<Uuid>", "Map"
};

} // anonymous namespace

TEST_CASE("ColumnType: type tags resolve to semantic types", "[column]") {
    CHECK(parse_semantic_type("isize") == SemanticType::I64);
    CHECK(parse_semantic_type("usize") == SemanticType::U64);
    CHECK(parse_semantic_type("NaiveDate") == SemanticType::DATE);
    CHECK(parse_semantic_type("Option<Uuid>") == SemanticType::UUID);
    CHECK(parse_semantic_type("Vec<u8>") == SemanticType::BYTES);
    CHECK(parse_semantic_type("Vec<Uuid>") == SemanticType::UUID_ARRAY);
    CHECK(parse_semantic_type("Decimal") == SemanticType::UNKNOWN);
}

TEST_CASE("ColumnType: every known tag has a non-empty DDL token in both dialects", "[column][ddl]") {
    const PgEncoder pg;
    const MysqlEncoder mysql;
    for (const char* tag : kAllTags) {
        const Column col({.name = "c", .type_name = tag});
        INFO(tag);
        CHECK(col.semantic_type() != SemanticType::UNKNOWN);
        CHECK_FALSE(pg.column_type(col).empty());
        CHECK_FALSE(mysql.column_type(col).empty());
        CHECK(pg.column_type(col) == pg.column_type(col));
    }
}

TEST_CASE("ColumnType: PostgreSQL DDL tokens", "[column][ddl]") {
    const PgEncoder pg;
    auto token = [&](const char* tag) { return pg.column_type(Column({.name = "c", .type_name = tag})); };

    CHECK(token("bool") == "BOOLEAN");
    CHECK(token("u64") == "BIGINT");
    CHECK(token("i8") == "SMALLINT");
    CHECK(token("u32") == "INT");
    CHECK(token("f64") == "DOUBLE PRECISION");
    CHECK(token("f32") == "REAL");
    CHECK(token("DateTime") == "TIMESTAMPTZ");
    CHECK(token("NaiveDateTime") == "TIMESTAMP");
    CHECK(token("Vec<u8>") == "BYTEA");
    CHECK(token("Vec<String>") == "TEXT[]");
    CHECK(token("Vec<Uuid>") == "UUID[]");
    CHECK(token("Map") == "JSONB");
}

TEST_CASE("ColumnType: MySQL DDL tokens", "[column][ddl]") {
    const MysqlEncoder mysql;
    auto token = [&](const char* tag) { return mysql.column_type(Column({.name = "c", .type_name = tag})); };

    CHECK(token("u64") == "BIGINT UNSIGNED");
    CHECK(token("i8") == "TINYINT");
    CHECK(token("u16") == "SMALLINT UNSIGNED");
    CHECK(token("DateTime") == "TIMESTAMP(6)");
    CHECK(token("NaiveDateTime") == "DATETIME(6)");
    CHECK(token("Uuid") == "VARCHAR(36)");
    CHECK(token("Vec<String>") == "JSON");
    CHECK(token("Map") == "JSON");
    CHECK(token("String") == "TEXT");
}

TEST_CASE("ColumnType: MySQL strings with a default or an index become VARCHAR(255)", "[column][ddl]") {
    const MysqlEncoder mysql;
    CHECK(mysql.column_type(Column({.name = "s", .type_name = "String", .default_value = "x"})) == "VARCHAR(255)");
    CHECK(mysql.column_type(Column({.name = "s", .type_name = "String", .index_type = "hash"})) == "VARCHAR(255)");
}

TEST_CASE("ColumnType: unknown tags are their own DDL token", "[column][ddl]") {
    const PgEncoder pg;
    const MysqlEncoder mysql;
    const Column col({.name = "price", .type_name = "NUMERIC(10, 2)"});
    CHECK(pg.column_type(col) == "NUMERIC(10, 2)");
    CHECK(mysql.column_type(col) == "NUMERIC(10, 2)");
}

TEST_CASE("ColumnType: index kinds and text-search language", "[column]") {
    CHECK(Column({.name = "a", .type_name = "String"}).index_kind() == IndexKind::NONE);
    CHECK(Column({.name = "a", .type_name = "String", .index_type = "hash"}).index_kind() == IndexKind::HASH);
    CHECK(Column({.name = "a", .type_name = "String", .index_type = "gin"}).index_kind() == IndexKind::GIN);
    CHECK(Column({.name = "a", .type_name = "String", .index_type = "brin"}).index_kind() == IndexKind::BTREE);

    const Column text({.name = "a", .type_name = "String", .index_type = "text:german"});
    CHECK(text.index_kind() == IndexKind::TEXT);
    CHECK(text.text_search_language() == "german");
    CHECK(Column({.name = "a", .type_name = "String", .index_type = "text"}).text_search_language() == "english");
    CHECK(Column({.name = "a", .type_name = "String", .index_type = "text:x') || ('y"})
              .text_search_language() == "english");
    CHECK(Column({.name = "a", .type_name = "String", .index_type = "text:Dutch"})
              .text_search_language() == "english");
}

TEST_CASE("ColumnType: extra.column_name overrides the physical name", "[column]") {
    const Column col({.name = "owner", .type_name = "Uuid", .extra = Map{{"column_name", "owner_id"}}});
    CHECK(col.name() == "owner");
    CHECK(col.column_name() == "owner_id");
    CHECK(Column({.name = "owner", .type_name = "Uuid"}).column_name() == "owner");
}

TEST_CASE("ColumnType: nullability and defaults", "[column]") {
    const Column required({.name = "a", .type_name = "i32", .nullable = false});
    CHECK(required.is_not_null());
    CHECK_FALSE(required.has_default());

    const Column defaulted({.name = "a", .type_name = "i32", .default_value = "0"});
    CHECK(defaulted.has_default());
    CHECK(defaulted.is_nullable());
}
