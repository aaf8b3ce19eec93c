#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "db/mysql/mysql_encoder.hpp"
#include "db/postgresql/pg_encoder.hpp"
#include "mocks/mock_connection.hpp"
#include "orm/schema.hpp"

#include <algorithm>
#include <regex>

using namespace sqlorm;
using namespace std::chrono_literals;
using namespace sqlorm::testing;

namespace {

EntitySchema user_entity(EntityOptions options = {}) {
    return EntitySchema("user", {
        Column({.name = "id", .type_name = "Uuid", .nullable = false}),
        Column({.name = "name", .type_name = "String"}),
        Column({.name = "age", .type_name = "i32"}),
        Column({.name = "bio", .type_name = "String", .index_type = "text"}),
    }, std::move(options));
}

/**
 * @brief One "main" pool over a scripted database
 */
struct Fixture {
    explicit Fixture(std::shared_ptr<DialectEncoder> encoder = std::make_shared<PgEncoder>())
        : factory(std::make_shared<MockConnectionFactory>()),
          registry("demo", std::move(encoder), {make_pool(factory)}) {}

    static std::shared_ptr<IConnectionPool> make_pool(std::shared_ptr<MockConnectionFactory> f) {
        PoolConfig config;
        config.connect.database = "app";
        config.acquire_timeout = 200ms;
        config.maintenance_interval = 0ms;
        return std::make_shared<GenericConnectionPool>("main", config, std::move(f));
    }

    ScriptedDatabase& db() { return *factory->db(); }

    std::shared_ptr<MockConnectionFactory> factory;
    ConnectionRegistry registry;
};

} // anonymous namespace

TEST_CASE("Schema: identity", "[schema]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);
    CHECK(users.table_name() == "demo_user");
    CHECK(users.model_namespace() == "demo:user");
}

TEST_CASE("Schema: DDL runs on the writer pool", "[schema][ddl]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);

    REQUIRE(users.create_table().is_ok());
    auto indexes = users.create_indexes();
    REQUIRE(indexes.is_ok());
    CHECK(indexes.value() == 1);

    const auto executed = fx.db().executed();
    REQUIRE(executed.size() == 2);
    CHECK(executed[0].starts_with("CREATE TABLE IF NOT EXISTS demo_user ("));
    CHECK(executed[1].find("demo_user_text_search_english_index") != std::string::npos);
}

TEST_CASE("Schema: insert reports rows affected", "[schema][dml]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);
    fx.db().queue(affected_result(1));

    auto result = users.insert(Map{{"id", "u1"}, {"name", "Ann"}, {"age", 30}});
    REQUIRE(result.is_ok());
    CHECK(result.value() == 1);
    CHECK(fx.db().executed().back() ==
        "INSERT INTO demo_user (id, name, age, bio) VALUES ('u1', 'Ann', 30, DEFAULT);");
}

TEST_CASE("Schema: empty batches and mutations execute nothing", "[schema][dml]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);

    auto inserted = users.insert_many({});
    REQUIRE(inserted.is_ok());
    CHECK(inserted.value() == 0);

    auto updated = users.update_many(Query(), Mutation(Map{{"nope", 1}}));
    REQUIRE(updated.is_ok());
    CHECK(updated.value() == 0);

    CHECK(fx.db().executed().empty());
    CHECK(fx.db().connections_created == 0);
}

TEST_CASE("Schema: update_one targets a single row", "[schema][dml]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);
    fx.db().queue(affected_result(1));

    Query query(Map{{"age", ">=18"}});
    query.set_sort("age", false);
    auto result = users.update_one(query, Mutation(Map{{"name", "Adult"}}));
    REQUIRE(result.is_ok());
    CHECK(fx.db().executed().back() ==
        "UPDATE demo_user SET name = 'Adult' WHERE id IN "
        "(SELECT id FROM demo_user WHERE age >= 18 ORDER BY age ASC LIMIT 1);");
}

TEST_CASE("Schema: find decodes rows into documents", "[schema][select]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);
    fx.db().queue(rows_result({"id", "name", "age"}, {"UUID", "TEXT", "INT4"}, {
        {"u1", "Ann", "30"},
        {"u2", "Bob", std::nullopt},
    }));

    auto result = users.find(Query(Map{{"name", "~^[AB]"}}));
    REQUIRE(result.is_ok());
    REQUIRE(result.value().size() == 2);
    CHECK(result.value()[0] == Map{{"id", "u1"}, {"name", "Ann"}, {"age", 30}});
    CHECK(result.value()[1]["age"].is_null());
    CHECK(fx.db().executed().back() ==
        "SELECT * FROM demo_user WHERE name ~ '^[AB]' LIMIT 10 OFFSET 0;");
}

TEST_CASE("Schema: find_one and query_one return nothing on an empty result", "[schema][select]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);
    fx.db().queue(rows_result({"id"}, {"UUID"}, {}));
    fx.db().queue(rows_result({"id"}, {"UUID"}, {}));

    auto one = users.find_one(Query(Map{{"id", "missing"}}));
    REQUIRE(one.is_ok());
    CHECK_FALSE(one.value().has_value());

    auto raw = users.query_one("SELECT id FROM demo_user WHERE false");
    REQUIRE(raw.is_ok());
    CHECK_FALSE(raw.value().has_value());
}

TEST_CASE("Schema: count reads the count column", "[schema][select]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);

    SECTION("integer count") {
        fx.db().queue(rows_result({"count"}, {"INT8"}, {{"3"}}));
        auto result = users.count(Query());
        REQUIRE(result.is_ok());
        CHECK(result.value() == 3);
        CHECK(fx.db().executed().back() == "SELECT count(*) AS count FROM demo_user;");
    }

    SECTION("non-integer count is a decode error") {
        fx.db().queue(rows_result({"count"}, {"TEXT"}, {{"3"}}));
        auto result = users.count(Query());
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::DECODE_ERROR);
    }
}

TEST_CASE("Schema: fetch splices associations with one query", "[schema][fetch]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);
    fx.db().queue(rows_result({"id", "name"}, {"UUID", "TEXT"}, {
        {"u1", "Ann"},
        {"u2", "Bob"},
    }));

    std::vector<Map> posts = {
        {{"title", "a"}, {"author", "u1"}, {"reviewers", Map::array({"u2", "u9"})}},
        {{"title", "b"}, {"author", "u9"}},
    };

    auto loaded = users.fetch(Query(), posts, {"author", "reviewers"});
    REQUIRE(loaded.is_ok());
    CHECK(loaded.value() == 2);

    const auto executed = fx.db().executed();
    REQUIRE(executed.size() == 1);
    CHECK(executed[0] == "SELECT * FROM demo_user WHERE id IN ('u1', 'u2', 'u9');");

    CHECK(posts[0]["author"]["name"] == "Ann");
    CHECK(posts[0]["reviewers"][0]["name"] == "Bob");
    CHECK(posts[0]["reviewers"][1] == "u9");
    CHECK(posts[1]["author"] == "u9");
}

TEST_CASE("Schema: fetch without keys runs no query", "[schema][fetch]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);

    Map post = {{"title", "a"}, {"author", nullptr}};
    auto loaded = users.fetch_one(Query(), post, {"author", "missing"});
    REQUIRE(loaded.is_ok());
    CHECK(loaded.value() == 0);
    CHECK(fx.db().executed().empty());
}

TEST_CASE("Schema: fetch projection always includes the primary key", "[schema][fetch]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);
    fx.db().queue(rows_result({"name", "id"}, {"TEXT", "UUID"}, {{"Ann", "u1"}}));

    Query query;
    query.set_fields({"name"});
    Map post = {{"author", "u1"}};
    auto loaded = users.fetch_one(query, post, {"author"});
    REQUIRE(loaded.is_ok());
    CHECK(fx.db().executed().back() == "SELECT name, id FROM demo_user WHERE id IN ('u1');");
    CHECK(post["author"] == Map{{"name", "Ann"}, {"id", "u1"}});
}

TEST_CASE("Schema: try_get_model reports a missing row", "[schema][select]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);
    fx.db().queue(rows_result({"id"}, {"UUID"}, {}));

    auto result = users.try_get_model("zz");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::ROW_NOT_FOUND);
    CHECK(result.error_message() == "no row in 'demo_user' with id = 'zz'");
}

TEST_CASE("Schema: driver failures surface as DRIVER_ERROR", "[schema][errors]") {
    Fixture fx;
    Schema users(user_entity(), fx.registry);
    fx.db().queue(error_result("relation \"demo_user\" does not exist"));

    auto result = users.delete_many(Query());
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::DRIVER_ERROR);
    CHECK(result.error_message().find("does not exist") != std::string::npos);

    // The connection survives a statement error
    CHECK(fx.registry.get_pool("main")->get_stats().idle_connections == 1);
}

TEST_CASE("Schema: missing or unreachable pools are POOL_UNAVAILABLE", "[schema][errors]") {
    Fixture fx;

    SECTION("no pool with the reader name") {
        Schema users(user_entity({.reader_name = "replica"}), fx.registry);
        auto result = users.find(Query());
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::POOL_UNAVAILABLE);
        CHECK(result.error_message() == "no connection pool named 'replica'");
    }

    SECTION("database refuses connections") {
        Schema users(user_entity(), fx.registry);
        fx.db().refuse_connections = true;
        auto result = users.execute("DELETE FROM demo_user");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::POOL_UNAVAILABLE);
    }
}

// ============================================================================
// Renamed columns
// ============================================================================

namespace {

EntitySchema account_entity() {
    return EntitySchema("account", {
        Column({.name = "id", .type_name = "Uuid", .nullable = false,
                .extra = Map{{"column_name", "account_id"}}}),
        Column({.name = "label", .type_name = "String", .extra = Map{{"column_name", "display_name"}}}),
    });
}

} // anonymous namespace

TEST_CASE("Schema: rows come back keyed by field name", "[schema][select]") {
    Fixture fx;
    Schema accounts(account_entity(), fx.registry);
    fx.db().queue(rows_result({"account_id", "display_name", "extra"}, {"UUID", "TEXT", "INT4"}, {
        {"a1", "Main", "1"},
    }));
    fx.db().queue(affected_result(1));

    auto found = accounts.find_one(Query());
    REQUIRE(found.is_ok());
    REQUIRE(found.value().has_value());
    const Map& row = *found.value();
    CHECK(row == Map{{"id", "a1"}, {"label", "Main"}, {"extra", 1}});

    // A row read back can be written again as is
    REQUIRE(accounts.insert(row).is_ok());
    CHECK(fx.db().executed().back() ==
        "INSERT INTO demo_account (account_id, display_name) VALUES ('a1', 'Main');");
}

TEST_CASE("Schema: fetch splices by a renamed primary key", "[schema][fetch]") {
    Fixture fx;
    Schema accounts(account_entity(), fx.registry);
    fx.db().queue(rows_result({"account_id", "display_name"}, {"UUID", "TEXT"}, {
        {"a1", "Main"},
        {"a2", "Savings"},
    }));

    std::vector<Map> transfers = {
        {{"from", "a1"}, {"to", "a2"}},
        {{"from", "a2"}, {"to", "a3"}},
    };
    auto loaded = accounts.fetch(Query(), transfers, {"from", "to"});
    REQUIRE(loaded.is_ok());
    CHECK(loaded.value() == 2);
    CHECK(fx.db().executed().back() ==
        "SELECT * FROM demo_account WHERE account_id IN ('a1', 'a2', 'a3');");

    CHECK(transfers[0]["from"] == Map{{"id", "a1"}, {"label", "Main"}});
    CHECK(transfers[0]["to"]["label"] == "Savings");
    CHECK(transfers[1]["from"]["id"] == "a2");
    CHECK(transfers[1]["to"] == "a3");
}

TEST_CASE("Schema: update with only a primary key executes nothing", "[schema][dml]") {
    Fixture fx(std::make_shared<MysqlEncoder>());
    Schema flags(EntitySchema("flag", {
        Column({.name = "id", .type_name = "Uuid", .nullable = false}),
    }), fx.registry);

    auto result = flags.update(Map{{"id", "f1"}});
    REQUIRE(result.is_ok());
    CHECK(result.value() == 0);
    CHECK(fx.db().executed().empty());
}

// ============================================================================
// Round trips
// ============================================================================

namespace {

EntitySchema sample_entity() {
    return EntitySchema("sample", {
        Column({.name = "id", .type_name = "Uuid", .nullable = false}),
        Column({.name = "flag", .type_name = "bool"}),
        Column({.name = "small", .type_name = "i16"}),
        Column({.name = "total", .type_name = "i64"}),
        Column({.name = "ratio", .type_name = "f64"}),
        Column({.name = "title", .type_name = "String"}),
        Column({.name = "born", .type_name = "Date"}),
        Column({.name = "seen", .type_name = "NaiveDateTime"}),
        Column({.name = "avatar", .type_name = "Vec<u8>"}),
        Column({.name = "tags", .type_name = "Vec<String>"}),
        Column({.name = "meta", .type_name = "Map"}),
    });
}

Map sample_document(std::string seen) {
    return Map{
        {"id", "6f1c0c4e-0000-4000-8000-000000000000"},
        {"flag", true},
        {"small", -7},
        {"total", 9000000000LL},
        {"ratio", 2.5},
        {"title", "it's"},
        {"born", "2024-02-29"},
        {"seen", std::move(seen)},
        {"avatar", Map::array({1, 255})},
        {"tags", Map::array({"a", "b c"})},
        {"meta", Map{{"k", 1}}},
    };
}

const std::vector<std::string> kSampleColumns = {
    "id", "flag", "small", "total", "ratio", "title", "born", "seen", "avatar", "tags", "meta"};

} // anonymous namespace

TEST_CASE("Schema: every column type survives a PostgreSQL round trip", "[schema][roundtrip][pg]") {
    Fixture fx;
    Schema samples(sample_entity(), fx.registry);
    const Map doc = sample_document("2024-01-01 10:00:00");

    REQUIRE(samples.insert(doc).is_ok());
    CHECK(fx.db().executed().back() ==
        "INSERT INTO demo_sample (id, flag, small, total, ratio, title, born, seen, avatar, tags, meta) "
        "VALUES ('6f1c0c4e-0000-4000-8000-000000000000', TRUE, -7, 9000000000, 2.5, 'it''s', "
        "'2024-02-29', '2024-01-01 10:00:00', '\\x01ff', ARRAY['a', 'b c']::TEXT[], "
        "'{\"k\":1}'::JSONB);");

    // Text output PostgreSQL gives for the stored literals
    fx.db().queue(rows_result(kSampleColumns,
        {"UUID", "BOOL", "INT2", "INT8", "FLOAT8", "TEXT", "DATE", "TIMESTAMP", "BYTEA", "TEXT[]", "JSONB"},
        {{"6f1c0c4e-0000-4000-8000-000000000000", "t", "-7", "9000000000", "2.5", "it's",
          "2024-02-29", "2024-01-01 10:00:00", "\\x01ff", "{a,\"b c\"}", "{\"k\": 1}"}}));

    auto stored = samples.try_get_model("6f1c0c4e-0000-4000-8000-000000000000");
    REQUIRE(stored.is_ok());
    for (const auto& column : kSampleColumns) {
        INFO(column);
        CHECK(stored.value()[column] == doc[column]);
    }
}

TEST_CASE("Schema: every column type survives a MySQL round trip", "[schema][roundtrip][mysql]") {
    Fixture fx(std::make_shared<MysqlEncoder>());
    Schema samples(sample_entity(), fx.registry);
    const Map doc = sample_document("2024-01-01 10:00:00.250000");

    REQUIRE(samples.insert(doc).is_ok());
    CHECK(fx.db().executed().back() ==
        "INSERT INTO demo_sample (id, flag, small, total, ratio, title, born, seen, avatar, tags, meta) "
        "VALUES ('6f1c0c4e-0000-4000-8000-000000000000', TRUE, -7, 9000000000, 2.5, 'it''s', "
        "'2024-02-29', '2024-01-01 10:00:00.250000', X'01ff', json_array('a', 'b c'), "
        "'{\"k\":1}');");

    // Text output MySQL gives for the stored literals
    fx.db().queue(rows_result(kSampleColumns,
        {"VARCHAR", "BOOLEAN", "SMALLINT", "BIGINT", "DOUBLE", "TEXT", "DATE", "DATETIME", "BLOB", "JSON", "JSON"},
        {{"6f1c0c4e-0000-4000-8000-000000000000", "1", "-7", "9000000000", "2.5", "it's",
          "2024-02-29", "2024-01-01 10:00:00.250000", std::string("\x01\xff", 2), "[\"a\", \"b c\"]",
          "{\"k\": 1}"}}));

    auto stored = samples.try_get_model("6f1c0c4e-0000-4000-8000-000000000000");
    REQUIRE(stored.is_ok());
    for (const auto& column : kSampleColumns) {
        INFO(column);
        CHECK(stored.value()[column] == doc[column]);
    }
}

// ============================================================================
// Bounded mutations
// ============================================================================

namespace {

struct Person {
    std::string id;
    int age;
};

/**
 * @brief Answers bounded UPDATE/DELETE statements against an in-memory table
 *
 * Every row matches the filter. The ORDER BY and LIMIT of the key subquery
 * select the rows affected; a statement without them affects all rows.
 */
class PeopleTable {
public:
    std::vector<Person> rows = {{"u1", 40}, {"u2", 20}, {"u3", 30}};
    std::vector<std::string> updated;

    std::optional<DbResultSet> answer(const std::string& sql) {
        std::vector<Person> targets = rows;
        static const std::regex bounded(R"(ORDER BY age (ASC|DESC) LIMIT (\d+)\))");
        std::smatch match;
        if (std::regex_search(sql, match, bounded)) {
            const bool ascending = match[1] == "ASC";
            std::sort(targets.begin(), targets.end(), [&](const Person& a, const Person& b) {
                return ascending ? a.age < b.age : a.age > b.age;
            });
            targets.resize(std::min(targets.size(), static_cast<size_t>(std::stoul(match[2].str()))));
        }

        for (const auto& target : targets) {
            if (sql.starts_with("DELETE")) {
                std::erase_if(rows, [&](const Person& p) { return p.id == target.id; });
            } else {
                updated.push_back(target.id);
            }
        }
        return affected_result(targets.size());
    }
};

} // anonymous namespace

TEST_CASE("Schema: update_one and delete_one affect the first row under the sort", "[schema][dml]") {
    std::shared_ptr<DialectEncoder> encoder;
    SECTION("postgresql") { encoder = std::make_shared<PgEncoder>(); }
    SECTION("mysql") { encoder = std::make_shared<MysqlEncoder>(); }

    Fixture fx(encoder);
    Schema users(user_entity(), fx.registry);
    PeopleTable table;
    fx.db().responder = [&](const std::string& sql) { return table.answer(sql); };

    Query adults(Map{{"age", ">=18"}});
    adults.set_sort("age", false);
    auto updated = users.update_one(adults, Mutation(Map{{"name", "Youngest"}}));
    REQUIRE(updated.is_ok());
    CHECK(updated.value() == 1);
    CHECK(table.updated == std::vector<std::string>{"u2"});

    adults.set_sort("age", true);
    auto deleted = users.delete_one(adults);
    REQUIRE(deleted.is_ok());
    CHECK(deleted.value() == 1);
    REQUIRE(table.rows.size() == 2);
    CHECK(std::none_of(table.rows.begin(), table.rows.end(),
                       [](const Person& p) { return p.id == "u1"; }));

    auto rest = users.delete_many(adults);
    REQUIRE(rest.is_ok());
    CHECK(rest.value() == 2);
    CHECK(table.rows.empty());
}
