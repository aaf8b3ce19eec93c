#include <catch2/catch_test_macros.hpp>
#include "db/connection_registry.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/postgresql/pg_encoder.hpp"
#include "mocks/mock_connection.hpp"
#include "security/password_cipher.hpp"

#include <stdexcept>

using namespace sqlorm;
using namespace std::chrono_literals;
using sqlorm::testing::MockConnectionFactory;

namespace {

// Backend whose pools all connect through one scripted factory
class MockBackend : public IDbBackend {
public:
    explicit MockBackend(std::shared_ptr<MockConnectionFactory> factory)
        : factory_(std::move(factory)) {}

    DatabaseType type() const override { return DatabaseType::POSTGRESQL; }

    std::shared_ptr<IConnectionPool> create_pool(const std::string& pool_name,
                                                 const PoolConfig& config) override {
        PoolConfig cfg = config;
        cfg.maintenance_interval = 0ms;
        return std::make_shared<GenericConnectionPool>(pool_name, cfg, factory_);
    }

    std::shared_ptr<DialectEncoder> create_encoder(EncoderOptions options) override {
        return std::make_shared<PgEncoder>(options);
    }

private:
    std::shared_ptr<MockConnectionFactory> factory_;
};

BackendRegistry mock_backends(std::shared_ptr<MockConnectionFactory> factory) {
    BackendRegistry backends;
    backends.register_backend(DatabaseType::POSTGRESQL, [factory] {
        return std::make_unique<MockBackend>(factory);
    });
    return backends;
}

PoolEntryConfig pool_entry(std::string name) {
    PoolEntryConfig entry;
    entry.name = std::move(name);
    entry.database = "app";
    entry.username = "svc";
    entry.password = "secret";
    return entry;
}

OrmConfig valid_config() {
    OrmConfig config;
    config.application_name = "inventory";
    config.logging.level = "warn";
    config.database.namespace_prefix = "demo";
    config.database.type = "postgresql";
    config.pools = {pool_entry("main"), pool_entry("replica")};
    return config;
}

std::shared_ptr<GenericConnectionPool> standalone_pool(const std::string& name) {
    PoolConfig config;
    config.maintenance_interval = 0ms;
    return std::make_shared<GenericConnectionPool>(name, config,
                                                   std::make_shared<MockConnectionFactory>());
}

} // anonymous namespace

TEST_CASE("ConnectionRegistry: builds lazy pools from config", "[registry]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionRegistry registry(valid_config(), mock_backends(factory));

    CHECK(registry.namespace_prefix() == "demo");
    CHECK(registry.pools().size() == 2);
    CHECK(registry.encoder()->type() == DatabaseType::POSTGRESQL);
    CHECK(factory->db()->connections_created == 0);

    REQUIRE(registry.get_pool("replica"));
    CHECK(registry.get_pool("replica")->name() == "replica");
    CHECK_FALSE(registry.get_pool("missing"));
}

TEST_CASE("ConnectionRegistry: connect options carry defaults and the application name", "[registry]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionRegistry registry(valid_config(), mock_backends(factory));

    auto conn = registry.get_pool("main")->acquire();
    REQUIRE(conn.is_ok());

    const auto options = factory->last_options();
    CHECK(options.host == "127.0.0.1");
    CHECK(options.port == 5432);
    CHECK(options.database == "app");
    CHECK(options.username == "svc");
    CHECK(options.password == "secret");
    CHECK(options.application_name == "inventory");
}

TEST_CASE("ConnectionRegistry: encrypted passwords are unwrapped before connecting", "[registry][security]") {
    auto config = valid_config();
    config.pools[0].password = PasswordCipher::encrypt_password(config.pools[0]);
    REQUIRE(config.pools[0].password != "secret");

    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionRegistry registry(config, mock_backends(factory));

    auto conn = registry.get_pool("main")->acquire();
    REQUIRE(conn.is_ok());
    CHECK(factory->last_options().password == "secret");
}

TEST_CASE("ConnectionRegistry: invalid config is rejected before any pool exists", "[registry]") {
    auto config = valid_config();
    config.database.namespace_prefix.clear();
    config.pools[1].max_connections = 0;

    try {
        ConnectionRegistry registry(config, mock_backends(std::make_shared<MockConnectionFactory>()));
        FAIL("expected std::invalid_argument");
    } catch (const std::invalid_argument& e) {
        const std::string message = e.what();
        CHECK(message.find("database.namespace is required") != std::string::npos);
        CHECK(message.find("postgres[1].max-connections must be > 0") != std::string::npos);
    }
}

TEST_CASE("ConnectionRegistry: a type without a backend is a runtime error", "[registry]") {
    CHECK_THROWS_AS(ConnectionRegistry(valid_config(), BackendRegistry{}), std::runtime_error);
}

TEST_CASE("ConnectionRegistry: strict filters flow into the encoder", "[registry]") {
    auto config = valid_config();
    config.database.strict_filters = true;
    ConnectionRegistry registry(config, mock_backends(std::make_shared<MockConnectionFactory>()));
    CHECK(registry.encoder()->strict_filters());
}

TEST_CASE("ConnectionRegistry: get_pool prefers available pools", "[registry][fallback]") {
    auto first = standalone_pool("main");
    auto second = standalone_pool("main");
    auto other = standalone_pool("analytics");
    ConnectionRegistry registry("demo", std::make_shared<PgEncoder>(), {first, other, second});

    SECTION("first available wins") {
        CHECK(registry.get_pool("main") == first);
    }

    SECTION("skips an unavailable pool") {
        first->set_available(false);
        CHECK(registry.get_pool("main") == second);
    }

    SECTION("falls back to the last unavailable pool") {
        first->set_available(false);
        second->set_available(false);
        CHECK(registry.get_pool("main") == second);
    }

    SECTION("add_pool extends the candidates") {
        first->set_available(false);
        second->set_available(false);
        auto third = standalone_pool("main");
        registry.add_pool(third);
        CHECK(registry.get_pool("main") == third);
    }
}

TEST_CASE("ConnectionRegistry: drain refuses further acquisitions", "[registry]") {
    auto pool = standalone_pool("main");
    ConnectionRegistry registry("demo", std::make_shared<PgEncoder>(), {pool});

    registry.drain();
    auto result = pool->acquire();
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::POOL_UNAVAILABLE);
}
