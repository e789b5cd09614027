#include <catch2/catch_test_macros.hpp>
#include "db/connection_registry.hpp"
#include "mocks/mock_driver.hpp"

#include <atomic>
#include <thread>

using namespace polydb;
using polydb::testing::MockDriver;

namespace {

/**
 * @brief Driver factory handing out MockDrivers labelled with the database
 *
 * Descriptors whose host is "unreachable" fail the handshake.
 */
struct MockFactory {
    std::shared_ptr<std::atomic<int>> created = std::make_shared<std::atomic<int>>(0);

    ConnectionRegistry::DriverFactory fn() const {
        auto counter = created;
        return [counter](const ConnectionDescriptor& d) -> Result<std::shared_ptr<IDbDriver>> {
            if (d.host == "unreachable") {
                return Result<std::shared_ptr<IDbDriver>>::error(
                    ErrorCode::CONNECT_ERROR, "Failed to connect: host unreachable");
            }
            counter->fetch_add(1);
            return Result<std::shared_ptr<IDbDriver>>::ok(
                std::make_shared<MockDriver>(d.type, d.database.value_or(d.id)));
        };
    }
};

ConnectionDescriptor descriptor(std::string id, DatabaseType type, std::string database) {
    ConnectionDescriptor d;
    d.id = std::move(id);
    d.name = d.id;
    d.type = type;
    d.host = "localhost";
    d.port = 5432;
    d.database = std::move(database);
    return d;
}

std::string first_cell(const Result<QueryResult>& r) {
    return std::get<std::string>(r.value().rows.at(0).at(0));
}

} // namespace

TEST_CASE("ConnectionRegistry: connect registers under the id", "[registry]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());

    auto id = registry.connect(descriptor("main", DatabaseType::POSTGRESQL, "app"));
    REQUIRE(id.is_ok());
    CHECK(id.value() == "main");
    CHECK(registry.size() == 1);

    auto dbs = registry.list_databases("main");
    REQUIRE(dbs.is_ok());
    CHECK(dbs.value() == NameList{"app"});

    auto tables = registry.list_tables("main", "app", "public");
    REQUIRE(tables.is_ok());
    CHECK(tables.value() == NameList{"t_app"});
}

TEST_CASE("ConnectionRegistry: reconnecting an id replaces the driver", "[registry]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());

    REQUIRE(registry.connect(descriptor("main", DatabaseType::POSTGRESQL, "first")).is_ok());
    auto held = registry.lookup("main");
    REQUIRE(held.is_ok());

    REQUIRE(registry.connect(descriptor("main", DatabaseType::POSTGRESQL, "second")).is_ok());
    CHECK(registry.size() == 1);

    auto result = registry.execute_query("main", "SELECT 1");
    REQUIRE(result.is_ok());
    CHECK(first_cell(result) == "second");

    // A caller holding the old driver can still finish its call
    auto stale = held.value()->execute_query("SELECT 1", std::nullopt);
    REQUIRE(stale.is_ok());
    CHECK(first_cell(stale) == "first");
}

TEST_CASE("ConnectionRegistry: unknown ids are reported", "[registry]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());

    auto query = registry.execute_query("ghost", "SELECT 1");
    REQUIRE(query.is_error());
    CHECK(query.error_code() == ErrorCode::CONNECTION_NOT_FOUND);
    CHECK(query.error_message() == "Connection 'ghost' not found or not connected");

    auto columns = registry.list_columns("ghost", "db", "s", "t");
    CHECK(columns.error_code() == ErrorCode::CONNECTION_NOT_FOUND);

    auto removed = registry.disconnect("ghost");
    REQUIRE(removed.is_error());
    CHECK(removed.error_code() == ErrorCode::CONNECTION_NOT_FOUND);
    CHECK(removed.error_message() == "Connection 'ghost' not found");
}

TEST_CASE("ConnectionRegistry: disconnect removes the entry", "[registry]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());

    REQUIRE(registry.connect(descriptor("a", DatabaseType::SQLITE, "a.db")).is_ok());
    CHECK(registry.disconnect("a").is_ok());
    CHECK(registry.size() == 0);
    CHECK(registry.lookup("a").is_error());
    CHECK(registry.disconnect("a").is_error());
}

TEST_CASE("ConnectionRegistry: failed connect leaves the existing entry", "[registry]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());

    REQUIRE(registry.connect(descriptor("main", DatabaseType::MYSQL, "app")).is_ok());

    auto bad = descriptor("main", DatabaseType::MYSQL, "other");
    bad.host = "unreachable";
    auto result = registry.connect(bad);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::CONNECT_ERROR);

    auto query = registry.execute_query("main", "SELECT 1");
    REQUIRE(query.is_ok());
    CHECK(first_cell(query) == "app");
}

TEST_CASE("ConnectionRegistry: Redis switch selects in place", "[registry][switch]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());

    const auto cache = descriptor("cache", DatabaseType::REDIS, "0");
    REQUIRE(registry.connect(cache).is_ok());
    auto before = registry.lookup("cache");
    REQUIRE(before.is_ok());

    REQUIRE(registry.switch_database(cache, "5").is_ok());
    CHECK(*factory.created == 1);

    auto after = registry.lookup("cache");
    REQUIRE(after.is_ok());
    CHECK(after.value() == before.value());
    CHECK(static_cast<MockDriver&>(*after.value()).selected() == "5");
}

TEST_CASE("ConnectionRegistry: relational switch reconnects", "[registry][switch]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());

    const auto pg = descriptor("pg", DatabaseType::POSTGRESQL, "app");
    REQUIRE(registry.connect(pg).is_ok());

    REQUIRE(registry.switch_database(pg, "reporting").is_ok());
    CHECK(*factory.created == 2);

    auto dbs = registry.list_databases("pg");
    REQUIRE(dbs.is_ok());
    CHECK(dbs.value() == NameList{"reporting"});
}

TEST_CASE("ConnectionRegistry: failed relational switch leaves the id absent", "[registry][switch]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());

    auto pg = descriptor("pg", DatabaseType::POSTGRESQL, "app");
    REQUIRE(registry.connect(pg).is_ok());

    pg.host = "unreachable";
    auto status = registry.switch_database(pg, "reporting");
    REQUIRE(status.is_error());
    CHECK(status.error_code() == ErrorCode::CONNECT_ERROR);
    CHECK(registry.lookup("pg").error_code() == ErrorCode::CONNECTION_NOT_FOUND);
}

TEST_CASE("ConnectionRegistry: Redis switch on an unknown id", "[registry][switch]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());

    auto status = registry.switch_database(descriptor("nope", DatabaseType::REDIS, "0"), "1");
    REQUIRE(status.is_error());
    CHECK(status.error_code() == ErrorCode::CONNECTION_NOT_FOUND);
}

TEST_CASE("ConnectionRegistry: switch rejects a descriptor of another backend", "[registry][switch]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());

    const auto cache = descriptor("cache", DatabaseType::REDIS, "0");
    REQUIRE(registry.connect(cache).is_ok());
    auto before = registry.lookup("cache");
    REQUIRE(before.is_ok());

    auto status = registry.switch_database(descriptor("cache", DatabaseType::POSTGRESQL, "0"), "app");
    REQUIRE(status.is_error());
    CHECK(status.error_code() == ErrorCode::INVALID_ARGUMENT);
    CHECK(status.error_message() == "Connection 'cache' is redis, not postgresql");

    // The Redis connection is neither torn down nor reconnected
    CHECK(*factory.created == 1);
    auto after = registry.lookup("cache");
    REQUIRE(after.is_ok());
    CHECK(after.value() == before.value());
    CHECK(static_cast<MockDriver&>(*after.value()).selected().empty());
}

TEST_CASE("ConnectionRegistry: execute_query passes the database through", "[registry]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());

    REQUIRE(registry.connect(descriptor("cache", DatabaseType::REDIS, "0")).is_ok());
    REQUIRE(registry.execute_query("cache", "GET k", std::string("3")).is_ok());

    auto driver = registry.lookup("cache");
    REQUIRE(driver.is_ok());
    CHECK(static_cast<MockDriver&>(*driver.value()).last_database() == std::optional<std::string>("3"));
}

TEST_CASE("ConnectionRegistry: connection_ids is sorted", "[registry]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());

    for (const char* id : {"zeta", "alpha", "mid"}) {
        REQUIRE(registry.connect(descriptor(id, DatabaseType::SQLITE, id)).is_ok());
    }
    CHECK(registry.connection_ids() == std::vector<std::string>{"alpha", "mid", "zeta"});
}

TEST_CASE("ConnectionRegistry: concurrent lookups during reconnects", "[registry][concurrency]") {
    MockFactory factory;
    ConnectionRegistry registry(factory.fn());
    REQUIRE(registry.connect(descriptor("main", DatabaseType::POSTGRESQL, "v0")).is_ok());

    std::atomic<bool> stop{false};
    std::atomic<int> failures{0};
    std::atomic<int> served{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            do {
                auto result = registry.execute_query("main", "SELECT 1");
                if (result.is_ok()) {
                    served.fetch_add(1);
                } else {
                    failures.fetch_add(1);
                }
            } while (!stop.load());
        });
    }

    for (int i = 1; i <= 50; ++i) {
        REQUIRE(registry.connect(descriptor("main", DatabaseType::POSTGRESQL, "v" + std::to_string(i))).is_ok());
    }
    stop.store(true);
    for (auto& t : readers) {
        t.join();
    }

    // connect swaps atomically, so readers never observe a missing id
    CHECK(failures.load() == 0);
    CHECK(served.load() > 0);
    CHECK(registry.size() == 1);
}
