#include "db/driver_factory.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_driver.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_driver.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "db/sqlite/sqlite_driver.hpp"
#include "core/utils.hpp"
#include <format>

namespace polydb {

namespace {

using DriverResult = Result<std::shared_ptr<IDbDriver>>;

constexpr uint16_t kDefaultRedisPort = 6379;

/**
 * @brief Warm up a pool and wrap it in a relational driver
 */
template<typename Driver>
DriverResult make_relational(const ConnectionDescriptor& descriptor,
                             const PoolConfig& config,
                             std::shared_ptr<IConnectionFactory> factory) {
    auto pool = std::make_shared<GenericConnectionPool>(descriptor.id, config, std::move(factory));
    if (auto status = pool->warm_up(); status.is_error()) {
        return DriverResult::propagate(status);
    }
    return DriverResult::ok(std::make_shared<Driver>(pool, config.connection_timeout));
}

DriverResult make_redis(const ConnectionDescriptor& descriptor, const RedisOptions& options) {
    RedisEndpoint endpoint;
    endpoint.host = descriptor.host.empty() ? endpoint.host : descriptor.host;
    endpoint.port = descriptor.port != 0 ? descriptor.port : kDefaultRedisPort;
    endpoint.username = descriptor.username;
    endpoint.password = descriptor.password;
    endpoint.connect_timeout = options.connect_timeout;

    if (descriptor.database && !utils::trim(*descriptor.database).empty()) {
        const auto index = utils::try_parse_int<int64_t>(utils::trim(*descriptor.database));
        if (!index) {
            return DriverResult::error(ErrorCode::INVALID_ARGUMENT,
                std::format("Invalid database index: {}", *descriptor.database));
        }
        endpoint.database = *index;
    }

    auto driver = std::make_shared<RedisDriver>(std::move(endpoint), options);
    if (auto status = driver->warm_up(); status.is_error()) {
        return DriverResult::propagate(status);
    }
    return DriverResult::ok(std::move(driver));
}

} // namespace

PoolConfig sqlite_pool_config(const std::string& path, const PoolConfig& base) {
    PoolConfig config = base;
    config.connection_string = path;
    if (SqliteConnectionFactory::is_in_memory(path)) {
        config.min_connections = 1;
        config.max_connections = 1;
        config.max_lifetime = std::chrono::seconds{0};
    }
    return config;
}

Result<std::shared_ptr<IDbDriver>> create_driver(
    const ConnectionDescriptor& descriptor, const DriverOptions& options) {

    switch (descriptor.type) {
        case DatabaseType::POSTGRESQL: {
            PoolConfig config = options.pool;
            config.connection_string = PgConnectionFactory::build_conninfo(
                descriptor, config.connection_timeout);
            return make_relational<PgDriver>(descriptor, config,
                std::make_shared<PgConnectionFactory>());
        }

        case DatabaseType::MYSQL: {
            PoolConfig config = options.pool;
            config.connection_string = MysqlConnectionFactory::build_connection_string(
                descriptor, config.connection_timeout);
            return make_relational<MysqlDriver>(descriptor, config,
                std::make_shared<MysqlConnectionFactory>());
        }

        case DatabaseType::SQLITE: {
            const std::string path = !descriptor.host.empty()
                ? descriptor.host
                : descriptor.database.value_or("");
            const PoolConfig config = sqlite_pool_config(path, options.pool);
            return make_relational<SqliteDriver>(descriptor, config,
                std::make_shared<SqliteConnectionFactory>(config.connection_timeout));
        }

        case DatabaseType::REDIS:
            return make_redis(descriptor, options.redis);
    }

    return DriverResult::error(ErrorCode::INTERNAL_ERROR, "Unknown database type");
}

} // namespace polydb
