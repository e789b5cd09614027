#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_driver.hpp"
#include "db/redis/redis_driver.hpp"
#include <memory>

namespace polydb {

/**
 * @brief Settings applied to every driver the factory builds
 *
 * pool.connection_string is ignored; it is derived per descriptor.
 */
struct DriverOptions {
    PoolConfig pool;
    RedisOptions redis;
};

/**
 * @brief Build the driver for a descriptor and complete its handshake
 *
 * Relational backends get a GenericConnectionPool over their connection
 * factory, warmed up before returning. Redis gets a RedisDriver with one
 * connection opened. A failed handshake returns CONNECT_ERROR and no
 * driver.
 *
 * Connection targets:
 *   PostgreSQL  host/port/credentials, database defaults to "postgres"
 *   MySQL       host/port/credentials, database defaults to "mysql"
 *   SQLite      file path from host, else from database; ":memory:" or
 *               an empty path is one pinned in-memory connection
 *   Redis       host/port/credentials, database is the initial index
 */
[[nodiscard]] Result<std::shared_ptr<IDbDriver>> create_driver(
    const ConnectionDescriptor& descriptor, const DriverOptions& options);

/**
 * @brief Pool settings used for a SQLite path
 *
 * In-memory databases live and die with their connection, so they get
 * exactly one connection that is never recycled.
 */
[[nodiscard]] PoolConfig sqlite_pool_config(const std::string& path, const PoolConfig& base);

} // namespace polydb
