#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace polydb {

/**
 * @brief Abstract factory for creating database connections
 *
 * Each backend provides its own factory that wraps the native
 * connection function (PQconnectdb, mysql_real_connect, sqlite3_open_v2).
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string Backend-specific connection string
     * @return New connection, or CONNECT_ERROR carrying the driver diagnostic
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> create(
        const std::string& connection_string) = 0;
};

} // namespace polydb
