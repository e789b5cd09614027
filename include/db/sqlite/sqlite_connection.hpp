#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <chrono>
#include <string>
#include <string_view>

namespace polydb {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps a sqlite3* handle. execute() accepts several ';'-separated
 * statements; the rows of the last row-producing statement are returned
 * and affected_rows counts the changes made by the whole batch.
 */
class SqliteConnection : public IDbConnection {
public:
    explicit SqliteConnection(sqlite3* db);
    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    std::string quote_literal(std::string_view value) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

private:
    /**
     * @brief Step a prepared statement to completion, collecting rows
     * @return false on a step error (message in out.error_message)
     */
    bool collect_rows(sqlite3_stmt* stmt, DbResultSet& out);

    sqlite3* db_;
};

/**
 * @brief SQLite connection factory
 *
 * The connection string is a file path, ":memory:" or a "file:" URI,
 * optionally prefixed with "sqlite:". Files must already exist; a typo
 * in a path is a connect error, not a new empty database.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    explicit SqliteConnectionFactory(std::chrono::milliseconds busy_timeout = std::chrono::milliseconds{5000});

    Result<std::unique_ptr<IDbConnection>> create(const std::string& connection_string) override;

    /** @brief True for ":memory:", an empty path or a mode=memory URI */
    [[nodiscard]] static bool is_in_memory(std::string_view path);

private:
    std::chrono::milliseconds busy_timeout_;
};

} // namespace polydb
