#pragma once

#include "db/idb_driver.hpp"
#include "db/redis/redis_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>

namespace polydb {

/**
 * @brief Redis driver settings
 */
struct RedisOptions {
    size_t max_connections = 4;
    std::chrono::milliseconds connect_timeout{5000};
    size_t database_count = 16;    // Reported by list_databases
};

/**
 * @brief Redis driver: command execution through CommandInterpreter
 *
 * Keeps a bounded set of hiredis connections; every call leases its own
 * so concurrent commands never share a socket. The selected logical
 * database is driver-wide: a SELECT (explicit, via switch or via the
 * per-query database argument) updates it, and a leased connection that
 * last selected another database is re-synced before use. Commands
 * already running keep whatever database their connection had.
 * A connection that ran MULTI, WATCH, a SUBSCRIBE command or MONITOR
 * is closed on release rather than pooled.
 *
 * Redis has no schemas, tables or columns, so those listings are empty;
 * function listings are unsupported.
 */
class RedisDriver : public IDbDriver {
public:
    RedisDriver(RedisEndpoint endpoint, RedisOptions options);
    ~RedisDriver() override;

    /**
     * @brief Open the first connection so handshake failures surface early
     */
    [[nodiscard]] Status warm_up();

    DatabaseType type() const override { return DatabaseType::REDIS; }

    Result<NameList> list_databases() override;
    Result<NameList> list_schemas(const std::string& database) override;
    Result<NameList> list_tables(const std::string& database, const std::string& schema) override;
    Result<NameList> list_views(const std::string& database, const std::string& schema) override;
    Result<NameList> list_functions(const std::string& database, const std::string& schema) override;

    Result<FunctionInfo> get_function_definition(
        const std::string& database, const std::string& schema,
        const std::string& function_name) override;

    Result<std::vector<ColumnInfo>> list_columns(
        const std::string& database, const std::string& schema, const std::string& table) override;

    Result<std::vector<IndexInfo>> list_indexes(
        const std::string& database, const std::string& schema, const std::string& table) override;

    Result<std::vector<ConstraintInfo>> list_constraints(
        const std::string& database, const std::string& schema, const std::string& table) override;

    Result<QueryResult> execute_query(
        const std::string& statement, const std::optional<std::string>& database) override;

    /**
     * @brief SELECT in place; the connection stays registered
     * @return INVALID_ARGUMENT for a non-numeric index, CONNECT_ERROR
     *         "Failed to switch database: ..." when the server refuses
     */
    Status select_database(const std::string& database) override;

private:
    class Lease;
    class LeaseSession;

    /**
     * @brief Lease a connection synced to the current database
     */
    Result<std::unique_ptr<Lease>> acquire();

    /**
     * @brief Return a connection and its slot; a non-reusable one is closed
     */
    void release(std::unique_ptr<RedisConnection> conn, bool reusable);

    /**
     * @brief SELECT on a leased connection and publish it driver-wide
     */
    Status select_on(RedisConnection& conn, int64_t index);

    Status switch_on(RedisConnection& conn, const std::string& database);

    RedisEndpoint endpoint_;
    RedisOptions options_;

    std::deque<std::unique_ptr<RedisConnection>> idle_;
    std::mutex mutex_;
    std::counting_semaphore<> slots_;
    std::atomic<int64_t> current_db_;
};

} // namespace polydb
