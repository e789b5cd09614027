#pragma once

#include "db/idb_driver.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace polydb {

/**
 * @brief Shared machinery of the SQL backends
 *
 * Owns the connection pool and implements statement execution once:
 * write-only classification, result shaping and per-cell coercion.
 * Subclasses only supply their catalog queries.
 *
 * Every call leases its own pooled connection, so concurrent calls on
 * one driver never share a session.
 */
class RelationalDriver : public IDbDriver {
public:
    using SqlBuilder = std::function<std::string(IDbConnection&)>;

    RelationalDriver(std::shared_ptr<IConnectionPool> pool,
                     std::chrono::milliseconds acquire_timeout);

    ~RelationalDriver() override;

    Result<QueryResult> execute_query(
        const std::string& statement, const std::optional<std::string>& database) override;

    Status select_database(const std::string& database) override;

protected:
    /**
     * @brief Run one catalog statement on a leased connection
     * @param action Failure prefix, e.g. "list tables" -> "Failed to list tables: ..."
     * @param build_sql Builds the SQL on the lease so literals can be
     *                  escaped by the live handle
     */
    [[nodiscard]] Result<DbResultSet> run(std::string_view action, const SqlBuilder& build_sql);

    /**
     * @brief Run a catalog statement and collect its first column
     */
    [[nodiscard]] Result<NameList> run_names(std::string_view action, const SqlBuilder& build_sql);

    /**
     * @brief Unsupported-operation error naming this backend
     */
    [[nodiscard]] std::string unsupported(std::string_view what) const;

private:
    std::shared_ptr<IConnectionPool> pool_;
    std::chrono::milliseconds acquire_timeout_;
};

// Column helpers for catalog result sets
[[nodiscard]] std::string cell_text(const std::vector<RawCell>& row, size_t index);
[[nodiscard]] std::optional<std::string> cell_optional(const std::vector<RawCell>& row, size_t index);
[[nodiscard]] bool cell_flag(const std::vector<RawCell>& row, size_t index);

} // namespace polydb
