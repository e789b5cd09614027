#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/driver_factory.hpp"
#include "db/idb_driver.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace polydb {

/**
 * @brief Owns the live connections, keyed by caller-chosen connection id
 *
 * Thread-safety: lookups take a shared lock, connect/disconnect take an
 * exclusive lock only to mutate the map. Handshakes and driver teardown
 * run outside the lock. Every operation works on a shared_ptr snapshot
 * of the driver, so a concurrent disconnect never pulls a driver out
 * from under a running call.
 *
 * Relational switch_database is disconnect + connect. Between the two
 * the id is absent and concurrent callers get CONNECTION_NOT_FOUND; a
 * failed reconnect leaves it absent.
 */
class ConnectionRegistry {
public:
    using DriverFactory = std::function<Result<std::shared_ptr<IDbDriver>>(const ConnectionDescriptor&)>;

    explicit ConnectionRegistry(DriverOptions options = {});

    /** @brief Registry with an injected driver factory (tests) */
    explicit ConnectionRegistry(DriverFactory factory);

    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * @brief Open a driver for the descriptor and register it under descriptor.id
     *
     * Replaces any existing entry for the id. On failure nothing is
     * registered and an existing entry is left untouched.
     */
    [[nodiscard]] Result<std::string> connect(const ConnectionDescriptor& descriptor);

    /**
     * @brief Remove and close a connection
     * @return CONNECTION_NOT_FOUND when nothing was registered under the id
     */
    Status disconnect(const std::string& connection_id);

    /**
     * @brief Point a connection at another database
     *
     * Redis selects in place. Relational backends reconnect with
     * descriptor.database replaced.
     * @return INVALID_ARGUMENT when descriptor.type differs from the
     *         backend registered under descriptor.id
     */
    [[nodiscard]] Status switch_database(const ConnectionDescriptor& descriptor, const std::string& database);

    [[nodiscard]] Result<std::shared_ptr<IDbDriver>> lookup(const std::string& connection_id) const;

    [[nodiscard]] Result<NameList> list_databases(const std::string& connection_id);

    [[nodiscard]] Result<NameList> list_schemas(const std::string& connection_id,
                                                const std::string& database);

    [[nodiscard]] Result<NameList> list_tables(const std::string& connection_id,
                                               const std::string& database,
                                               const std::string& schema);

    [[nodiscard]] Result<NameList> list_views(const std::string& connection_id,
                                              const std::string& database,
                                              const std::string& schema);

    [[nodiscard]] Result<NameList> list_functions(const std::string& connection_id,
                                                  const std::string& database,
                                                  const std::string& schema);

    [[nodiscard]] Result<FunctionInfo> get_function_definition(const std::string& connection_id,
                                                               const std::string& database,
                                                               const std::string& schema,
                                                               const std::string& function_name);

    [[nodiscard]] Result<std::vector<ColumnInfo>> list_columns(const std::string& connection_id,
                                                               const std::string& database,
                                                               const std::string& schema,
                                                               const std::string& table);

    [[nodiscard]] Result<std::vector<IndexInfo>> list_indexes(const std::string& connection_id,
                                                              const std::string& database,
                                                              const std::string& schema,
                                                              const std::string& table);

    [[nodiscard]] Result<std::vector<ConstraintInfo>> list_constraints(const std::string& connection_id,
                                                                       const std::string& database,
                                                                       const std::string& schema,
                                                                       const std::string& table);

    /**
     * @param database Logical database to select first (Redis only)
     */
    [[nodiscard]] Result<QueryResult> execute_query(const std::string& connection_id,
                                                    const std::string& statement,
                                                    const std::optional<std::string>& database = std::nullopt);

    [[nodiscard]] std::vector<std::string> connection_ids() const;

    [[nodiscard]] size_t size() const;

private:
    template<typename T, typename Fn>
    Result<T> with_driver(const std::string& connection_id, Fn&& fn);

    DriverFactory factory_;
    std::unordered_map<std::string, std::shared_ptr<IDbDriver>> drivers_;
    mutable std::shared_mutex mutex_;
};

} // namespace polydb
