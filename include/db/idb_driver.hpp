#pragma once

#include "core/database_type.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace polydb {

using NameList = std::vector<std::string>;

/**
 * @brief One live backend connection: introspection plus query execution
 *
 * Implementations own their pooled handles and are safe to call from
 * many threads at once; the registry hands the same driver to every
 * concurrent caller of a connection id.
 *
 * Hierarchy arguments (database, schema, table) follow each backend's
 * mapping of the uniform database > schema > object tree. Backends
 * without a level ignore the corresponding argument.
 */
class IDbDriver {
public:
    virtual ~IDbDriver() = default;

    [[nodiscard]] virtual DatabaseType type() const = 0;

    [[nodiscard]] virtual Result<NameList> list_databases() = 0;

    [[nodiscard]] virtual Result<NameList> list_schemas(const std::string& database) = 0;

    [[nodiscard]] virtual Result<NameList> list_tables(
        const std::string& database, const std::string& schema) = 0;

    [[nodiscard]] virtual Result<NameList> list_views(
        const std::string& database, const std::string& schema) = 0;

    [[nodiscard]] virtual Result<NameList> list_functions(
        const std::string& database, const std::string& schema) = 0;

    [[nodiscard]] virtual Result<FunctionInfo> get_function_definition(
        const std::string& database, const std::string& schema,
        const std::string& function_name) = 0;

    /** @brief Columns in ordinal order */
    [[nodiscard]] virtual Result<std::vector<ColumnInfo>> list_columns(
        const std::string& database, const std::string& schema, const std::string& table) = 0;

    [[nodiscard]] virtual Result<std::vector<IndexInfo>> list_indexes(
        const std::string& database, const std::string& schema, const std::string& table) = 0;

    [[nodiscard]] virtual Result<std::vector<ConstraintInfo>> list_constraints(
        const std::string& database, const std::string& schema, const std::string& table) = 0;

    /**
     * @brief Execute one statement (SQL text or a Redis command line)
     * @param statement Statement text as typed by the user
     * @param database Logical database to select first (key-value backend only)
     */
    [[nodiscard]] virtual Result<QueryResult> execute_query(
        const std::string& statement, const std::optional<std::string>& database) = 0;

    /**
     * @brief Switch the selected database without reconnecting
     *
     * Only meaningful for backends whose handle can change database in
     * place. Others return UNSUPPORTED_OPERATION and are switched by the
     * registry through disconnect + reconnect.
     */
    [[nodiscard]] virtual Status select_database(const std::string& database) = 0;
};

} // namespace polydb
