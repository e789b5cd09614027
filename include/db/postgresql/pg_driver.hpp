#pragma once

#include "db/relational_driver.hpp"

namespace polydb {

/**
 * @brief PostgreSQL driver: catalog introspection over information_schema
 * and pg_catalog
 *
 * A PostgreSQL connection is bound to one database, so the database
 * argument of the introspection calls is informational; the registry
 * reconnects to switch databases.
 */
class PgDriver : public RelationalDriver {
public:
    using RelationalDriver::RelationalDriver;

    DatabaseType type() const override { return DatabaseType::POSTGRESQL; }

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
};

} // namespace polydb
