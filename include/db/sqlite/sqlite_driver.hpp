#pragma once

#include "db/relational_driver.hpp"

namespace polydb {

/**
 * @brief SQLite driver: introspection over sqlite_master and PRAGMAs
 *
 * A SQLite file is a single database with a single schema, both reported
 * as "main". Stored functions do not exist: list_functions is empty and
 * get_function_definition is unsupported.
 */
class SqliteDriver : public RelationalDriver {
public:
    using RelationalDriver::RelationalDriver;

    DatabaseType type() const override { return DatabaseType::SQLITE; }

    Result<NameList> list_databases() override;
    Result<NameList> list_schemas(const std::string& database) override;
    Result<NameList> list_tables(const std::string& database, const std::string& schema) override;
    Result<NameList> list_views(const std::string& database, const std::string& schema) override;
    Result<NameList> list_functions(const std::string& database, const std::string& schema) override;

    Result<FunctionInfo> get_function_definition(
        const std::string& database, const std::string& schema,
        const std::string& function_name) override;

    /** @brief PRAGMA table_info, in cid order */
    Result<std::vector<ColumnInfo>> list_columns(
        const std::string& database, const std::string& schema, const std::string& table) override;

    /** @brief PRAGMA index_list + index_info, sorted by index name */
    Result<std::vector<IndexInfo>> list_indexes(
        const std::string& database, const std::string& schema, const std::string& table) override;

    /**
     * @brief Foreign keys grouped by PRAGMA id ("fk_<table>_<id>") plus a
     *        synthesized "<table>_pkey" primary key, sorted by name
     */
    Result<std::vector<ConstraintInfo>> list_constraints(
        const std::string& database, const std::string& schema, const std::string& table) override;

    /** @brief Double-quote an identifier */
    [[nodiscard]] static std::string quote_identifier(std::string_view name);
};

} // namespace polydb
