#pragma once

#include "db/relational_driver.hpp"

namespace polydb {

/**
 * @brief MySQL driver: introspection over information_schema
 *
 * MySQL has no schema level below the database, so list_schemas returns
 * the database itself and the catalog queries filter by database.
 */
class MysqlDriver : public RelationalDriver {
public:
    using RelationalDriver::RelationalDriver;

    DatabaseType type() const override { return DatabaseType::MYSQL; }

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

    /** @brief Backtick-quote an identifier */
    [[nodiscard]] static std::string quote_identifier(std::string_view name);

    /** @brief Split a GROUP_CONCAT value; NULL or empty yields no elements */
    [[nodiscard]] static std::vector<std::string> split_list(const std::optional<std::string>& csv);
};

} // namespace polydb
