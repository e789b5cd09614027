#include "db/mysql/mysql_driver.hpp"
#include "db/schema_constants.hpp"
#include "core/utils.hpp"
#include <array>
#include <format>

namespace polydb {

namespace {

constexpr std::array<std::string_view, 4> kSystemDatabases = {
    "information_schema", "mysql", "performance_schema", "sys",
};

bool is_system_database(std::string_view name) {
    for (const auto sys : kSystemDatabases) {
        if (name == sys) {
            return true;
        }
    }
    return false;
}

} // namespace

Result<NameList> MysqlDriver::list_databases() {
    auto names = run_names("list databases", [](IDbConnection&) {
        return std::string("SHOW DATABASES");
    });
    if (names.is_error()) {
        return names;
    }

    NameList user_databases;
    for (auto& name : names.value()) {
        if (!is_system_database(name)) {
            user_databases.push_back(std::move(name));
        }
    }
    return Result<NameList>::ok(std::move(user_databases));
}

Result<NameList> MysqlDriver::list_schemas(const std::string& database) {
    // Schema and database are synonyms in MySQL
    return Result<NameList>::ok(NameList{database});
}

Result<NameList> MysqlDriver::list_tables(const std::string& database, const std::string& /*schema*/) {
    return run_names("list tables", [&](IDbConnection& conn) {
        return std::format(
            "SELECT table_name FROM information_schema.tables "
            "WHERE table_schema = {} AND table_type = 'BASE TABLE' "
            "ORDER BY table_name",
            conn.quote_literal(database));
    });
}

Result<NameList> MysqlDriver::list_views(const std::string& database, const std::string& /*schema*/) {
    return run_names("list views", [&](IDbConnection& conn) {
        return std::format(
            "SELECT table_name FROM information_schema.views "
            "WHERE table_schema = {} "
            "ORDER BY table_name",
            conn.quote_literal(database));
    });
}

Result<NameList> MysqlDriver::list_functions(const std::string& database, const std::string& /*schema*/) {
    return run_names("list functions", [&](IDbConnection& conn) {
        return std::format(
            "SELECT routine_name FROM information_schema.routines "
            "WHERE routine_schema = {} AND routine_type = 'FUNCTION' "
            "ORDER BY routine_name",
            conn.quote_literal(database));
    });
}

Result<FunctionInfo> MysqlDriver::get_function_definition(
    const std::string& database, const std::string& /*schema*/,
    const std::string& function_name) {

    auto info = run("get function info", [&](IDbConnection& conn) {
        return std::format(
            "SELECT routine_name, data_type, external_language "
            "FROM information_schema.routines "
            "WHERE routine_schema = {} AND routine_name = {} AND routine_type = 'FUNCTION' "
            "LIMIT 1",
            conn.quote_literal(database), conn.quote_literal(function_name));
    });
    if (info.is_error()) {
        return Result<FunctionInfo>::propagate(info);
    }
    if (info.value().rows.empty()) {
        return Result<FunctionInfo>::error(ErrorCode::QUERY_EXECUTION_ERROR,
            std::format("Failed to get function info: function '{}.{}' not found",
                        database, function_name));
    }

    auto create = run("get function definition", [&](IDbConnection&) {
        return std::format("SHOW CREATE FUNCTION {}.{}",
            quote_identifier(database), quote_identifier(function_name));
    });
    if (create.is_error()) {
        return Result<FunctionInfo>::propagate(create);
    }

    const auto& info_row = info.value().rows.front();
    FunctionInfo fn;
    fn.name = cell_text(info_row, 0);
    fn.return_type = cell_optional(info_row, 1);
    fn.language = cell_optional(info_row, 2);

    // Columns: Function, sql_mode, Create Function, ...
    if (!create.value().rows.empty()) {
        fn.definition = cell_text(create.value().rows.front(), 2);
    }
    return Result<FunctionInfo>::ok(std::move(fn));
}

Result<std::vector<ColumnInfo>> MysqlDriver::list_columns(
    const std::string& database, const std::string& /*schema*/, const std::string& table) {

    auto rs = run("list columns", [&](IDbConnection& conn) {
        return std::format(
            "SELECT column_name, data_type, is_nullable, column_default, column_key "
            "FROM information_schema.columns "
            "WHERE table_schema = {} AND table_name = {} "
            "ORDER BY ordinal_position",
            conn.quote_literal(database), conn.quote_literal(table));
    });
    if (rs.is_error()) {
        return Result<std::vector<ColumnInfo>>::propagate(rs);
    }

    std::vector<ColumnInfo> columns;
    columns.reserve(rs.value().rows.size());
    for (const auto& row : rs.value().rows) {
        ColumnInfo col;
        col.name = cell_text(row, 0);
        col.data_type = cell_text(row, 1);
        col.is_nullable = cell_text(row, 2) == db::kYes;
        col.column_default = cell_optional(row, 3);
        col.is_primary_key = cell_text(row, 4) == db::kPri;
        columns.push_back(std::move(col));
    }
    return Result<std::vector<ColumnInfo>>::ok(std::move(columns));
}

Result<std::vector<IndexInfo>> MysqlDriver::list_indexes(
    const std::string& database, const std::string& /*schema*/, const std::string& table) {

    auto rs = run("list indexes", [&](IDbConnection& conn) {
        return std::format(
            "SELECT index_name, "
            "GROUP_CONCAT(column_name ORDER BY seq_in_index), "
            "NOT non_unique, "
            "index_name = 'PRIMARY' "
            "FROM information_schema.statistics "
            "WHERE table_schema = {} AND table_name = {} "
            "GROUP BY index_name, non_unique "
            "ORDER BY index_name",
            conn.quote_literal(database), conn.quote_literal(table));
    });
    if (rs.is_error()) {
        return Result<std::vector<IndexInfo>>::propagate(rs);
    }

    std::vector<IndexInfo> indexes;
    indexes.reserve(rs.value().rows.size());
    for (const auto& row : rs.value().rows) {
        IndexInfo idx;
        idx.name = cell_text(row, 0);
        idx.columns = split_list(cell_optional(row, 1));
        idx.is_unique = cell_flag(row, 2);
        idx.is_primary = cell_flag(row, 3);
        indexes.push_back(std::move(idx));
    }
    return Result<std::vector<IndexInfo>>::ok(std::move(indexes));
}

Result<std::vector<ConstraintInfo>> MysqlDriver::list_constraints(
    const std::string& database, const std::string& /*schema*/, const std::string& table) {

    auto rs = run("list constraints", [&](IDbConnection& conn) {
        return std::format(
            "SELECT tc.constraint_name, tc.constraint_type, "
            "GROUP_CONCAT(DISTINCT kcu.column_name), "
            "kcu.referenced_table_name, "
            "GROUP_CONCAT(DISTINCT kcu.referenced_column_name) "
            "FROM information_schema.table_constraints tc "
            "JOIN information_schema.key_column_usage kcu "
            "  ON tc.constraint_name = kcu.constraint_name "
            "  AND tc.table_schema = kcu.table_schema "
            "  AND tc.table_name = kcu.table_name "
            "WHERE tc.table_schema = {} AND tc.table_name = {} "
            "GROUP BY tc.constraint_name, tc.constraint_type, kcu.referenced_table_name "
            "ORDER BY tc.constraint_name",
            conn.quote_literal(database), conn.quote_literal(table));
    });
    if (rs.is_error()) {
        return Result<std::vector<ConstraintInfo>>::propagate(rs);
    }

    std::vector<ConstraintInfo> constraints;
    constraints.reserve(rs.value().rows.size());
    for (const auto& row : rs.value().rows) {
        ConstraintInfo c;
        c.name = cell_text(row, 0);
        c.constraint_type = cell_text(row, 1);
        c.columns = split_list(cell_optional(row, 2));
        c.foreign_table = cell_optional(row, 3);
        if (const auto fk_cols = cell_optional(row, 4)) {
            c.foreign_columns = split_list(fk_cols);
        }
        constraints.push_back(std::move(c));
    }
    return Result<std::vector<ConstraintInfo>>::ok(std::move(constraints));
}

std::string MysqlDriver::quote_identifier(std::string_view name) {
    std::string out = "`";
    for (const char c : name) {
        if (c == '`') {
            out += '`';
        }
        out += c;
    }
    out += '`';
    return out;
}

std::vector<std::string> MysqlDriver::split_list(const std::optional<std::string>& csv) {
    if (!csv || csv->empty()) {
        return {};
    }
    return utils::split(*csv, ',');
}

} // namespace polydb
