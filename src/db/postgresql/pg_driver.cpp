#include "db/postgresql/pg_driver.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "db/schema_constants.hpp"
#include <format>

namespace polydb {

Result<NameList> PgDriver::list_databases() {
    return run_names("list databases", [](IDbConnection&) {
        return std::string(
            "SELECT datname FROM pg_database "
            "WHERE datistemplate = false "
            "AND has_database_privilege(datname, 'CONNECT') "
            "ORDER BY datname");
    });
}

Result<NameList> PgDriver::list_schemas(const std::string& /*database*/) {
    return run_names("list schemas", [](IDbConnection&) {
        return std::string(
            "SELECT schema_name FROM information_schema.schemata "
            "WHERE schema_name NOT IN ('pg_catalog', 'information_schema', 'pg_toast') "
            "ORDER BY schema_name");
    });
}

Result<NameList> PgDriver::list_tables(const std::string& /*database*/, const std::string& schema) {
    return run_names("list tables", [&](IDbConnection& conn) {
        return std::format(
            "SELECT table_name FROM information_schema.tables "
            "WHERE table_schema = {} AND table_type = 'BASE TABLE' "
            "ORDER BY table_name",
            conn.quote_literal(schema));
    });
}

Result<NameList> PgDriver::list_views(const std::string& /*database*/, const std::string& schema) {
    return run_names("list views", [&](IDbConnection& conn) {
        return std::format(
            "SELECT table_name FROM information_schema.views "
            "WHERE table_schema = {} "
            "ORDER BY table_name",
            conn.quote_literal(schema));
    });
}

Result<NameList> PgDriver::list_functions(const std::string& /*database*/, const std::string& schema) {
    return run_names("list functions", [&](IDbConnection& conn) {
        return std::format(
            "SELECT routine_name FROM information_schema.routines "
            "WHERE routine_schema = {} AND routine_type = 'FUNCTION' "
            "ORDER BY routine_name",
            conn.quote_literal(schema));
    });
}

Result<FunctionInfo> PgDriver::get_function_definition(
    const std::string& /*database*/, const std::string& schema,
    const std::string& function_name) {

    auto rs = run("get function definition", [&](IDbConnection& conn) {
        return std::format(
            "SELECT p.proname, pg_get_functiondef(p.oid), "
            "pg_catalog.format_type(p.prorettype, NULL), l.lanname "
            "FROM pg_proc p "
            "JOIN pg_namespace n ON p.pronamespace = n.oid "
            "JOIN pg_language l ON p.prolang = l.oid "
            "WHERE n.nspname = {} AND p.proname = {} "
            "LIMIT 1",
            conn.quote_literal(schema), conn.quote_literal(function_name));
    });
    if (rs.is_error()) {
        return Result<FunctionInfo>::propagate(rs);
    }
    if (rs.value().rows.empty()) {
        return Result<FunctionInfo>::error(ErrorCode::QUERY_EXECUTION_ERROR,
            std::format("Failed to get function definition: function '{}.{}' not found",
                        schema, function_name));
    }

    const auto& row = rs.value().rows.front();
    FunctionInfo info;
    info.name = cell_text(row, 0);
    info.definition = cell_text(row, 1);
    info.return_type = cell_optional(row, 2);
    info.language = cell_optional(row, 3);
    return Result<FunctionInfo>::ok(std::move(info));
}

Result<std::vector<ColumnInfo>> PgDriver::list_columns(
    const std::string& /*database*/, const std::string& schema, const std::string& table) {

    auto rs = run("list columns", [&](IDbConnection& conn) {
        const std::string s = conn.quote_literal(schema);
        const std::string t = conn.quote_literal(table);
        return std::format(
            "SELECT c.column_name, c.data_type, c.is_nullable, c.column_default, "
            "CASE WHEN pk.column_name IS NOT NULL THEN true ELSE false END "
            "FROM information_schema.columns c "
            "LEFT JOIN ("
            "  SELECT kcu.column_name "
            "  FROM information_schema.table_constraints tc "
            "  JOIN information_schema.key_column_usage kcu "
            "    ON tc.constraint_name = kcu.constraint_name "
            "    AND tc.table_schema = kcu.table_schema "
            "  WHERE tc.constraint_type = 'PRIMARY KEY' "
            "    AND tc.table_schema = {0} AND tc.table_name = {1}"
            ") pk ON c.column_name = pk.column_name "
            "WHERE c.table_schema = {0} AND c.table_name = {1} "
            "ORDER BY c.ordinal_position",
            s, t);
    });
    if (rs.is_error()) {
        return Result<std::vector<ColumnInfo>>::propagate(rs);
    }

    static constexpr size_t COL_NAME     = 0;
    static constexpr size_t COL_TYPE     = 1;
    static constexpr size_t COL_NULLABLE = 2;
    static constexpr size_t COL_DEFAULT  = 3;
    static constexpr size_t COL_PK       = 4;

    std::vector<ColumnInfo> columns;
    columns.reserve(rs.value().rows.size());
    for (const auto& row : rs.value().rows) {
        ColumnInfo col;
        col.name = cell_text(row, COL_NAME);
        col.data_type = cell_text(row, COL_TYPE);
        col.is_nullable = cell_text(row, COL_NULLABLE) == db::kYes;
        col.column_default = cell_optional(row, COL_DEFAULT);
        col.is_primary_key = cell_flag(row, COL_PK);
        columns.push_back(std::move(col));
    }
    return Result<std::vector<ColumnInfo>>::ok(std::move(columns));
}

Result<std::vector<IndexInfo>> PgDriver::list_indexes(
    const std::string& /*database*/, const std::string& schema, const std::string& table) {

    auto rs = run("list indexes", [&](IDbConnection& conn) {
        return std::format(
            "SELECT i.relname, "
            "array_agg(a.attname::TEXT ORDER BY array_position(ix.indkey, a.attnum))::TEXT[], "
            "ix.indisunique, ix.indisprimary "
            "FROM pg_class t "
            "JOIN pg_index ix ON t.oid = ix.indrelid "
            "JOIN pg_class i ON i.oid = ix.indexrelid "
            "JOIN pg_namespace n ON n.oid = t.relnamespace "
            "JOIN pg_attribute a ON a.attrelid = t.oid AND a.attnum = ANY(ix.indkey) "
            "WHERE n.nspname = {} AND t.relname = {} "
            "GROUP BY i.relname, ix.indisunique, ix.indisprimary "
            "ORDER BY i.relname",
            conn.quote_literal(schema), conn.quote_literal(table));
    });
    if (rs.is_error()) {
        return Result<std::vector<IndexInfo>>::propagate(rs);
    }

    std::vector<IndexInfo> indexes;
    indexes.reserve(rs.value().rows.size());
    for (const auto& row : rs.value().rows) {
        IndexInfo idx;
        idx.name = cell_text(row, 0);
        idx.columns = PgTypeMap::parse_text_array(cell_text(row, 1));
        idx.is_unique = cell_flag(row, 2);
        idx.is_primary = cell_flag(row, 3);
        indexes.push_back(std::move(idx));
    }
    return Result<std::vector<IndexInfo>>::ok(std::move(indexes));
}

Result<std::vector<ConstraintInfo>> PgDriver::list_constraints(
    const std::string& /*database*/, const std::string& schema, const std::string& table) {

    auto rs = run("list constraints", [&](IDbConnection& conn) {
        return std::format(
            "SELECT tc.constraint_name, tc.constraint_type, "
            "array_agg(DISTINCT kcu.column_name::TEXT)::TEXT[], "
            "ccu.table_name, "
            "array_agg(DISTINCT ccu.column_name::TEXT) "
            "  FILTER (WHERE ccu.column_name IS NOT NULL AND tc.constraint_type = 'FOREIGN KEY')::TEXT[] "
            "FROM information_schema.table_constraints tc "
            "JOIN information_schema.key_column_usage kcu "
            "  ON tc.constraint_name = kcu.constraint_name "
            "  AND tc.table_schema = kcu.table_schema "
            "LEFT JOIN information_schema.constraint_column_usage ccu "
            "  ON tc.constraint_name = ccu.constraint_name "
            "  AND tc.table_schema = ccu.table_schema "
            "  AND tc.constraint_type = 'FOREIGN KEY' "
            "WHERE tc.table_schema = {} AND tc.table_name = {} "
            "GROUP BY tc.constraint_name, tc.constraint_type, ccu.table_name "
            "ORDER BY tc.constraint_name",
            conn.quote_literal(schema), conn.quote_literal(table));
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
        c.columns = PgTypeMap::parse_text_array(cell_text(row, 2));
        c.foreign_table = cell_optional(row, 3);
        if (const auto fk_cols = cell_optional(row, 4)) {
            c.foreign_columns = PgTypeMap::parse_text_array(*fk_cols);
        }
        constraints.push_back(std::move(c));
    }
    return Result<std::vector<ConstraintInfo>>::ok(std::move(constraints));
}

} // namespace polydb
