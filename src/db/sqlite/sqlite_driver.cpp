#include "db/sqlite/sqlite_driver.hpp"
#include "db/schema_constants.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <map>

namespace polydb {

namespace {

// PRAGMA table_info columns
constexpr size_t kInfoName = 1;
constexpr size_t kInfoType = 2;
constexpr size_t kInfoNotNull = 3;
constexpr size_t kInfoDefault = 4;
constexpr size_t kInfoPk = 5;

// PRAGMA index_list columns
constexpr size_t kIndexName = 1;
constexpr size_t kIndexUnique = 2;
constexpr size_t kIndexOrigin = 3;

// PRAGMA index_info columns
constexpr size_t kIndexColumnName = 2;

// PRAGMA foreign_key_list columns
constexpr size_t kFkId = 0;
constexpr size_t kFkTable = 2;
constexpr size_t kFkFrom = 3;
constexpr size_t kFkTo = 4;

int64_t cell_int(const std::vector<RawCell>& row, size_t index) {
    return utils::parse_int<int64_t>(cell_text(row, index), 0);
}

template<typename T>
void sort_by_name(std::vector<T>& items) {
    std::sort(items.begin(), items.end(),
        [](const T& a, const T& b) { return a.name < b.name; });
}

} // namespace

Result<NameList> SqliteDriver::list_databases() {
    return Result<NameList>::ok(NameList{std::string(db::kMain)});
}

Result<NameList> SqliteDriver::list_schemas(const std::string& /*database*/) {
    return Result<NameList>::ok(NameList{std::string(db::kMain)});
}

Result<NameList> SqliteDriver::list_tables(const std::string& /*database*/, const std::string& /*schema*/) {
    return run_names("list tables", [](IDbConnection&) {
        return std::string(
            "SELECT name FROM sqlite_master "
            "WHERE type = 'table' AND name NOT LIKE 'sqlite_%' "
            "ORDER BY name");
    });
}

Result<NameList> SqliteDriver::list_views(const std::string& /*database*/, const std::string& /*schema*/) {
    return run_names("list views", [](IDbConnection&) {
        return std::string("SELECT name FROM sqlite_master WHERE type = 'view' ORDER BY name");
    });
}

Result<NameList> SqliteDriver::list_functions(const std::string& /*database*/, const std::string& /*schema*/) {
    return Result<NameList>::ok(NameList{});
}

Result<FunctionInfo> SqliteDriver::get_function_definition(
    const std::string& /*database*/, const std::string& /*schema*/,
    const std::string& /*function_name*/) {
    return Result<FunctionInfo>::error(ErrorCode::UNSUPPORTED_OPERATION,
        unsupported("Function definitions"));
}

Result<std::vector<ColumnInfo>> SqliteDriver::list_columns(
    const std::string& /*database*/, const std::string& /*schema*/, const std::string& table) {

    auto rs = run("list columns", [&](IDbConnection&) {
        return std::format("PRAGMA table_info({})", quote_identifier(table));
    });
    if (rs.is_error()) {
        return Result<std::vector<ColumnInfo>>::propagate(rs);
    }

    std::vector<ColumnInfo> columns;
    columns.reserve(rs.value().rows.size());
    for (const auto& row : rs.value().rows) {
        ColumnInfo col;
        col.name = cell_text(row, kInfoName);
        col.data_type = cell_text(row, kInfoType);
        col.is_nullable = cell_int(row, kInfoNotNull) == 0;
        col.column_default = cell_optional(row, kInfoDefault);
        col.is_primary_key = cell_int(row, kInfoPk) > 0;
        columns.push_back(std::move(col));
    }
    return Result<std::vector<ColumnInfo>>::ok(std::move(columns));
}

Result<std::vector<IndexInfo>> SqliteDriver::list_indexes(
    const std::string& /*database*/, const std::string& /*schema*/, const std::string& table) {

    auto list = run("list indexes", [&](IDbConnection&) {
        return std::format("PRAGMA index_list({})", quote_identifier(table));
    });
    if (list.is_error()) {
        return Result<std::vector<IndexInfo>>::propagate(list);
    }

    std::vector<IndexInfo> indexes;
    indexes.reserve(list.value().rows.size());
    for (const auto& row : list.value().rows) {
        IndexInfo idx;
        idx.name = cell_text(row, kIndexName);
        idx.is_unique = cell_int(row, kIndexUnique) == 1;
        idx.is_primary = cell_text(row, kIndexOrigin) == "pk";

        auto info = run("get index columns", [&](IDbConnection&) {
            return std::format("PRAGMA index_info({})", quote_identifier(idx.name));
        });
        if (info.is_error()) {
            return Result<std::vector<IndexInfo>>::propagate(info);
        }
        for (const auto& col_row : info.value().rows) {
            idx.columns.push_back(cell_text(col_row, kIndexColumnName));
        }
        indexes.push_back(std::move(idx));
    }

    sort_by_name(indexes);
    return Result<std::vector<IndexInfo>>::ok(std::move(indexes));
}

Result<std::vector<ConstraintInfo>> SqliteDriver::list_constraints(
    const std::string& /*database*/, const std::string& /*schema*/, const std::string& table) {

    auto fks = run("list foreign keys", [&](IDbConnection&) {
        return std::format("PRAGMA foreign_key_list({})", quote_identifier(table));
    });
    if (fks.is_error()) {
        return Result<std::vector<ConstraintInfo>>::propagate(fks);
    }

    // Multi-column foreign keys share an id; rows arrive in seq order
    std::map<int64_t, ConstraintInfo> by_id;
    for (const auto& row : fks.value().rows) {
        const int64_t id = cell_int(row, kFkId);
        auto [it, inserted] = by_id.try_emplace(id);
        ConstraintInfo& fk = it->second;
        if (inserted) {
            fk.name = std::format("fk_{}_{}", table, id);
            fk.constraint_type = std::string(db::kForeignKey);
            fk.foreign_table = cell_text(row, kFkTable);
            fk.foreign_columns = std::vector<std::string>{};
        }
        fk.columns.push_back(cell_text(row, kFkFrom));
        fk.foreign_columns->push_back(cell_text(row, kFkTo));
    }

    std::vector<ConstraintInfo> constraints;
    constraints.reserve(by_id.size() + 1);
    for (auto& [id, fk] : by_id) {
        constraints.push_back(std::move(fk));
    }

    auto info = run("get primary key", [&](IDbConnection&) {
        return std::format("PRAGMA table_info({})", quote_identifier(table));
    });
    if (info.is_error()) {
        return Result<std::vector<ConstraintInfo>>::propagate(info);
    }

    // pk holds the 1-based position within the key, 0 for other columns
    std::vector<std::pair<int64_t, std::string>> pk_columns;
    for (const auto& row : info.value().rows) {
        if (const int64_t position = cell_int(row, kInfoPk); position > 0) {
            pk_columns.emplace_back(position, cell_text(row, kInfoName));
        }
    }
    if (!pk_columns.empty()) {
        std::sort(pk_columns.begin(), pk_columns.end());
        ConstraintInfo pk;
        pk.name = std::format("{}_pkey", table);
        pk.constraint_type = std::string(db::kPrimaryKey);
        for (auto& [position, name] : pk_columns) {
            pk.columns.push_back(std::move(name));
        }
        constraints.push_back(std::move(pk));
    }

    sort_by_name(constraints);
    return Result<std::vector<ConstraintInfo>>::ok(std::move(constraints));
}

std::string SqliteDriver::quote_identifier(std::string_view name) {
    std::string out = "\"";
    for (const char c : name) {
        if (c == '"') {
            out += '"';
        }
        out += c;
    }
    out += '"';
    return out;
}

} // namespace polydb
