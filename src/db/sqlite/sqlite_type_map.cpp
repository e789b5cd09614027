#include "db/sqlite/sqlite_type_map.hpp"
#include "core/utils.hpp"
#include <sqlite3.h>
#include <string>

namespace polydb {

namespace {

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

std::optional<ColumnTypeInfo> SqliteTypeMap::from_declared(std::string_view decltype_name) {
    const std::string decl = utils::to_upper(utils::trim(decltype_name));
    if (decl.empty()) {
        return std::nullopt;
    }

    if (contains(decl, "BOOL")) {
        return ColumnTypeInfo(GenericColumnType::BOOLEAN, SQLITE_INTEGER, "BOOLEAN");
    }
    if (decl == "DATETIME" || decl == "TIMESTAMP") {
        return ColumnTypeInfo(GenericColumnType::TEXT, SQLITE_TEXT, "DATETIME");
    }
    if (decl == "DATE") {
        return ColumnTypeInfo(GenericColumnType::TEXT, SQLITE_TEXT, "DATE");
    }
    if (decl == "TIME") {
        return ColumnTypeInfo(GenericColumnType::TEXT, SQLITE_TEXT, "TIME");
    }

    // Affinity rules, in SQLite's own precedence order
    if (contains(decl, "INT")) {
        return ColumnTypeInfo(GenericColumnType::BIGINT, SQLITE_INTEGER, "INTEGER");
    }
    if (contains(decl, "CHAR") || contains(decl, "CLOB") || contains(decl, "TEXT")) {
        return ColumnTypeInfo(GenericColumnType::TEXT, SQLITE_TEXT, "TEXT");
    }
    if (contains(decl, "BLOB")) {
        return ColumnTypeInfo(GenericColumnType::BLOB, SQLITE_BLOB, "BLOB");
    }
    if (contains(decl, "REAL") || contains(decl, "FLOA") || contains(decl, "DOUB")) {
        return ColumnTypeInfo(GenericColumnType::DOUBLE_PRECISION, SQLITE_FLOAT, "REAL");
    }
    return ColumnTypeInfo(GenericColumnType::NUMERIC, 0, "NUMERIC");
}

ColumnTypeInfo SqliteTypeMap::from_storage_class(int storage_class) {
    switch (storage_class) {
        case SQLITE_INTEGER:
            return {GenericColumnType::BIGINT, SQLITE_INTEGER, "INTEGER"};
        case SQLITE_FLOAT:
            return {GenericColumnType::DOUBLE_PRECISION, SQLITE_FLOAT, "REAL"};
        case SQLITE_TEXT:
            return {GenericColumnType::TEXT, SQLITE_TEXT, "TEXT"};
        case SQLITE_BLOB:
            return {GenericColumnType::BLOB, SQLITE_BLOB, "BLOB"};
        default:
            return {GenericColumnType::UNKNOWN, SQLITE_NULL, "NULL"};
    }
}

} // namespace polydb
