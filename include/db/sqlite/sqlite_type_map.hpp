#pragma once

#include "core/column_type.hpp"
#include <optional>
#include <string_view>

namespace polydb {

/**
 * @brief SQLite column type mapping
 *
 * SQLite columns have a declared type (possibly absent) and each value
 * carries its own storage class. The declared type is reduced with the
 * column affinity rules (INT, CHAR/CLOB/TEXT, BLOB, REAL/FLOA/DOUB,
 * otherwise NUMERIC), after the BOOLEAN and date/time names SQLite
 * tooling conventionally recognises. Expression columns have no declared
 * type and are typed by the storage class of their first value.
 */
class SqliteTypeMap {
public:
    /**
     * @brief Type of a column from its declared type
     * @return nullopt when the column has no declared type
     */
    [[nodiscard]] static std::optional<ColumnTypeInfo> from_declared(std::string_view decltype_name);

    /**
     * @brief Type from a value's storage class (SQLITE_INTEGER, SQLITE_FLOAT, ...)
     */
    [[nodiscard]] static ColumnTypeInfo from_storage_class(int storage_class);
};

} // namespace polydb
