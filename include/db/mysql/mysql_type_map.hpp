#pragma once

#include "core/column_type.hpp"
#include <mysql/mysql.h>
#include <cstdint>
#include <string>

namespace polydb {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps MySQL result field metadata to a type tag ("INT", "BIGINT UNSIGNED",
 * "DATETIME", ...) and GenericColumnType. Width and signedness matter:
 * TINYINT(1) is BOOLEAN, and unsigned columns widen so every value fits.
 */
class MysqlTypeMap {
public:
    /**
     * @brief Map MySQL field type to GenericColumnType
     * @param field_type MySQL enum_field_types value
     * @param is_unsigned UNSIGNED_FLAG set on the field
     * @param is_binary Field uses the binary character set
     * @param length Declared display width
     */
    [[nodiscard]] static GenericColumnType field_type_to_generic(
        enum_field_types field_type, bool is_unsigned, bool is_binary, unsigned long length);

    /**
     * @brief Upper-case type tag for a field
     */
    [[nodiscard]] static std::string field_type_to_tag(
        enum_field_types field_type, bool is_unsigned, bool is_binary, unsigned long length);

    /**
     * @brief Build a full ColumnTypeInfo from result field metadata
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(const MYSQL_FIELD& field);
};

} // namespace polydb
