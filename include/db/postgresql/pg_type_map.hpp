#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace polydb {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps result column OIDs to their type tags ("INT4", "TIMESTAMPTZ", ...)
 * and GenericColumnType, and decodes text-format array literals.
 */
class PgTypeMap {
public:
    /**
     * @brief Map a PostgreSQL OID to its upper-case type tag
     * @return Tag, or "UNKNOWN" for OIDs outside the built-in set
     */
    [[nodiscard]] static std::string_view oid_to_tag(uint32_t oid);

    /**
     * @brief Map PostgreSQL OID to GenericColumnType
     */
    [[nodiscard]] static GenericColumnType oid_to_generic_type(uint32_t oid);

    /**
     * @brief Build a full ColumnTypeInfo from a result column OID
     */
    [[nodiscard]] static ColumnTypeInfo from_oid(uint32_t oid);

    /**
     * @brief Decode a one-dimensional text array literal, e.g. {a,"b c",NULL}
     *
     * NULL elements are dropped. Returns an empty list for malformed input.
     */
    [[nodiscard]] static std::vector<std::string> parse_text_array(std::string_view literal);
};

} // namespace polydb
