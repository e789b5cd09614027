#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace polydb {

/**
 * @brief Lowers one backend cell into a portable Value
 *
 * The typed read is chosen from the column's GenericColumnType. A cell
 * that fails its typed read becomes null; coercion never fails the row
 * or the query. Columns without a typed read fall back to a plain
 * string read, which itself yields null for bytes that are not UTF-8.
 *
 * Temporal output:
 *   TIMESTAMP    "YYYY-MM-DD HH:MM:SS[.fff]"
 *   TIMESTAMP_TZ "YYYY-MM-DDTHH:MM:SS[.fff]+00:00" (converted to UTC)
 *   DATE         "YYYY-MM-DD"
 *   TIME         "HH:MM:SS[.fff]"
 * Fractions print as 3, 6 or 9 digits, whichever holds the value exactly.
 */
class ValueCoercion {
public:
    [[nodiscard]] static Value coerce(const RawCell& cell, const ColumnTypeInfo& type);

    [[nodiscard]] static std::optional<bool> parse_bool(std::string_view text);
    [[nodiscard]] static std::optional<double> parse_double(std::string_view text);

    [[nodiscard]] static std::optional<std::string> normalize_date(std::string_view text);
    [[nodiscard]] static std::optional<std::string> normalize_time(std::string_view text);
    [[nodiscard]] static std::optional<std::string> normalize_timestamp(std::string_view text);
    [[nodiscard]] static std::optional<std::string> normalize_timestamp_tz(std::string_view text);
    [[nodiscard]] static std::optional<std::string> normalize_uuid(std::string_view text);

    [[nodiscard]] static bool is_valid_utf8(std::string_view text);
};

} // namespace polydb
