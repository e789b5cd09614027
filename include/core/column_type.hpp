#pragma once

#include <cstdint>
#include <string>

namespace polydb {

/**
 * @brief Database-agnostic column type classification
 *
 * Each backend's type map lowers vendor types (PG OIDs, MySQL field types,
 * SQLite declared affinities) into this set. The value coercion engine
 * picks its typed read from it.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,

    // Arbitrary precision (lowered to string to keep every digit)
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    // Boolean
    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,

    // Binary
    BLOB,

    // JSON
    JSON,

    // UUID
    UUID,

    // Vendor-specific fallback (read as plain string)
    VENDOR_SPECIFIC,
};

/**
 * @brief Column type carrying both the generic class and the backend tag
 *
 * vendor_type_name is the backend-declared tag reported to callers,
 * e.g. "INT4", "BIGINT", "INTEGER".
 */
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    uint32_t vendor_type_id = 0;       // PG OID, MySQL field type enum, SQLite storage class
    std::string vendor_type_name;

    ColumnTypeInfo() = default;
    ColumnTypeInfo(GenericColumnType gt, uint32_t vid, std::string vname)
        : generic_type(gt), vendor_type_id(vid), vendor_type_name(std::move(vname)) {}
};

[[nodiscard]] inline const char* generic_column_type_to_string(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::UNKNOWN: return "UNKNOWN";
        case GenericColumnType::SMALLINT: return "SMALLINT";
        case GenericColumnType::INTEGER: return "INTEGER";
        case GenericColumnType::BIGINT: return "BIGINT";
        case GenericColumnType::REAL: return "REAL";
        case GenericColumnType::DOUBLE_PRECISION: return "DOUBLE_PRECISION";
        case GenericColumnType::NUMERIC: return "NUMERIC";
        case GenericColumnType::TEXT: return "TEXT";
        case GenericColumnType::VARCHAR: return "VARCHAR";
        case GenericColumnType::CHAR: return "CHAR";
        case GenericColumnType::BOOLEAN: return "BOOLEAN";
        case GenericColumnType::DATE: return "DATE";
        case GenericColumnType::TIME: return "TIME";
        case GenericColumnType::TIMESTAMP: return "TIMESTAMP";
        case GenericColumnType::TIMESTAMP_TZ: return "TIMESTAMP_TZ";
        case GenericColumnType::BLOB: return "BLOB";
        case GenericColumnType::JSON: return "JSON";
        case GenericColumnType::UUID: return "UUID";
        case GenericColumnType::VENDOR_SPECIFIC: return "VENDOR_SPECIFIC";
    }
    return "UNKNOWN";
}

} // namespace polydb
