#include "db/mysql/mysql_type_map.hpp"

namespace polydb {

namespace {

// Character set number of the "binary" collation
constexpr unsigned int kBinaryCharset = 63;

} // namespace

GenericColumnType MysqlTypeMap::field_type_to_generic(
    enum_field_types field_type, bool is_unsigned, bool is_binary, unsigned long length) {

    switch (field_type) {
        case MYSQL_TYPE_TINY:
            if (length == 1 && !is_unsigned) {
                return GenericColumnType::BOOLEAN;
            }
            return GenericColumnType::SMALLINT;
        case MYSQL_TYPE_SHORT:
            return is_unsigned ? GenericColumnType::INTEGER : GenericColumnType::SMALLINT;
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
            return is_unsigned ? GenericColumnType::BIGINT : GenericColumnType::INTEGER;
        case MYSQL_TYPE_LONGLONG:
            // BIGINT UNSIGNED can exceed int64
            return is_unsigned ? GenericColumnType::NUMERIC : GenericColumnType::BIGINT;
        case MYSQL_TYPE_YEAR:
            return GenericColumnType::INTEGER;
        case MYSQL_TYPE_FLOAT:
            return GenericColumnType::REAL;
        case MYSQL_TYPE_DOUBLE:
            return GenericColumnType::DOUBLE_PRECISION;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return GenericColumnType::NUMERIC;
        case MYSQL_TYPE_STRING:
            return is_binary ? GenericColumnType::BLOB : GenericColumnType::CHAR;
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
            return is_binary ? GenericColumnType::BLOB : GenericColumnType::VARCHAR;
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
            return is_binary ? GenericColumnType::BLOB : GenericColumnType::TEXT;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
            return GenericColumnType::DATE;
        case MYSQL_TYPE_TIME:
        case MYSQL_TYPE_TIME2:
            // TIME is a duration (-838:59:59 .. 838:59:59), not a time of day
            return GenericColumnType::TEXT;
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_DATETIME2:
        case MYSQL_TYPE_TIMESTAMP:
        case MYSQL_TYPE_TIMESTAMP2:
            return GenericColumnType::TIMESTAMP;
        case MYSQL_TYPE_JSON:
            return GenericColumnType::JSON;
        case MYSQL_TYPE_ENUM:
        case MYSQL_TYPE_SET:
            return GenericColumnType::VARCHAR;
        case MYSQL_TYPE_BIT:
        case MYSQL_TYPE_GEOMETRY:
            return GenericColumnType::VENDOR_SPECIFIC;
        default:
            return GenericColumnType::UNKNOWN;
    }
}

std::string MysqlTypeMap::field_type_to_tag(
    enum_field_types field_type, bool is_unsigned, bool is_binary, unsigned long length) {

    std::string tag;
    bool numeric = false;
    switch (field_type) {
        case MYSQL_TYPE_TINY:
            if (length == 1 && !is_unsigned) {
                return "BOOLEAN";
            }
            tag = "TINYINT"; numeric = true; break;
        case MYSQL_TYPE_SHORT:      tag = "SMALLINT"; numeric = true; break;
        case MYSQL_TYPE_INT24:      tag = "MEDIUMINT"; numeric = true; break;
        case MYSQL_TYPE_LONG:       tag = "INT"; numeric = true; break;
        case MYSQL_TYPE_LONGLONG:   tag = "BIGINT"; numeric = true; break;
        case MYSQL_TYPE_FLOAT:      tag = "FLOAT"; numeric = true; break;
        case MYSQL_TYPE_DOUBLE:     tag = "DOUBLE"; numeric = true; break;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL: tag = "DECIMAL"; numeric = true; break;
        case MYSQL_TYPE_YEAR:       return "YEAR";
        case MYSQL_TYPE_STRING:     return is_binary ? "BINARY" : "CHAR";
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:    return is_binary ? "VARBINARY" : "VARCHAR";
        case MYSQL_TYPE_TINY_BLOB:  return is_binary ? "TINYBLOB" : "TINYTEXT";
        case MYSQL_TYPE_BLOB:       return is_binary ? "BLOB" : "TEXT";
        case MYSQL_TYPE_MEDIUM_BLOB: return is_binary ? "MEDIUMBLOB" : "MEDIUMTEXT";
        case MYSQL_TYPE_LONG_BLOB:  return is_binary ? "LONGBLOB" : "LONGTEXT";
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:    return "DATE";
        case MYSQL_TYPE_TIME:
        case MYSQL_TYPE_TIME2:      return "TIME";
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_DATETIME2:  return "DATETIME";
        case MYSQL_TYPE_TIMESTAMP:
        case MYSQL_TYPE_TIMESTAMP2: return "TIMESTAMP";
        case MYSQL_TYPE_JSON:       return "JSON";
        case MYSQL_TYPE_ENUM:       return "ENUM";
        case MYSQL_TYPE_SET:        return "SET";
        case MYSQL_TYPE_BIT:        return "BIT";
        case MYSQL_TYPE_GEOMETRY:   return "GEOMETRY";
        case MYSQL_TYPE_NULL:       return "NULL";
        default:                    return "UNKNOWN";
    }

    if (numeric && is_unsigned) {
        tag += " UNSIGNED";
    }
    return tag;
}

ColumnTypeInfo MysqlTypeMap::build_type_info(const MYSQL_FIELD& field) {
    const bool is_unsigned = (field.flags & UNSIGNED_FLAG) != 0;
    const bool is_binary = field.charsetnr == kBinaryCharset;

    ColumnTypeInfo info;
    info.vendor_type_id = static_cast<uint32_t>(field.type);
    info.vendor_type_name = field_type_to_tag(field.type, is_unsigned, is_binary, field.length);
    info.generic_type = field_type_to_generic(field.type, is_unsigned, is_binary, field.length);
    return info;
}

} // namespace polydb
