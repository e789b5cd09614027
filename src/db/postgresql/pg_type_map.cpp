#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>

namespace polydb {

namespace {

struct PgType {
    std::string_view tag;
    GenericColumnType generic;
};

const std::unordered_map<uint32_t, PgType>& builtin_types() {
    static const std::unordered_map<uint32_t, PgType> TYPES = {
        {16,   {"BOOL", GenericColumnType::BOOLEAN}},
        {17,   {"BYTEA", GenericColumnType::BLOB}},
        {18,   {"CHAR", GenericColumnType::CHAR}},
        {19,   {"NAME", GenericColumnType::VARCHAR}},
        {20,   {"INT8", GenericColumnType::BIGINT}},
        {21,   {"INT2", GenericColumnType::SMALLINT}},
        {23,   {"INT4", GenericColumnType::INTEGER}},
        {25,   {"TEXT", GenericColumnType::TEXT}},
        {26,   {"OID", GenericColumnType::BIGINT}},
        {114,  {"JSON", GenericColumnType::JSON}},
        {142,  {"XML", GenericColumnType::VENDOR_SPECIFIC}},
        {650,  {"CIDR", GenericColumnType::VENDOR_SPECIFIC}},
        {700,  {"FLOAT4", GenericColumnType::REAL}},
        {701,  {"FLOAT8", GenericColumnType::DOUBLE_PRECISION}},
        {790,  {"MONEY", GenericColumnType::VENDOR_SPECIFIC}},
        {829,  {"MACADDR", GenericColumnType::VENDOR_SPECIFIC}},
        {869,  {"INET", GenericColumnType::VENDOR_SPECIFIC}},
        {1042, {"BPCHAR", GenericColumnType::CHAR}},
        {1043, {"VARCHAR", GenericColumnType::VARCHAR}},
        {1082, {"DATE", GenericColumnType::DATE}},
        {1083, {"TIME", GenericColumnType::TIME}},
        {1114, {"TIMESTAMP", GenericColumnType::TIMESTAMP}},
        {1184, {"TIMESTAMPTZ", GenericColumnType::TIMESTAMP_TZ}},
        {1186, {"INTERVAL", GenericColumnType::VENDOR_SPECIFIC}},
        {1266, {"TIMETZ", GenericColumnType::VENDOR_SPECIFIC}},
        {1700, {"NUMERIC", GenericColumnType::NUMERIC}},
        {2950, {"UUID", GenericColumnType::UUID}},
        {3802, {"JSONB", GenericColumnType::JSON}},
        {1009, {"TEXT[]", GenericColumnType::VENDOR_SPECIFIC}},
        {1007, {"INT4[]", GenericColumnType::VENDOR_SPECIFIC}},
        {1016, {"INT8[]", GenericColumnType::VENDOR_SPECIFIC}},
    };
    return TYPES;
}

} // namespace

std::string_view PgTypeMap::oid_to_tag(uint32_t oid) {
    const auto& types = builtin_types();
    const auto it = types.find(oid);
    return it != types.end() ? it->second.tag : std::string_view("UNKNOWN");
}

GenericColumnType PgTypeMap::oid_to_generic_type(uint32_t oid) {
    const auto& types = builtin_types();
    const auto it = types.find(oid);
    return it != types.end() ? it->second.generic : GenericColumnType::UNKNOWN;
}

ColumnTypeInfo PgTypeMap::from_oid(uint32_t oid) {
    return ColumnTypeInfo(oid_to_generic_type(oid), oid, std::string(oid_to_tag(oid)));
}

std::vector<std::string> PgTypeMap::parse_text_array(std::string_view literal) {
    std::vector<std::string> elements;
    if (literal.size() < 2 || literal.front() != '{' || literal.back() != '}') {
        return elements;
    }

    const std::string_view body = literal.substr(1, literal.size() - 2);
    if (body.empty()) {
        return elements;
    }

    std::string current;
    bool quoted = false;       // current element was written in quotes
    bool in_quotes = false;

    auto finish = [&]() {
        // An unquoted NULL is SQL NULL; "NULL" in quotes is the string
        if (quoted || current != "NULL") {
            elements.push_back(current);
        }
        current.clear();
        quoted = false;
    };

    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (in_quotes) {
            if (c == '\\' && i + 1 < body.size()) {
                current += body[++i];
            } else if (c == '"') {
                in_quotes = false;
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
            quoted = true;
        } else if (c == ',') {
            finish();
        } else {
            current += c;
        }
    }

    if (in_quotes) {
        return {};
    }
    finish();
    return elements;
}

} // namespace polydb
