#include <catch2/catch_test_macros.hpp>
#include "db/value_coercion.hpp"

using namespace polydb;

namespace {

ColumnTypeInfo type_of(GenericColumnType generic) {
    return ColumnTypeInfo(generic, 0, generic_column_type_to_string(generic));
}

Value coerce(const char* text, GenericColumnType generic) {
    return ValueCoercion::coerce(RawCell(text), type_of(generic));
}

} // namespace

TEST_CASE("Coercion: SQL NULL is null for every type", "[coercion]") {
    for (const auto generic : {GenericColumnType::INTEGER, GenericColumnType::TEXT,
                               GenericColumnType::BOOLEAN, GenericColumnType::TIMESTAMP_TZ}) {
        CHECK(is_null(ValueCoercion::coerce(std::nullopt, type_of(generic))));
    }
}

TEST_CASE("Coercion: integer family widens to int64", "[coercion]") {
    CHECK(std::get<int64_t>(coerce("-32768", GenericColumnType::SMALLINT)) == -32768);
    CHECK(std::get<int64_t>(coerce("2147483647", GenericColumnType::INTEGER)) == 2147483647);
    CHECK(std::get<int64_t>(coerce("9223372036854775807", GenericColumnType::BIGINT))
          == INT64_MAX);

    SECTION("out of range or malformed reads become null") {
        CHECK(is_null(coerce("40000", GenericColumnType::SMALLINT)));
        CHECK(is_null(coerce("12abc", GenericColumnType::INTEGER)));
        CHECK(is_null(coerce("", GenericColumnType::BIGINT)));
    }
}

TEST_CASE("Coercion: floating point", "[coercion]") {
    CHECK(std::get<double>(coerce("1.5", GenericColumnType::DOUBLE_PRECISION)) == 1.5);
    CHECK(std::get<double>(coerce("-2e3", GenericColumnType::REAL)) == -2000.0);
    CHECK(is_null(coerce("NaN", GenericColumnType::DOUBLE_PRECISION)));
    CHECK(is_null(coerce("inf", GenericColumnType::DOUBLE_PRECISION)));
    CHECK(is_null(coerce("1.5x", GenericColumnType::REAL)));
}

TEST_CASE("Coercion: NUMERIC keeps every digit as text", "[coercion]") {
    const auto v = coerce("12345678901234567890.000000001", GenericColumnType::NUMERIC);
    CHECK(std::get<std::string>(v) == "12345678901234567890.000000001");
}

TEST_CASE("Coercion: booleans", "[coercion]") {
    CHECK(std::get<bool>(coerce("t", GenericColumnType::BOOLEAN)));
    CHECK(std::get<bool>(coerce("TRUE", GenericColumnType::BOOLEAN)));
    CHECK(std::get<bool>(coerce("1", GenericColumnType::BOOLEAN)));
    CHECK_FALSE(std::get<bool>(coerce("f", GenericColumnType::BOOLEAN)));
    CHECK_FALSE(std::get<bool>(coerce("0", GenericColumnType::BOOLEAN)));
    CHECK(is_null(coerce("yes", GenericColumnType::BOOLEAN)));
}

TEST_CASE("Coercion: date and time", "[coercion][temporal]") {
    CHECK(std::get<std::string>(coerce("2024-02-29", GenericColumnType::DATE)) == "2024-02-29");
    CHECK(is_null(coerce("2023-02-29", GenericColumnType::DATE)));
    CHECK(is_null(coerce("2024-1-5", GenericColumnType::DATE)));

    CHECK(std::get<std::string>(coerce("13:45:07", GenericColumnType::TIME)) == "13:45:07");
    CHECK(std::get<std::string>(coerce("13:45:07.5", GenericColumnType::TIME)) == "13:45:07.500");
    CHECK(std::get<std::string>(coerce("13:45:07.123456", GenericColumnType::TIME)) == "13:45:07.123456");
    CHECK(is_null(coerce("24:00:00", GenericColumnType::TIME)));
}

TEST_CASE("Coercion: timestamps without zone", "[coercion][temporal]") {
    CHECK(std::get<std::string>(coerce("2024-01-15 10:30:00", GenericColumnType::TIMESTAMP))
          == "2024-01-15 10:30:00");
    CHECK(std::get<std::string>(coerce("2024-01-15T10:30:00.250", GenericColumnType::TIMESTAMP))
          == "2024-01-15 10:30:00.250");
    CHECK(is_null(coerce("2024-01-15", GenericColumnType::TIMESTAMP)));
}

TEST_CASE("Coercion: zoned timestamps convert to UTC", "[coercion][temporal]") {
    CHECK(std::get<std::string>(coerce("2024-01-15 10:30:00+02", GenericColumnType::TIMESTAMP_TZ))
          == "2024-01-15T08:30:00+00:00");
    CHECK(std::get<std::string>(coerce("2024-01-15 10:30:00.123-05:30", GenericColumnType::TIMESTAMP_TZ))
          == "2024-01-15T16:00:00.123+00:00");

    SECTION("offset crosses midnight and year end") {
        CHECK(std::get<std::string>(coerce("2024-01-01 01:00:00+03", GenericColumnType::TIMESTAMP_TZ))
              == "2023-12-31T22:00:00+00:00");
    }
    SECTION("Z designator") {
        CHECK(std::get<std::string>(coerce("2024-06-01T00:00:00Z", GenericColumnType::TIMESTAMP_TZ))
              == "2024-06-01T00:00:00+00:00");
    }
    SECTION("missing offset is null") {
        CHECK(is_null(coerce("2024-01-15 10:30:00", GenericColumnType::TIMESTAMP_TZ)));
    }
}

TEST_CASE("Coercion: uuid is validated and lower-cased", "[coercion]") {
    CHECK(std::get<std::string>(coerce("A0EEBC99-9C0B-4EF8-BB6D-6BB9BD380A11", GenericColumnType::UUID))
          == "a0eebc99-9c0b-4ef8-bb6d-6bb9bd380a11");
    CHECK(is_null(coerce("a0eebc99-9c0b-4ef8-bb6d", GenericColumnType::UUID)));
    CHECK(is_null(coerce("a0eebc99x9c0b-4ef8-bb6d-6bb9bd380a11", GenericColumnType::UUID)));
}

TEST_CASE("Coercion: text must be valid UTF-8", "[coercion][utf8]") {
    CHECK(std::get<std::string>(coerce("caf\xC3\xA9", GenericColumnType::TEXT)) == "caf\xC3\xA9");
    CHECK(is_null(coerce("bad\xFF", GenericColumnType::VARCHAR)));
    CHECK(is_null(coerce("\xC0\xAF", GenericColumnType::TEXT)));

    SECTION("unknown and vendor types fall back to a string read") {
        CHECK(std::get<std::string>(coerce("'1 day'", GenericColumnType::VENDOR_SPECIFIC)) == "'1 day'");
        CHECK(std::get<std::string>(coerce("x", GenericColumnType::UNKNOWN)) == "x");
    }
}

TEST_CASE("Coercion: is_valid_utf8", "[coercion][utf8]") {
    CHECK(ValueCoercion::is_valid_utf8(""));
    CHECK(ValueCoercion::is_valid_utf8("\xF0\x9F\x98\x80"));
    CHECK_FALSE(ValueCoercion::is_valid_utf8("\xE2\x82"));
    CHECK_FALSE(ValueCoercion::is_valid_utf8("\xED\xA0\x80"));
    CHECK_FALSE(ValueCoercion::is_valid_utf8("\xF4\x90\x80\x80"));
}
