#include <catch2/catch_test_macros.hpp>
#include "core/result_json.hpp"

#include <limits>

using namespace polydb;
using nlohmann::json;

TEST_CASE("ResultJson: value variants", "[json]") {
    CHECK(value_to_json(Value{}).is_null());
    CHECK(value_to_json(Value{true}) == json(true));
    CHECK(value_to_json(Value{int64_t{-7}}) == json(-7));
    CHECK(value_to_json(Value{2.5}) == json(2.5));
    CHECK(value_to_json(Value{std::string("x")}) == json("x"));
}

TEST_CASE("ResultJson: non-finite doubles become null", "[json]") {
    CHECK(value_to_json(Value{std::numeric_limits<double>::infinity()}).is_null());
    CHECK(value_to_json(Value{std::numeric_limits<double>::quiet_NaN()}).is_null());
}

TEST_CASE("ResultJson: query result layout", "[json]") {
    QueryResult result;
    result.columns = {"id", "name"};
    result.rows = {{Value{int64_t{1}}, Value{std::string("alice")}},
                   {Value{int64_t{2}}, Value{}}};
    result.row_count = 2;
    result.execution_time_ms = 3;

    const json j = result;
    CHECK(dump_json(j) ==
          R"({"columns":["id","name"],"execution_time_ms":3,"message":null,)"
          R"("row_count":2,"rows":[[1,"alice"],[2,null]]})");
}

TEST_CASE("ResultJson: message-only result", "[json]") {
    const json j = QueryResult::with_message("2 row(s) affected.");
    CHECK(j["columns"].empty());
    CHECK(j["rows"].empty());
    CHECK(j["row_count"] == 0);
    CHECK(j["message"] == "2 row(s) affected.");
}

TEST_CASE("ResultJson: schema objects", "[json]") {
    ColumnInfo column;
    column.name = "email";
    column.data_type = "text";
    column.column_default = "''::text";
    const json c = column;
    CHECK(c["is_nullable"] == true);
    CHECK(c["column_default"] == "''::text");
    CHECK(c["is_primary_key"] == false);

    ConstraintInfo pk;
    pk.name = "users_pkey";
    pk.constraint_type = "PRIMARY KEY";
    pk.columns = {"id"};
    const json p = pk;
    CHECK(p["foreign_table"].is_null());
    CHECK(p["foreign_columns"].is_null());

    ConstraintInfo fk;
    fk.name = "orders_user_id_fkey";
    fk.constraint_type = "FOREIGN KEY";
    fk.columns = {"user_id"};
    fk.foreign_table = "users";
    fk.foreign_columns = std::vector<std::string>{"id"};
    const json f = fk;
    CHECK(f["foreign_table"] == "users");
    CHECK(f["foreign_columns"] == json::array({"id"}));

    FunctionInfo fn;
    fn.name = "add";
    fn.definition = "SELECT $1 + $2";
    fn.language = "sql";
    const json fj = fn;
    CHECK(fj["return_type"].is_null());
    CHECK(fj["language"] == "sql");

    IndexInfo idx;
    idx.name = "users_pkey";
    idx.columns = {"id"};
    idx.is_unique = true;
    idx.is_primary = true;
    const json i = idx;
    CHECK(i["columns"] == json::array({"id"}));
    CHECK(i["is_primary"] == true);
}

TEST_CASE("ResultJson: invalid UTF-8 is replaced on output", "[json]") {
    const json j = std::string("bad\xFF");
    CHECK(dump_json(j) == "\"bad\xEF\xBF\xBD\"");
}

TEST_CASE("ResultJson: indented output", "[json]") {
    const json j = {{"a", 1}};
    CHECK(dump_json(j, 2) == "{\n  \"a\": 1\n}");
}
