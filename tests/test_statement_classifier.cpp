#include <catch2/catch_test_macros.hpp>
#include "db/statement_classifier.hpp"

using namespace polydb;

TEST_CASE("StatementClassifier: write keywords", "[classifier]") {
    for (const char* sql : {
             "INSERT INTO t VALUES (1)",
             "update t set x = 1",
             "Delete from t",
             "CREATE TABLE t (id int)",
             "ALTER TABLE t ADD COLUMN y int",
             "DROP TABLE t",
             "TRUNCATE t",
             "GRANT SELECT ON t TO bob",
             "REVOKE SELECT ON t FROM bob",
         }) {
        INFO(sql);
        CHECK(StatementClassifier::is_write_only(sql));
    }
}

TEST_CASE("StatementClassifier: reads return rows", "[classifier]") {
    CHECK_FALSE(StatementClassifier::is_write_only("SELECT 1"));
    CHECK_FALSE(StatementClassifier::is_write_only("WITH x AS (SELECT 1) SELECT * FROM x"));
    CHECK_FALSE(StatementClassifier::is_write_only("EXPLAIN DELETE FROM t"));
    CHECK_FALSE(StatementClassifier::is_write_only(""));
}

TEST_CASE("StatementClassifier: RETURNING anywhere keeps rows", "[classifier]") {
    CHECK_FALSE(StatementClassifier::is_write_only("UPDATE t SET x=1 RETURNING x"));
    CHECK_FALSE(StatementClassifier::is_write_only("insert into t values (1) returning id"));
}

TEST_CASE("StatementClassifier: leading whitespace and line breaks", "[classifier]") {
    CHECK(StatementClassifier::is_write_only("   \n\tinsert into t values (1)"));
    CHECK(StatementClassifier::is_write_only("DELETE\nFROM t"));
    CHECK_FALSE(StatementClassifier::is_write_only("INSERTS"));
}
