#include <catch2/catch_test_macros.hpp>
#include "redis/reply_shaper.hpp"

using namespace polydb;
using namespace polydb::redis;

namespace {

RedisValue bulk_array(std::initializer_list<const char*> items) {
    std::vector<RedisValue> values;
    for (const char* item : items) {
        values.push_back(RedisValue::bulk(item));
    }
    return RedisValue::array(std::move(values));
}

std::string text(const Value& v) {
    return std::get<std::string>(v);
}

} // namespace

TEST_CASE("ReplyShaper: scalars become a single value row", "[redis][shaper]") {
    SECTION("bulk string") {
        const auto r = ReplyShaper::shape(RedisValue::bulk("hello"), "GET");
        CHECK(r.columns == std::vector<std::string>{"value"});
        REQUIRE(r.rows.size() == 1);
        CHECK(text(r.rows[0][0]) == "hello");
        CHECK(r.row_count == 1);
        CHECK_FALSE(r.message.has_value());
    }
    SECTION("integer") {
        const auto r = ReplyShaper::shape(RedisValue::from_integer(42), "INCR");
        REQUIRE(r.rows.size() == 1);
        CHECK(std::get<int64_t>(r.rows[0][0]) == 42);
    }
    SECTION("nil") {
        const auto r = ReplyShaper::shape(RedisValue::nil(), "GET");
        REQUIRE(r.rows.size() == 1);
        CHECK(is_null(r.rows[0][0]));
    }
    SECTION("double and boolean") {
        const auto d = ReplyShaper::shape(RedisValue::from_double(1.5), "ZSCORE");
        CHECK(std::get<double>(d.rows[0][0]) == 1.5);
        const auto b = ReplyShaper::shape(RedisValue::from_bool(true), "EXISTS");
        CHECK(std::get<bool>(b.rows[0][0]));
    }
    SECTION("non-OK status") {
        const auto r = ReplyShaper::shape(RedisValue::status("string"), "TYPE");
        CHECK(text(r.rows[0][0]) == "string");
    }
}

TEST_CASE("ReplyShaper: OK acknowledgement is a message", "[redis][shaper]") {
    const auto r = ReplyShaper::shape(RedisValue::status("OK"), "SET");
    CHECK(r.columns.empty());
    CHECK(r.rows.empty());
    CHECK(r.message == std::optional<std::string>("OK"));
}

TEST_CASE("ReplyShaper: server error is a message, not a failure", "[redis][shaper]") {
    const auto r = ReplyShaper::shape(
        RedisValue::error("WRONGTYPE Operation against a key holding the wrong kind of value"), "GET");
    CHECK(r.rows.empty());
    CHECK(r.message == std::optional<std::string>(
        "Server error: WRONGTYPE Operation against a key holding the wrong kind of value"));
}

TEST_CASE("ReplyShaper: HGETALL pairs fields and values", "[redis][shaper]") {
    const auto r = ReplyShaper::shape(bulk_array({"a", "1", "b", "2"}), "HGETALL");
    CHECK(r.columns == std::vector<std::string>{"field", "value"});
    REQUIRE(r.rows.size() == 2);
    CHECK(text(r.rows[0][0]) == "a");
    CHECK(text(r.rows[0][1]) == "1");
    CHECK(text(r.rows[1][0]) == "b");
    CHECK(text(r.rows[1][1]) == "2");
    CHECK(r.row_count == 2);
}

TEST_CASE("ReplyShaper: RESP3 map reply pairs fields and values", "[redis][shaper]") {
    const auto map = RedisValue::aggregate(ReplyType::MAP, {
        RedisValue::bulk("a"), RedisValue::from_integer(1),
    });
    const auto r = ReplyShaper::shape(map, "HGETALL");
    CHECK(r.columns == std::vector<std::string>{"field", "value"});
    REQUIRE(r.rows.size() == 1);
    CHECK(std::get<int64_t>(r.rows[0][1]) == 1);
}

TEST_CASE("ReplyShaper: set commands produce member rows", "[redis][shaper]") {
    for (const char* cmd : {"SMEMBERS", "SINTER", "SUNION", "SDIFF"}) {
        const auto r = ReplyShaper::shape(bulk_array({"x", "y", "z"}), cmd);
        CHECK(r.columns == std::vector<std::string>{"member"});
        CHECK(r.rows.size() == 3);
    }
}

TEST_CASE("ReplyShaper: sorted-set replies pair member and score", "[redis][shaper]") {
    const auto r = ReplyShaper::shape(bulk_array({"alice", "10", "bob", "20"}), "ZRANGE");
    CHECK(r.columns == std::vector<std::string>{"member", "score"});
    REQUIRE(r.rows.size() == 2);
    CHECK(text(r.rows[1][0]) == "bob");
    CHECK(text(r.rows[1][1]) == "20");
}

TEST_CASE("ReplyShaper: odd-length Z reply falls through to index rows", "[redis][shaper]") {
    const auto r = ReplyShaper::shape(bulk_array({"alice", "bob", "carol"}), "ZRANGE");
    CHECK(r.columns == std::vector<std::string>{"index", "value"});
    REQUIRE(r.rows.size() == 3);
    CHECK(std::get<int64_t>(r.rows[2][0]) == 2);
    CHECK(text(r.rows[2][1]) == "carol");
}

TEST_CASE("ReplyShaper: Z reply with integer scores falls through", "[redis][shaper]") {
    const auto reply = RedisValue::array({
        RedisValue::bulk("a"), RedisValue::from_integer(1),
    });
    const auto r = ReplyShaper::shape(reply, "ZRANGE");
    CHECK(r.columns == std::vector<std::string>{"index", "value"});
}

TEST_CASE("ReplyShaper: SCAN reply carries the cursor in the message", "[redis][shaper]") {
    const auto reply = RedisValue::array({RedisValue::bulk("17"), bulk_array({"k1", "k2"})});
    const auto r = ReplyShaper::shape(reply, "SCAN");
    CHECK(r.columns == std::vector<std::string>{"key"});
    CHECK(r.rows.size() == 2);
    CHECK(r.message == std::optional<std::string>("Cursor: 17"));
}

TEST_CASE("ReplyShaper: default array shaping is index/value", "[redis][shaper]") {
    const auto r = ReplyShaper::shape(bulk_array({"a", "b"}), "LRANGE");
    CHECK(r.columns == std::vector<std::string>{"index", "value"});
    REQUIRE(r.rows.size() == 2);
    CHECK(std::get<int64_t>(r.rows[0][0]) == 0);
    CHECK(text(r.rows[0][1]) == "a");
}

TEST_CASE("ReplyShaper: empty array gives columns and no rows", "[redis][shaper]") {
    const auto r = ReplyShaper::shape(RedisValue::array({}), "LRANGE");
    CHECK(r.columns == std::vector<std::string>{"index", "value"});
    CHECK(r.rows.empty());
    CHECK(r.row_count == 0);
}

TEST_CASE("ReplyShaper: every row matches the column count", "[redis][shaper]") {
    const auto replies = {
        std::pair{bulk_array({"a", "1", "b"}), "HGETALL"},
        std::pair{bulk_array({"a", "1", "b", "2"}), "ZREVRANGE"},
        std::pair{bulk_array({"x"}), "SMEMBERS"},
        std::pair{bulk_array({"x", "y"}), "KEYS"},
    };
    for (const auto& [reply, cmd] : replies) {
        const auto r = ReplyShaper::shape(reply, cmd);
        for (const auto& row : r.rows) {
            CHECK(row.size() == r.columns.size());
        }
    }
}

TEST_CASE("ReplyShaper: nested aggregates become JSON text", "[redis][shaper]") {
    const auto nested = RedisValue::array({
        bulk_array({"a", "b"}),
        RedisValue::array({RedisValue::from_integer(1), RedisValue::nil()}),
    });
    const auto r = ReplyShaper::shape(nested, "XRANGE");
    REQUIRE(r.rows.size() == 2);
    CHECK(text(r.rows[0][1]) == R"(["a","b"])");
    CHECK(text(r.rows[1][1]) == "[1,null]");
}

TEST_CASE("ReplyShaper: nested error element keeps its text", "[redis][shaper]") {
    const auto reply = RedisValue::array({RedisValue::error("ERR boom")});
    const auto r = ReplyShaper::shape(reply, "EXEC");
    REQUIRE(r.rows.size() == 1);
    CHECK(text(r.rows[0][1]) == "Error: ERR boom");
}

TEST_CASE("ReplyShaper: lossy_utf8 replaces invalid sequences", "[redis][shaper]") {
    CHECK(ReplyShaper::lossy_utf8("plain") == "plain");
    CHECK(ReplyShaper::lossy_utf8("caf\xC3\xA9") == "caf\xC3\xA9");
    CHECK(ReplyShaper::lossy_utf8("a\xFF" "b") == "a\xEF\xBF\xBD" "b");
    // Truncated three-byte sequence is one replacement
    CHECK(ReplyShaper::lossy_utf8("\xE2\x82" "x") == "\xEF\xBF\xBD" "x");
    // Surrogate half is rejected byte by byte after the lead
    CHECK(ReplyShaper::lossy_utf8("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}
