#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace polydb::redis {

/**
 * @brief Reply kinds of the Redis protocol (RESP2 plus the RESP3 additions)
 *
 * OKAY is the "+OK" status reply, split out from SIMPLE_STRING because it
 * shapes into a message rather than a value row.
 */
enum class ReplyType : uint8_t {
    NIL,
    INTEGER,
    BULK_STRING,
    SIMPLE_STRING,
    OKAY,
    ERROR,
    ARRAY,
    MAP,
    SET,
    PUSH,
    DOUBLE,
    BOOLEAN,
    VERBATIM_STRING,
    BIG_NUMBER,
};

/**
 * @brief Owned, backend-neutral copy of one reply tree
 *
 * Decouples the command interpreter from hiredis so it can be driven by
 * an in-memory session in tests. MAP stores its entries flattened as
 * key, value, key, value in elements.
 */
struct RedisValue {
    ReplyType type = ReplyType::NIL;
    int64_t integer = 0;
    double real = 0.0;
    bool boolean = false;
    std::string text;
    std::vector<RedisValue> elements;

    static RedisValue nil() { return RedisValue{}; }

    static RedisValue from_integer(int64_t v) {
        RedisValue r;
        r.type = ReplyType::INTEGER;
        r.integer = v;
        return r;
    }

    static RedisValue from_double(double v) {
        RedisValue r;
        r.type = ReplyType::DOUBLE;
        r.real = v;
        return r;
    }

    static RedisValue from_bool(bool v) {
        RedisValue r;
        r.type = ReplyType::BOOLEAN;
        r.boolean = v;
        return r;
    }

    static RedisValue bulk(std::string s) {
        return textual(ReplyType::BULK_STRING, std::move(s));
    }

    /** @brief Status reply; "OK" becomes OKAY */
    static RedisValue status(std::string s) {
        if (s == "OK") {
            return textual(ReplyType::OKAY, std::move(s));
        }
        return textual(ReplyType::SIMPLE_STRING, std::move(s));
    }

    static RedisValue error(std::string s) {
        return textual(ReplyType::ERROR, std::move(s));
    }

    static RedisValue textual(ReplyType type, std::string s) {
        RedisValue r;
        r.type = type;
        r.text = std::move(s);
        return r;
    }

    static RedisValue array(std::vector<RedisValue> items) {
        return aggregate(ReplyType::ARRAY, std::move(items));
    }

    static RedisValue aggregate(ReplyType type, std::vector<RedisValue> items) {
        RedisValue r;
        r.type = type;
        r.elements = std::move(items);
        return r;
    }
};

} // namespace polydb::redis
