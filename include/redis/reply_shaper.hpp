#pragma once

#include "core/types.hpp"
#include "redis/redis_value.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace polydb::redis {

/**
 * @brief Turns a raw Redis reply into the uniform tabular result
 *
 * Array replies are shaped by command name, first match wins:
 *   HGETALL, HSCAN                 -> (field, value) pairs
 *   SMEMBERS, SINTER, SUNION, SDIFF -> (member)
 *   Z*                             -> (member, score) pairs when the reply
 *                                     has even, non-zero length and every
 *                                     odd element is a bulk string or double
 *   SCAN                           -> (key), cursor in the message
 *   anything else                  -> (index, value)
 *
 * The pairing is a guess from reply structure: a plain even-length
 * ZRANGE reply is shaped as member/score too.
 */
class ReplyShaper {
public:
    /**
     * @param reply Reply to a command
     * @param command Upper-cased command name
     */
    [[nodiscard]] static QueryResult shape(const RedisValue& reply, std::string_view command);

    /**
     * @brief Lower one reply element to a portable value
     *
     * Nested aggregates become their JSON text.
     */
    [[nodiscard]] static Value to_portable(const RedisValue& value);

    [[nodiscard]] static nlohmann::json to_json(const RedisValue& value);

    /** @brief Plain text of a scalar (cursor values, map keys) */
    [[nodiscard]] static std::string to_text(const RedisValue& value);

    /** @brief Bytes as UTF-8, invalid sequences replaced by U+FFFD */
    [[nodiscard]] static std::string lossy_utf8(std::string_view bytes);
};

} // namespace polydb::redis
