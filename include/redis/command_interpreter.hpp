#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "redis/redis_value.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace polydb::redis {

/**
 * @brief One leased Redis connection as seen by the interpreter
 *
 * command() fails only when the request could not be exchanged with the
 * server; an error reply is a successful exchange carrying an ERROR value.
 */
class IRedisSession {
public:
    virtual ~IRedisSession() = default;

    [[nodiscard]] virtual Result<RedisValue> command(const std::vector<std::string>& argv) = 0;

    /**
     * @brief Select a logical database for this and later sessions
     * @return Error carrying the server's or transport's text on failure
     */
    [[nodiscard]] virtual Status select_database(int64_t index) = 0;
};

/**
 * @brief Runs one textual command line against a session
 *
 *  - SELECT <n> switches the logical database and reports it
 *  - BROWSE [cursor] [COUNT n] [MATCH p] [TYPE t] runs one SCAN step
 *    and a TYPE lookup per key, yielding (key, type) rows
 *  - anything else is sent verbatim and the reply shaped by ReplyShaper
 */
class CommandInterpreter {
public:
    struct BrowseOptions {
        uint64_t cursor = 0;
        int64_t count = 100;
        std::optional<std::string> pattern;
        std::optional<std::string> type_filter;
    };

    explicit CommandInterpreter(IRedisSession& session);

    [[nodiscard]] Result<QueryResult> execute(std::string_view command_line);

    /**
     * @brief Parse BROWSE arguments
     *
     * COUNT, MATCH and TYPE take the following argument. A leading bare
     * argument is the cursor; other stray arguments are ignored, as are
     * unparsable numbers (cursor 0, count 100).
     */
    [[nodiscard]] static BrowseOptions parse_browse_args(std::span<const std::string> args);

    /**
     * @brief True for commands that leave the connection in a mode
     *        (transaction, subscription, monitor) later commands would inherit
     */
    [[nodiscard]] static bool leaves_session_state(std::string_view command_name);

private:
    Result<QueryResult> browse(std::span<const std::string> args);

    IRedisSession& session_;
};

} // namespace polydb::redis
