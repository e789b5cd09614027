#include "redis/command_interpreter.hpp"
#include "redis/command_tokenizer.hpp"
#include "redis/reply_shaper.hpp"
#include "db/schema_constants.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <array>
#include <format>

namespace polydb::redis {

namespace {

constexpr int64_t kDefaultScanCount = 100;
constexpr std::string_view kUnknownType = "unknown";

constexpr std::array<std::string_view, 6> kStatefulCommands = {
    "MULTI", "WATCH", "SUBSCRIBE", "PSUBSCRIBE", "SSUBSCRIBE", "MONITOR"
};

} // namespace

CommandInterpreter::CommandInterpreter(IRedisSession& session)
    : session_(session) {}

Result<QueryResult> CommandInterpreter::execute(std::string_view command_line) {
    const std::string line = CommandTokenizer::strip_terminator(command_line);
    if (line.empty()) {
        return Result<QueryResult>::ok(QueryResult::with_message(std::string(db::kEmptyCommand)));
    }

    const auto parts = CommandTokenizer::tokenize(line);
    if (parts.empty()) {
        return Result<QueryResult>::ok(QueryResult::with_message(std::string(db::kEmptyCommand)));
    }

    const std::string name = utils::to_upper(parts.front());
    const std::span<const std::string> args(parts.data() + 1, parts.size() - 1);

    if (name == "SELECT" && args.size() == 1) {
        if (const auto index = utils::try_parse_int<int64_t>(args[0])) {
            const auto status = session_.select_database(*index);
            if (status.is_error()) {
                return Result<QueryResult>::error(ErrorCode::QUERY_EXECUTION_ERROR,
                    std::format("Redis error: {}", status.error_message()));
            }
            return Result<QueryResult>::ok(
                QueryResult::with_message(std::format("Switched to database {}", *index)));
        }
    }

    if (name == "BROWSE") {
        return browse(args);
    }

    std::vector<std::string> argv;
    argv.reserve(parts.size());
    argv.push_back(name);
    argv.insert(argv.end(), args.begin(), args.end());

    auto reply = session_.command(argv);
    if (reply.is_error()) {
        return Result<QueryResult>::error(ErrorCode::QUERY_EXECUTION_ERROR,
            std::format("Redis error: {}", reply.error_message()));
    }
    return Result<QueryResult>::ok(ReplyShaper::shape(reply.value(), name));
}

bool CommandInterpreter::leaves_session_state(std::string_view command_name) {
    const std::string name = utils::to_upper(command_name);
    return std::find(kStatefulCommands.begin(), kStatefulCommands.end(), name)
        != kStatefulCommands.end();
}

CommandInterpreter::BrowseOptions CommandInterpreter::parse_browse_args(
    std::span<const std::string> args) {

    BrowseOptions opts;
    size_t i = 0;
    while (i < args.size()) {
        const std::string keyword = utils::to_upper(args[i]);
        const bool has_value = i + 1 < args.size();

        if (keyword == "COUNT" && has_value) {
            opts.count = utils::parse_int<int64_t>(args[i + 1], kDefaultScanCount);
            i += 2;
        } else if (keyword == "MATCH" && has_value) {
            opts.pattern = args[i + 1];
            i += 2;
        } else if (keyword == "TYPE" && has_value) {
            opts.type_filter = args[i + 1];
            i += 2;
        } else {
            if (i == 0) {
                opts.cursor = utils::parse_int<uint64_t>(args[i], 0);
            }
            ++i;
        }
    }
    return opts;
}

Result<QueryResult> CommandInterpreter::browse(std::span<const std::string> args) {
    const auto opts = parse_browse_args(args);

    std::vector<std::string> scan = {
        "SCAN", std::to_string(opts.cursor), "COUNT", std::to_string(opts.count),
    };
    if (opts.pattern) {
        scan.push_back("MATCH");
        scan.push_back(*opts.pattern);
    }
    if (opts.type_filter) {
        scan.push_back("TYPE");
        scan.push_back(*opts.type_filter);
    }

    auto reply = session_.command(scan);
    if (reply.is_error()) {
        return Result<QueryResult>::error(ErrorCode::QUERY_EXECUTION_ERROR,
            std::format("Redis error: {}", reply.error_message()));
    }

    const RedisValue& value = reply.value();
    if (value.type == ReplyType::ERROR) {
        return Result<QueryResult>::error(ErrorCode::QUERY_EXECUTION_ERROR,
            std::format("Redis error: {}", ReplyShaper::lossy_utf8(value.text)));
    }
    if (value.type != ReplyType::ARRAY || value.elements.size() != 2) {
        return Result<QueryResult>::error(ErrorCode::QUERY_EXECUTION_ERROR,
            "Invalid SCAN response format");
    }

    const RedisValue& cursor_value = value.elements[0];
    std::string next_cursor = "0";
    if (cursor_value.type == ReplyType::BULK_STRING) {
        next_cursor = ReplyShaper::lossy_utf8(cursor_value.text);
    } else if (cursor_value.type == ReplyType::INTEGER) {
        next_cursor = std::to_string(cursor_value.integer);
    }

    const RedisValue& keys = value.elements[1];
    if (keys.type != ReplyType::ARRAY) {
        return Result<QueryResult>::error(ErrorCode::QUERY_EXECUTION_ERROR, "Invalid SCAN response");
    }

    QueryResult result;
    result.columns = {"key", "type"};
    for (const auto& key : keys.elements) {
        if (key.type != ReplyType::BULK_STRING) {
            continue;
        }

        // Per-key TYPE failures are reported as "unknown", not as a failed scan
        std::string key_type(kUnknownType);
        auto type_reply = session_.command({"TYPE", key.text});
        if (type_reply.is_ok()) {
            const auto t = type_reply.value().type;
            if (t == ReplyType::SIMPLE_STRING || t == ReplyType::BULK_STRING) {
                key_type = ReplyShaper::lossy_utf8(type_reply.value().text);
            }
        }

        result.rows.push_back({ReplyShaper::lossy_utf8(key.text), std::move(key_type)});
    }
    result.row_count = result.rows.size();

    if (next_cursor == "0") {
        result.message = "Scan complete";
    } else {
        result.message = std::format("Next cursor: {} (run BROWSE {} to continue)", next_cursor, next_cursor);
    }
    return Result<QueryResult>::ok(std::move(result));
}

} // namespace polydb::redis
