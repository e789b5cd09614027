#include "redis/reply_shaper.hpp"
#include <cmath>
#include <format>
#include <utility>
#include <vector>

namespace polydb::redis {

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

using Rows = std::vector<std::vector<Value>>;

QueryResult make_result(std::vector<std::string> columns, Rows rows) {
    QueryResult result;
    result.columns = std::move(columns);
    result.rows = std::move(rows);
    result.row_count = result.rows.size();
    return result;
}

QueryResult single_value(Value v) {
    Rows rows;
    rows.push_back({std::move(v)});
    return make_result({"value"}, std::move(rows));
}

Rows pair_rows(const std::vector<RedisValue>& items) {
    Rows rows;
    rows.reserve(items.size() / 2);
    for (size_t i = 0; i + 1 < items.size(); i += 2) {
        rows.push_back({ReplyShaper::to_portable(items[i]), ReplyShaper::to_portable(items[i + 1])});
    }
    return rows;
}

Rows single_column_rows(const std::vector<RedisValue>& items) {
    Rows rows;
    rows.reserve(items.size());
    for (const auto& item : items) {
        rows.push_back({ReplyShaper::to_portable(item)});
    }
    return rows;
}

bool is_set_command(std::string_view command) {
    return command == "SMEMBERS" || command == "SINTER"
        || command == "SUNION" || command == "SDIFF";
}

bool looks_like_scores(const std::vector<RedisValue>& items) {
    if (items.empty() || items.size() % 2 != 0) {
        return false;
    }
    for (size_t i = 1; i < items.size(); i += 2) {
        const ReplyType t = items[i].type;
        if (t != ReplyType::BULK_STRING && t != ReplyType::DOUBLE) {
            return false;
        }
    }
    return true;
}

QueryResult shape_array(const std::vector<RedisValue>& items, std::string_view command) {
    if (command == "HGETALL" || command == "HSCAN") {
        return make_result({"field", "value"}, pair_rows(items));
    }

    if (is_set_command(command)) {
        return make_result({"member"}, single_column_rows(items));
    }

    if (command.starts_with('Z') && looks_like_scores(items)) {
        return make_result({"member", "score"}, pair_rows(items));
    }

    if (command == "SCAN" && items.size() == 2 && items[1].type == ReplyType::ARRAY) {
        auto result = make_result({"key"}, single_column_rows(items[1].elements));
        result.message = std::format("Cursor: {}", ReplyShaper::to_text(items[0]));
        return result;
    }

    Rows rows;
    rows.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        rows.push_back({static_cast<int64_t>(i), ReplyShaper::to_portable(items[i])});
    }
    return make_result({"index", "value"}, std::move(rows));
}

} // namespace

QueryResult ReplyShaper::shape(const RedisValue& reply, std::string_view command) {
    switch (reply.type) {
        case ReplyType::NIL:
        case ReplyType::INTEGER:
        case ReplyType::BULK_STRING:
        case ReplyType::SIMPLE_STRING:
        case ReplyType::DOUBLE:
        case ReplyType::BOOLEAN:
        case ReplyType::VERBATIM_STRING:
        case ReplyType::BIG_NUMBER:
            return single_value(to_portable(reply));

        case ReplyType::OKAY:
            return QueryResult::with_message("OK");

        case ReplyType::ERROR:
            return QueryResult::with_message(std::format("Server error: {}", lossy_utf8(reply.text)));

        case ReplyType::ARRAY:
        case ReplyType::PUSH:
            return shape_array(reply.elements, command);

        case ReplyType::MAP:
            return make_result({"field", "value"}, pair_rows(reply.elements));

        case ReplyType::SET:
            return make_result({"member"}, single_column_rows(reply.elements));
    }
    return single_value(to_portable(reply));
}

Value ReplyShaper::to_portable(const RedisValue& value) {
    switch (value.type) {
        case ReplyType::NIL:
            return std::monostate{};
        case ReplyType::INTEGER:
            return value.integer;
        case ReplyType::DOUBLE:
            if (!std::isfinite(value.real)) {
                return std::monostate{};
            }
            return value.real;
        case ReplyType::BOOLEAN:
            return value.boolean;
        case ReplyType::BULK_STRING:
        case ReplyType::SIMPLE_STRING:
        case ReplyType::OKAY:
        case ReplyType::VERBATIM_STRING:
        case ReplyType::BIG_NUMBER:
            return lossy_utf8(value.text);
        case ReplyType::ERROR:
            return std::format("Error: {}", lossy_utf8(value.text));
        case ReplyType::ARRAY:
        case ReplyType::MAP:
        case ReplyType::SET:
        case ReplyType::PUSH:
            return to_json(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return std::monostate{};
}

nlohmann::json ReplyShaper::to_json(const RedisValue& value) {
    switch (value.type) {
        case ReplyType::NIL:
            return nullptr;
        case ReplyType::INTEGER:
            return value.integer;
        case ReplyType::DOUBLE:
            if (!std::isfinite(value.real)) {
                return nullptr;
            }
            return value.real;
        case ReplyType::BOOLEAN:
            return value.boolean;
        case ReplyType::BULK_STRING:
        case ReplyType::SIMPLE_STRING:
        case ReplyType::OKAY:
        case ReplyType::VERBATIM_STRING:
        case ReplyType::BIG_NUMBER:
            return lossy_utf8(value.text);
        case ReplyType::ERROR:
            return std::format("Error: {}", lossy_utf8(value.text));
        case ReplyType::ARRAY:
        case ReplyType::SET:
        case ReplyType::PUSH: {
            auto arr = nlohmann::json::array();
            for (const auto& item : value.elements) {
                arr.push_back(to_json(item));
            }
            return arr;
        }
        case ReplyType::MAP: {
            auto obj = nlohmann::json::object();
            for (size_t i = 0; i + 1 < value.elements.size(); i += 2) {
                obj[to_text(value.elements[i])] = to_json(value.elements[i + 1]);
            }
            return obj;
        }
    }
    return nullptr;
}

std::string ReplyShaper::to_text(const RedisValue& value) {
    switch (value.type) {
        case ReplyType::BULK_STRING:
        case ReplyType::SIMPLE_STRING:
        case ReplyType::OKAY:
        case ReplyType::VERBATIM_STRING:
        case ReplyType::BIG_NUMBER:
        case ReplyType::ERROR:
            return lossy_utf8(value.text);
        case ReplyType::INTEGER:
            return std::to_string(value.integer);
        case ReplyType::DOUBLE:
            return std::format("{}", value.real);
        case ReplyType::NIL:
        case ReplyType::BOOLEAN:
        case ReplyType::ARRAY:
        case ReplyType::MAP:
        case ReplyType::SET:
        case ReplyType::PUSH:
            return to_json(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return "";
}

std::string ReplyShaper::lossy_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        }

        // Sequence length and the allowed range of the second byte
        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3; lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            len = 3;
        } else if (c == 0xED) {
            len = 3; hi = 0x9F;
        } else if (c == 0xF0) {
            len = 4; lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4; hi = 0x8F;
        } else {
            out += kReplacementChar;
            ++i;
            continue;
        }

        // One replacement per maximal invalid prefix
        size_t j = 1;
        for (; j < len && i + j < bytes.size(); ++j) {
            const auto cc = static_cast<unsigned char>(bytes[i + j]);
            const unsigned char min = j == 1 ? lo : 0x80;
            const unsigned char max = j == 1 ? hi : 0xBF;
            if (cc < min || cc > max) {
                break;
            }
        }
        if (j == len) {
            out.append(bytes.substr(i, len));
        } else {
            out += kReplacementChar;
        }
        i += j;
    }
    return out;
}

} // namespace polydb::redis
