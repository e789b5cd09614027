#include "db/redis/redis_connection.hpp"
#include <format>

namespace polydb {

namespace {

using ReplyPtr = std::unique_ptr<redisReply, decltype(&freeReplyObject)>;

timeval to_timeval(std::chrono::milliseconds ms) {
    timeval tv{};
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(ms.count() / 1000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>((ms.count() % 1000) * 1000);
    return tv;
}

std::vector<redis::RedisValue> convert_elements(const redisReply* reply) {
    std::vector<redis::RedisValue> items;
    items.reserve(reply->elements);
    for (size_t i = 0; i < reply->elements; ++i) {
        items.push_back(RedisConnection::convert_reply(reply->element[i]));
    }
    return items;
}

} // namespace

Result<std::unique_ptr<RedisConnection>> RedisConnection::open(const RedisEndpoint& endpoint) {
    redisContext* ctx = redisConnectWithTimeout(
        endpoint.host.c_str(), endpoint.port, to_timeval(endpoint.connect_timeout));

    if (!ctx || ctx->err) {
        std::string error = std::format("Failed to connect to Redis: {}",
            ctx ? ctx->errstr : "cannot allocate redis context");
        if (ctx) {
            redisFree(ctx);
        }
        return Result<std::unique_ptr<RedisConnection>>::error(ErrorCode::CONNECT_ERROR, std::move(error));
    }

    auto conn = std::make_unique<RedisConnection>(ctx);

    // ACL login when a username is given, legacy requirepass otherwise
    if (!endpoint.password.empty()) {
        std::vector<std::string> auth = {"AUTH"};
        if (!endpoint.username.empty()) {
            auth.push_back(endpoint.username);
        }
        auth.push_back(endpoint.password);

        auto reply = conn->command(auth);
        if (reply.is_error()) {
            return Result<std::unique_ptr<RedisConnection>>::error(ErrorCode::CONNECT_ERROR,
                std::format("Failed to connect to Redis: {}", reply.error_message()));
        }
        if (reply.value().type == redis::ReplyType::ERROR) {
            return Result<std::unique_ptr<RedisConnection>>::error(ErrorCode::CONNECT_ERROR,
                std::format("Failed to connect to Redis: {}", reply.value().text));
        }
    }

    if (endpoint.database != 0) {
        if (auto status = conn->select(endpoint.database); status.is_error()) {
            return Result<std::unique_ptr<RedisConnection>>::error(ErrorCode::CONNECT_ERROR,
                std::format("Failed to connect to Redis: {}", status.error_message()));
        }
    }

    return Result<std::unique_ptr<RedisConnection>>::ok(std::move(conn));
}

RedisConnection::RedisConnection(redisContext* ctx)
    : ctx_(ctx) {}

RedisConnection::~RedisConnection() {
    if (ctx_) {
        redisFree(ctx_);
        ctx_ = nullptr;
    }
}

Result<redis::RedisValue> RedisConnection::command(const std::vector<std::string>& argv) {
    if (!is_connected()) {
        return Result<redis::RedisValue>::error(ErrorCode::QUERY_EXECUTION_ERROR,
            ctx_ ? ctx_->errstr : "Connection is closed");
    }

    std::vector<const char*> args;
    std::vector<size_t> lengths;
    args.reserve(argv.size());
    lengths.reserve(argv.size());
    for (const auto& arg : argv) {
        args.push_back(arg.data());
        lengths.push_back(arg.size());
    }

    ReplyPtr reply(
        static_cast<redisReply*>(redisCommandArgv(
            ctx_, static_cast<int>(args.size()), args.data(), lengths.data())),
        &freeReplyObject);

    if (!reply) {
        return Result<redis::RedisValue>::error(ErrorCode::QUERY_EXECUTION_ERROR, ctx_->errstr);
    }
    return Result<redis::RedisValue>::ok(convert_reply(reply.get()));
}

Status RedisConnection::select(int64_t index) {
    auto reply = command({"SELECT", std::to_string(index)});
    if (reply.is_error()) {
        return Status::propagate(reply);
    }
    if (reply.value().type == redis::ReplyType::ERROR) {
        return Status::error(ErrorCode::QUERY_EXECUTION_ERROR, reply.value().text);
    }
    selected_db_ = index;
    return Status::ok();
}

bool RedisConnection::is_connected() const {
    return ctx_ != nullptr && ctx_->err == 0;
}

redis::RedisValue RedisConnection::convert_reply(const redisReply* reply) {
    using redis::RedisValue;
    using redis::ReplyType;

    if (!reply) {
        return RedisValue::nil();
    }

    switch (reply->type) {
        case REDIS_REPLY_STRING:
            return RedisValue::bulk(std::string(reply->str, reply->len));
        case REDIS_REPLY_STATUS:
            return RedisValue::status(std::string(reply->str, reply->len));
        case REDIS_REPLY_ERROR:
            return RedisValue::error(std::string(reply->str, reply->len));
        case REDIS_REPLY_INTEGER:
            return RedisValue::from_integer(reply->integer);
        case REDIS_REPLY_NIL:
            return RedisValue::nil();
        case REDIS_REPLY_ARRAY:
            return RedisValue::array(convert_elements(reply));
        case REDIS_REPLY_MAP:
            return RedisValue::aggregate(ReplyType::MAP, convert_elements(reply));
        case REDIS_REPLY_SET:
            return RedisValue::aggregate(ReplyType::SET, convert_elements(reply));
        case REDIS_REPLY_PUSH:
            return RedisValue::aggregate(ReplyType::PUSH, convert_elements(reply));
        case REDIS_REPLY_DOUBLE:
            return RedisValue::from_double(reply->dval);
        case REDIS_REPLY_BOOL:
            return RedisValue::from_bool(reply->integer != 0);
        case REDIS_REPLY_VERB:
            return RedisValue::textual(ReplyType::VERBATIM_STRING, std::string(reply->str, reply->len));
        case REDIS_REPLY_BIGNUM:
            return RedisValue::textual(ReplyType::BIG_NUMBER, std::string(reply->str, reply->len));
        default:
            return RedisValue::nil();
    }
}

} // namespace polydb
