#pragma once

#include "core/error.hpp"
#include "redis/redis_value.hpp"
#include <hiredis/hiredis.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace polydb {

/**
 * @brief Where and how to reach a Redis server
 */
struct RedisEndpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    std::string username;
    std::string password;
    int64_t database = 0;
    std::chrono::milliseconds connect_timeout{5000};
};

/**
 * @brief One synchronous hiredis connection
 *
 * Owns the redisContext*. Not thread-safe; RedisDriver leases each
 * connection to one caller at a time. Remembers the logical database it
 * last selected so the driver can re-sync it on lease.
 */
class RedisConnection {
public:
    /**
     * @brief Connect and authenticate
     * @return CONNECT_ERROR "Failed to connect to Redis: ..." on failure
     */
    [[nodiscard]] static Result<std::unique_ptr<RedisConnection>> open(const RedisEndpoint& endpoint);

    explicit RedisConnection(redisContext* ctx);
    ~RedisConnection();

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    /**
     * @brief Send one command and wait for its reply
     *
     * Binary-safe (argument lengths are passed explicitly). Error replies
     * are returned as ERROR values; only transport failures are errors.
     */
    [[nodiscard]] Result<redis::RedisValue> command(const std::vector<std::string>& argv);

    /**
     * @brief SELECT index on this connection
     * @return Error with the raw server or transport text
     */
    [[nodiscard]] Status select(int64_t index);

    [[nodiscard]] bool is_connected() const;

    [[nodiscard]] int64_t selected_database() const { return selected_db_; }

    /** @brief Deep-copy a hiredis reply tree */
    [[nodiscard]] static redis::RedisValue convert_reply(const redisReply* reply);

private:
    redisContext* ctx_;
    int64_t selected_db_ = 0;
};

} // namespace polydb
