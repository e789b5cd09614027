#include "db/redis/redis_driver.hpp"
#include "redis/command_interpreter.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace polydb {

namespace {

constexpr std::string_view kNoFunctions = "Redis does not support functions in the traditional sense";

} // namespace

// ============================================================================
// Lease: returns the connection and its slot on destruction
// ============================================================================

class RedisDriver::Lease {
public:
    Lease(RedisDriver& owner, std::unique_ptr<RedisConnection> conn)
        : owner_(owner), conn_(std::move(conn)) {}

    ~Lease() {
        owner_.release(std::move(conn_), reusable_);
    }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    RedisConnection& connection() { return *conn_; }

    /** @brief Close the connection on release instead of pooling it */
    void retire() { reusable_ = false; }

private:
    RedisDriver& owner_;
    std::unique_ptr<RedisConnection> conn_;
    bool reusable_ = true;
};

// ============================================================================
// LeaseSession: the interpreter's view of one lease
// ============================================================================

class RedisDriver::LeaseSession : public redis::IRedisSession {
public:
    LeaseSession(RedisDriver& owner, Lease& lease)
        : owner_(owner), lease_(lease) {}

    Result<redis::RedisValue> command(const std::vector<std::string>& argv) override {
        if (!argv.empty() && redis::CommandInterpreter::leaves_session_state(argv.front())) {
            lease_.retire();
        }
        return lease_.connection().command(argv);
    }

    Status select_database(int64_t index) override {
        return owner_.select_on(lease_.connection(), index);
    }

private:
    RedisDriver& owner_;
    Lease& lease_;
};

// ============================================================================
// RedisDriver
// ============================================================================

RedisDriver::RedisDriver(RedisEndpoint endpoint, RedisOptions options)
    : endpoint_(std::move(endpoint)),
      options_(options),
      slots_(static_cast<std::ptrdiff_t>(std::max<size_t>(options.max_connections, 1))),
      current_db_(endpoint_.database) {}

RedisDriver::~RedisDriver() {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.clear();
}

Status RedisDriver::warm_up() {
    auto lease = acquire();
    if (lease.is_error()) {
        return Status::propagate(lease);
    }
    utils::log::info(std::format("Redis connection to {}:{} established (database {})",
        endpoint_.host, endpoint_.port, current_db_.load()));
    return Status::ok();
}

Result<std::unique_ptr<RedisDriver::Lease>> RedisDriver::acquire() {
    using LeaseResult = Result<std::unique_ptr<Lease>>;

    if (!slots_.try_acquire_for(options_.connect_timeout)) {
        return LeaseResult::error(ErrorCode::QUERY_EXECUTION_ERROR,
            std::format("Timed out after {}ms waiting for a Redis connection",
                        options_.connect_timeout.count()));
    }

    std::unique_ptr<RedisConnection> conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            conn = std::move(idle_.front());
            idle_.pop_front();
        }
    }

    if (!conn) {
        RedisEndpoint endpoint = endpoint_;
        endpoint.database = current_db_.load();
        auto opened = RedisConnection::open(endpoint);
        if (opened.is_error()) {
            slots_.release();
            utils::log::error(opened.error_message());
            return LeaseResult::propagate(opened);
        }
        conn = std::move(opened.value());
    }

    auto lease = std::make_unique<Lease>(*this, std::move(conn));

    const int64_t wanted = current_db_.load();
    if (lease->connection().selected_database() != wanted) {
        if (auto status = lease->connection().select(wanted); status.is_error()) {
            return LeaseResult::error(ErrorCode::QUERY_EXECUTION_ERROR,
                std::format("Failed to select database {}: {}", wanted, status.error_message()));
        }
    }
    return LeaseResult::ok(std::move(lease));
}

void RedisDriver::release(std::unique_ptr<RedisConnection> conn, bool reusable) {
    if (conn && conn->is_connected()) {
        if (reusable) {
            std::lock_guard<std::mutex> lock(mutex_);
            idle_.push_back(std::move(conn));
        } else {
            utils::log::debug(std::format(
                "Closing Redis connection to {}:{} left in transaction or subscription mode",
                endpoint_.host, endpoint_.port));
            conn.reset();
        }
    }
    slots_.release();
}

Status RedisDriver::select_on(RedisConnection& conn, int64_t index) {
    if (auto status = conn.select(index); status.is_error()) {
        return status;
    }
    current_db_.store(index);
    utils::log::debug(std::format("Redis {}:{} selected database {}", endpoint_.host, endpoint_.port, index));
    return Status::ok();
}

Status RedisDriver::switch_on(RedisConnection& conn, const std::string& database) {
    const auto index = utils::try_parse_int<int64_t>(utils::trim(database));
    if (!index) {
        return Status::error(ErrorCode::INVALID_ARGUMENT,
            std::format("Invalid database index: {}", database));
    }
    if (auto status = select_on(conn, *index); status.is_error()) {
        return Status::error(ErrorCode::CONNECT_ERROR,
            std::format("Failed to switch database: {}", status.error_message()));
    }
    return Status::ok();
}

Result<NameList> RedisDriver::list_databases() {
    NameList names;
    names.reserve(options_.database_count);
    for (size_t i = 0; i < options_.database_count; ++i) {
        names.push_back(std::to_string(i));
    }
    return Result<NameList>::ok(std::move(names));
}

Result<NameList> RedisDriver::list_schemas(const std::string& /*database*/) {
    return Result<NameList>::ok(NameList{});
}

Result<NameList> RedisDriver::list_tables(const std::string& /*database*/, const std::string& /*schema*/) {
    return Result<NameList>::ok(NameList{});
}

Result<NameList> RedisDriver::list_views(const std::string& /*database*/, const std::string& /*schema*/) {
    return Result<NameList>::ok(NameList{});
}

Result<NameList> RedisDriver::list_functions(const std::string& /*database*/, const std::string& /*schema*/) {
    return Result<NameList>::error(ErrorCode::UNSUPPORTED_OPERATION, std::string(kNoFunctions));
}

Result<FunctionInfo> RedisDriver::get_function_definition(
    const std::string& /*database*/, const std::string& /*schema*/,
    const std::string& /*function_name*/) {
    return Result<FunctionInfo>::error(ErrorCode::UNSUPPORTED_OPERATION, std::string(kNoFunctions));
}

Result<std::vector<ColumnInfo>> RedisDriver::list_columns(
    const std::string& /*database*/, const std::string& /*schema*/, const std::string& /*table*/) {
    return Result<std::vector<ColumnInfo>>::ok({});
}

Result<std::vector<IndexInfo>> RedisDriver::list_indexes(
    const std::string& /*database*/, const std::string& /*schema*/, const std::string& /*table*/) {
    return Result<std::vector<IndexInfo>>::ok({});
}

Result<std::vector<ConstraintInfo>> RedisDriver::list_constraints(
    const std::string& /*database*/, const std::string& /*schema*/, const std::string& /*table*/) {
    return Result<std::vector<ConstraintInfo>>::ok({});
}

Result<QueryResult> RedisDriver::execute_query(
    const std::string& statement, const std::optional<std::string>& database) {

    const utils::Timer timer;

    auto lease = acquire();
    if (lease.is_error()) {
        return Result<QueryResult>::error(ErrorCode::QUERY_EXECUTION_ERROR,
            std::format("Redis error: {}", lease.error_message()));
    }
    RedisConnection& conn = lease.value()->connection();

    // The per-call database is re-selected every time; SELECT is idempotent
    if (database) {
        if (auto status = switch_on(conn, *database); status.is_error()) {
            return Result<QueryResult>::propagate(status);
        }
    }

    LeaseSession session(*this, *lease.value());
    redis::CommandInterpreter interpreter(session);
    auto result = interpreter.execute(statement);
    if (result.is_ok()) {
        result.value().execution_time_ms = static_cast<uint64_t>(timer.elapsed_ms().count());
    }
    return result;
}

Status RedisDriver::select_database(const std::string& database) {
    auto lease = acquire();
    if (lease.is_error()) {
        return Status::error(ErrorCode::CONNECT_ERROR,
            std::format("Failed to switch database: {}", lease.error_message()));
    }
    return switch_on(lease.value()->connection(), database);
}

} // namespace polydb
