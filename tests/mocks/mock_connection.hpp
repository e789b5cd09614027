#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"
#include <atomic>
#include <functional>
#include <string>

namespace polydb::testing {

/**
 * @brief Scriptable relational connection for pool and driver tests
 */
class MockConnection : public IDbConnection {
public:
    using Script = std::function<DbResultSet(const std::string&)>;

    explicit MockConnection(int id, Script script = {})
        : id_(id), script_(std::move(script)) {}

    DbResultSet execute(const std::string& sql) override {
        last_sql_ = sql;
        if (script_) {
            return script_(sql);
        }
        DbResultSet rs;
        rs.success = true;
        return rs;
    }

    std::string quote_literal(std::string_view value) override {
        std::string out = "'";
        for (const char c : value) {
            if (c == '\'') out += '\'';
            out += c;
        }
        out += '\'';
        return out;
    }

    bool is_healthy(const std::string&) override { return connected_ && healthy_; }
    bool is_connected() const override { return connected_; }
    void close() override { connected_ = false; }

    void set_healthy(bool healthy) { healthy_ = healthy; }
    void drop() { connected_ = false; }

    int id() const { return id_; }
    const std::string& last_sql() const { return last_sql_; }

private:
    int id_;
    Script script_;
    bool connected_ = true;
    bool healthy_ = true;
    std::string last_sql_;
};

/**
 * @brief Factory that counts connections and can be told to refuse them
 */
class MockConnectionFactory : public IConnectionFactory {
public:
    explicit MockConnectionFactory(MockConnection::Script script = {})
        : script_(std::move(script)) {}

    Result<std::unique_ptr<IDbConnection>> create(const std::string& connection_string) override {
        last_connection_string_ = connection_string;
        if (refuse_.load()) {
            return Result<std::unique_ptr<IDbConnection>>::error(
                ErrorCode::CONNECT_ERROR, "connection refused");
        }
        const int id = next_id_.fetch_add(1);
        return Result<std::unique_ptr<IDbConnection>>::ok(
            std::make_unique<MockConnection>(id, script_));
    }

    void set_refuse(bool refuse) { refuse_.store(refuse); }
    int total_created() const { return next_id_.load(); }
    const std::string& last_connection_string() const { return last_connection_string_; }

private:
    MockConnection::Script script_;
    std::atomic<int> next_id_{0};
    std::atomic<bool> refuse_{false};
    std::string last_connection_string_;
};

} // namespace polydb::testing
