#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace polydb {

/**
 * @brief RAII lease on one pooled relational connection
 *
 * Hands the connection back to its pool on destruction. A lease whose
 * connection dropped mid-call (is_connected() == false) is handed back
 * as broken, and the pool closes it instead of parking it as idle.
 * Move-only.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool reusable)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }
    IDbConnection& operator*() const { return *conn_; }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
};

} // namespace polydb
