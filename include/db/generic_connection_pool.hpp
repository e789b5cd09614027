#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace polydb {

/**
 * @brief Database-agnostic bounded connection pool
 *
 * Works with any IDbConnection via IConnectionFactory.
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore (C++20)
 * - Eager warm-up of min_connections, lazy growth up to max
 * - Health checking: connections idle longer than idle_timeout are probed
 * - Recycling: connections older than max_lifetime are replaced on acquire
 * - RAII: PooledConnection auto-returns on destruction
 *
 * Must outlive every lease it hands out.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param name Connection id (for logging)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    Status warm_up() override;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    std::string last_error() const override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return name_; }

private:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Create new connection via factory, recording the failure text
     */
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Close a connection and forget its bookkeeping
     */
    void discard(std::unique_ptr<IDbConnection> conn);

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn, bool reusable);

    void track(IDbConnection* conn, Clock::time_point now);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;

    // Semaphore for bounded pool (C++20)
    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<bool> shutdown_{false};

    // Connection lifetime tracking (guarded by mutex_)
    std::unordered_map<IDbConnection*, Clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, Clock::time_point> last_used_;

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

} // namespace polydb
