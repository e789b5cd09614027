#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace polydb {

GenericConnectionPool::GenericConnectionPool(
    std::string name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(std::max<size_t>(config.max_connections, 1))) {}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

Status GenericConnectionPool::warm_up() {
    const size_t target = std::clamp<size_t>(
        config_.min_connections, 1, std::max<size_t>(config_.max_connections, 1));

    for (size_t i = 0; i < target; ++i) {
        auto conn = create_connection();
        if (!conn) {
            // The first handshake decides whether the connection exists at all
            if (i == 0) {
                return Status::error(ErrorCode::CONNECT_ERROR, last_error());
            }
            utils::log::warn(std::format("Failed to create connection {} during warm-up for '{}': {}",
                i + 1, name_, last_error()));
            break;
        }
        std::lock_guard lock(mutex_);
        track(conn.get(), Clock::now());
        idle_connections_.emplace_back(std::move(conn));
    }

    utils::log::info(std::format("ConnectionPool initialized for '{}': {} connections (min={}, max={})",
        name_, total_connections_.load(), config_.min_connections, config_.max_connections));
    return Status::ok();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard lock(error_mutex_);
        last_error_ = std::format("Timed out after {}ms waiting for a connection to '{}'",
            timeout.count(), name_);
        return nullptr;
    }

    // Re-check shutdown after acquiring semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    Clock::time_point birth{};
    Clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (const auto it = created_at_.find(conn.get()); it != created_at_.end()) {
                birth = it->second;
            }
            if (const auto it = last_used_.find(conn.get()); it != last_used_.end()) {
                last_used = it->second;
            }
        }
    }

    bool replace = false;
    if (conn) {
        const auto now = Clock::now();
        if (config_.max_lifetime.count() > 0 && now - birth > config_.max_lifetime) {
            connections_recycled_.fetch_add(1, std::memory_order_relaxed);
            replace = true;
        } else if (now - last_used > config_.idle_timeout &&
                   !conn->is_healthy(config_.health_check_query)) {
            // Only connections idle past idle_timeout pay for the round trip
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            replace = true;
        }
    }

    if (replace) {
        discard(std::move(conn));
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        std::lock_guard lock(mutex_);
        track(conn.get(), Clock::now());
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c, bool reusable) {
        this->return_connection(std::move(c), reusable);
    };

    return std::make_unique<PooledConnection>(std::move(conn), std::move(return_fn));
}

std::string GenericConnectionPool::last_error() const {
    std::lock_guard lock(error_mutex_);
    return last_error_;
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);

    for (auto& conn : idle_connections_) {
        if (conn) {
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    idle_connections_.clear();
    created_at_.clear();
    last_used_.clear();

    utils::log::info(std::format("ConnectionPool drained for '{}'", name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto created = factory_->create(config_.connection_string);
    if (created.is_error()) {
        utils::log::error(std::format("Connection to '{}' failed: {}", name_, created.error_message()));
        std::lock_guard lock(error_mutex_);
        last_error_ = created.error_message();
        return nullptr;
    }
    total_connections_.fetch_add(1, std::memory_order_relaxed);
    return std::move(created.value());
}

void GenericConnectionPool::discard(std::unique_ptr<IDbConnection> conn) {
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool reusable) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (!reusable || shutdown_.load(std::memory_order_acquire)) {
        discard(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = Clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

void GenericConnectionPool::track(IDbConnection* conn, Clock::time_point now) {
    created_at_[conn] = now;
    last_used_[conn] = now;
}

} // namespace polydb
