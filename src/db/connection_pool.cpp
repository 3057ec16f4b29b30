#include "db/connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace litesync {

std::shared_ptr<ConnectionPool> ConnectionPool::create(
    std::string name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory) {
    return std::make_shared<ConnectionPool>(Token{}, std::move(name), config, std::move(factory));
}

ConnectionPool::ConnectionPool(
    Token,
    std::string name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(config),
      factory_(std::move(factory)) {

    if (config_.pool_size == 0) {
        utils::log::warn(std::format("ConnectionPool '{}': pool_size 0 raised to 1", name_));
        config_.pool_size = 1;
    }

    // Pre-warm every slot; failed slots are reopened lazily by acquire()
    for (size_t i = 0; i < config_.pool_size; ++i) {
        auto conn = create_connection();
        if (conn) {
            std::lock_guard lock(mutex_);
            ++open_connections_;
            idle_connections_.emplace_back(std::move(conn));
        } else {
            utils::log::warn(std::format("Failed to open connection {} of pool '{}' ({})",
                i + 1, name_, config_.path));
        }
    }

    utils::log::info(std::format("ConnectionPool '{}' initialized: {}/{} connections open ({})",
        name_, open_connections_, config_.pool_size, config_.path));
}

ConnectionPool::~ConnectionPool() {
    close();
}

Result<ConnectionPool::Handle> ConnectionPool::acquire() {
    return acquire_until(std::nullopt);
}

Result<ConnectionPool::Handle> ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    return acquire_until(std::chrono::steady_clock::now() + timeout);
}

Result<ConnectionPool::Handle> ConnectionPool::acquire_until(
    std::optional<std::chrono::steady_clock::time_point> deadline) {

    std::unique_ptr<IDbConnection> conn;
    {
        std::unique_lock lock(mutex_);
        const auto ready = [this] {
            return closed_ || checked_out_ < config_.pool_size;
        };

        if (!ready()) {
            waits_.fetch_add(1, std::memory_order_relaxed);
            if (deadline) {
                if (!available_cv_.wait_until(lock, *deadline, ready)) {
                    failed_acquires_.fetch_add(1, std::memory_order_relaxed);
                    return Result<Handle>::error(ErrorCategory::POOL_EXHAUSTED,
                        std::format("Timed out waiting for a connection from pool '{}'", name_));
                }
            } else {
                available_cv_.wait(lock, ready);
            }
        }

        if (closed_) {
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return Result<Handle>::error(ErrorCategory::POOL_CLOSED,
                std::format("Pool '{}' is closed", name_));
        }

        ++checked_out_;
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
        }
    }

    // Slot reserved but no idle connection: reopen outside the lock
    if (!conn) {
        conn = create_connection();
        if (!conn) {
            {
                std::lock_guard lock(mutex_);
                --checked_out_;
            }
            available_cv_.notify_one();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return Result<Handle>::error(ErrorCategory::STORE_ERROR,
                std::format("Failed to open connection for pool '{}' ({})", name_, config_.path));
        }
        std::lock_guard lock(mutex_);
        ++open_connections_;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::weak_ptr<ConnectionPool> weak_pool = weak_from_this();
    auto return_fn = [weak_pool](std::unique_ptr<IDbConnection> c) {
        if (auto pool = weak_pool.lock()) {
            pool->return_connection(std::move(c));
        } else if (c) {
            c->close();
        }
    };

    return Result<Handle>::ok(
        std::make_unique<PooledConnection>(std::move(conn), std::move(return_fn), name_));
}

void ConnectionPool::release(Handle conn) {
    if (conn) {
        conn->release();
    }
}

void ConnectionPool::close() {
    std::deque<std::unique_ptr<IDbConnection>> to_close;
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        closed_ = true;
        to_close.swap(idle_connections_);
        open_connections_ -= to_close.size();
    }

    // Wake every blocked acquire(); they observe closed_ and fail
    available_cv_.notify_all();

    for (auto& conn : to_close) {
        if (conn) conn->close();
    }

    utils::log::info(std::format("ConnectionPool '{}' closed", name_));
}

bool ConnectionPool::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

PoolStats ConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.pool_size = config_.pool_size;
    stats.open_connections = open_connections_;
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = checked_out_;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.waits = waits_.load(std::memory_order_relaxed);
    stats.closed = closed_;
    return stats;
}

std::unique_ptr<IDbConnection> ConnectionPool::create_connection() {
    return factory_->create(config_.path);
}

void ConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    bool discard = false;
    {
        std::lock_guard lock(mutex_);
        if (checked_out_ > 0) --checked_out_;

        // After close, or if the connection broke, drop it; the slot reopens lazily
        discard = closed_ || !conn->is_connected();
        if (discard) {
            --open_connections_;
        } else {
            idle_connections_.emplace_back(std::move(conn));
        }
    }

    if (discard) {
        conn->close();
    }

    available_cv_.notify_one();
}

} // namespace litesync
