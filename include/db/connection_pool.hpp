#pragma once

#include "core/error.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace litesync {

/**
 * @brief Pool configuration
 */
struct PoolConfig {
    std::string path;
    size_t pool_size = 4;
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t pool_size = 0;
    size_t open_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t waits = 0;
    bool closed = false;
};

/**
 * @brief Fixed-size store connection pool
 *
 * Design:
 * - Fixed size: pool_size connections opened up front; a slot whose
 *   connection failed to open (or came back broken) reopens lazily on acquire
 * - acquire() blocks until a slot frees up; acquire(timeout) fails with
 *   POOL_EXHAUSTED instead of waiting forever
 * - close() wakes every waiter with POOL_CLOSED; connections returned after
 *   close are closed instead of pooled
 * - RAII: PooledConnection auto-returns on destruction. Handles hold a weak
 *   reference, so a handle outliving the pool just closes its connection.
 *
 * Always owned by a shared_ptr; construct through create().
 */
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
    struct Token { explicit Token() = default; };

public:
    using Handle = std::unique_ptr<PooledConnection>;

    /**
     * @brief Construct and pre-warm a pool
     * @param name Store name (for logging and PooledConnection::source)
     * @param config Pool configuration
     * @param factory Connection factory
     */
    [[nodiscard]] static std::shared_ptr<ConnectionPool> create(
        std::string name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ConnectionPool(Token, std::string name, const PoolConfig& config,
                   std::shared_ptr<IConnectionFactory> factory);

    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Block until a connection is available
     * @return handle, or POOL_CLOSED / STORE_ERROR
     */
    [[nodiscard]] Result<Handle> acquire();

    /**
     * @brief Wait at most timeout for a connection
     * @return handle, or POOL_EXHAUSTED / POOL_CLOSED / STORE_ERROR
     */
    [[nodiscard]] Result<Handle> acquire(std::chrono::milliseconds timeout);

    /**
     * @brief Return a connection explicitly (same as dropping the handle)
     */
    void release(Handle conn);

    /**
     * @brief Close idle connections and fail all current and future acquires
     */
    void close();

    [[nodiscard]] bool is_closed() const;

    [[nodiscard]] PoolStats get_stats() const;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& path() const { return config_.path; }
    [[nodiscard]] size_t size() const { return config_.pool_size; }

private:
    Result<Handle> acquire_until(
        std::optional<std::chrono::steady_clock::time_point> deadline);

    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Return connection to pool (called by PooledConnection)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Guarded by mutex_
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    size_t checked_out_ = 0;
    size_t open_connections_ = 0;
    bool closed_ = false;

    mutable std::mutex mutex_;
    std::condition_variable available_cv_;

    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> waits_{0};
};

} // namespace litesync
