#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>
#include <string>

namespace litesync {

/**
 * @brief RAII wrapper for a pooled store connection
 *
 * Automatically returns the connection to its pool on destruction.
 * Move-only to prevent accidental copying.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    /**
     * @brief Construct pooled connection with return callback
     * @param conn Store connection
     * @param return_fn Function to call on destruction (returns to pool)
     * @param source Name of the store the connection belongs to
     */
    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn,
                     std::string source = {});

    /**
     * @brief Destructor - automatically returns connection to pool
     */
    ~PooledConnection();

    // Move constructor
    PooledConnection(PooledConnection&& other) noexcept;

    // Move assignment
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    // Delete copy
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    /**
     * @brief Access the underlying connection
     */
    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    /**
     * @brief Check if connection is valid
     */
    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Store name ("primary" or a replica id)
     */
    const std::string& source() const { return source_; }

    /**
     * @brief Return the connection to the pool now
     */
    void release();

private:
    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    std::string source_;
};

} // namespace litesync
