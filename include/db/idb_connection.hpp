#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace litesync {

/// Bound statement parameter: NULL, integer or text
using DbParam = std::variant<std::monostate, int64_t, std::string>;

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied out of the native statement).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT (NULL columns come back as empty strings)
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;
};

/**
 * @brief Abstract store connection
 *
 * Wraps a single native handle (sqlite3*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute one or more SQL statements without parameters
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a single statement with positional parameters (?1, ?2, ...)
     */
    [[nodiscard]] virtual DbResultSet execute(
        const std::string& sql, const std::vector<DbParam>& params) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (open)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Copy the whole database into a new file at dest_path
     *
     * Point-in-time: the copy reflects one consistent committed state.
     * @return empty string on success, error text otherwise
     */
    [[nodiscard]] virtual std::string snapshot_to(const std::string& dest_path) = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace litesync
