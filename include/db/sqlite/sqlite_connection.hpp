#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <string>

namespace litesync {

/**
 * @brief Per-connection SQLite settings, applied as pragmas on open
 */
struct SqliteOptions {
    std::string journal_mode{"WAL"};  // empty leaves the file's mode alone
    std::string synchronous{"NORMAL"};
    int64_t cache_size = 10000;
    int64_t mmap_size = 268435456;   // 256MB memory-mapped I/O
    uint32_t busy_timeout_ms = 5000;
    bool query_only = false;          // reject writes through this connection
    bool create_if_missing = true;
};

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* and provides a backend-agnostic interface.
 * All sqlite3 calls are encapsulated here.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open sqlite3* (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute(const std::string& sql, const std::vector<DbParam>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    std::string snapshot_to(const std::string& dest_path) override;
    void close() override;

private:
    /**
     * @brief Step a prepared statement to completion, collecting rows
     */
    DbResultSet run_statement(sqlite3_stmt* stmt);

    sqlite3* db_;
};

/**
 * @brief SQLite connection factory
 *
 * Opens the file with sqlite3_open_v2 and applies SqliteOptions.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    explicit SqliteConnectionFactory(SqliteOptions options = {});

    std::unique_ptr<IDbConnection> create(const std::string& path) override;

    [[nodiscard]] const SqliteOptions& options() const { return options_; }

private:
    SqliteOptions options_;
};

} // namespace litesync
