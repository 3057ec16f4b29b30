#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"
#include <chrono>
#include <format>
#include <vector>
#include <thread>
#include <type_traits>

namespace litesync {

namespace {

std::string errmsg(sqlite3* db) {
    return db ? sqlite3_errmsg(db) : "out of memory";
}

bool bind_params(sqlite3_stmt* stmt, const std::vector<DbParam>& params) {
    for (size_t i = 0; i < params.size(); ++i) {
        const int idx = static_cast<int>(i) + 1;
        const int rc = std::visit([&](const auto& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return sqlite3_bind_null(stmt, idx);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(v));
            } else {
                return sqlite3_bind_text(stmt, idx, v.data(), static_cast<int>(v.size()),
                                         SQLITE_TRANSIENT);
            }
        }, params[i]);
        if (rc != SQLITE_OK) return false;
    }
    return true;
}

DbResultSet failure(std::string message) {
    DbResultSet result;
    result.success = false;
    result.error_message = std::move(message);
    return result;
}

} // anonymous namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::execute(const std::string& sql) {
    if (!db_) {
        return failure("Connection is closed");
    }

    // Run every statement in the text; the last one's rows are returned
    DbResultSet result;
    result.success = true;
    const char* tail = sql.c_str();
    while (tail && *tail) {
        sqlite3_stmt* stmt = nullptr;
        const char* next = nullptr;
        if (sqlite3_prepare_v2(db_, tail, -1, &stmt, &next) != SQLITE_OK) {
            return failure(errmsg(db_));
        }
        tail = next;
        if (!stmt) {
            continue;  // whitespace or comment
        }
        result = run_statement(stmt);
        sqlite3_finalize(stmt);
        if (!result.success) {
            return result;
        }
    }
    return result;
}

DbResultSet SqliteConnection::execute(const std::string& sql, const std::vector<DbParam>& params) {
    if (!db_) {
        return failure("Connection is closed");
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr) != SQLITE_OK) {
        return failure(errmsg(db_));
    }
    if (!stmt) {
        return failure("Empty statement");
    }

    if (!bind_params(stmt, params)) {
        auto result = failure(std::format("Failed to bind parameters: {}", errmsg(db_)));
        sqlite3_finalize(stmt);
        return result;
    }

    auto result = run_statement(stmt);
    sqlite3_finalize(stmt);
    return result;
}

bool SqliteConnection::is_healthy(const std::string& health_check_query) {
    if (!db_) {
        return false;
    }
    return execute(health_check_query).success;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

std::string SqliteConnection::snapshot_to(const std::string& dest_path) {
    if (!db_) {
        return "Connection is closed";
    }

    sqlite3* dest = nullptr;
    int rc = sqlite3_open_v2(dest_path.c_str(), &dest,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = std::format("Cannot open {}: {}", dest_path, errmsg(dest));
        sqlite3_close(dest);
        return error;
    }

    sqlite3_backup* backup = sqlite3_backup_init(dest, "main", db_, "main");
    if (!backup) {
        std::string error = std::format("Backup init failed: {}", errmsg(dest));
        sqlite3_close(dest);
        return error;
    }

    // Copy all pages in one step; retry while a writer holds the lock
    do {
        rc = sqlite3_backup_step(backup, -1);
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    } while (rc == SQLITE_OK || rc == SQLITE_BUSY || rc == SQLITE_LOCKED);

    sqlite3_backup_finish(backup);

    std::string error;
    if (rc != SQLITE_DONE) {
        error = std::format("Backup step failed: {}", sqlite3_errstr(rc));
    } else if (sqlite3_errcode(dest) != SQLITE_OK) {
        error = std::format("Backup failed: {}", errmsg(dest));
    }
    sqlite3_close(dest);
    return error;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

DbResultSet SqliteConnection::run_statement(sqlite3_stmt* stmt) {
    DbResultSet result;
    const int ncols = sqlite3_column_count(stmt);
    result.has_rows = ncols > 0;
    for (int i = 0; i < ncols; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        result.column_names.emplace_back(name ? name : "");
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::vector<std::string> row;
        row.reserve(ncols);
        for (int i = 0; i < ncols; ++i) {
            const auto* text = sqlite3_column_text(stmt, i);
            const int len = sqlite3_column_bytes(stmt, i);
            row.emplace_back(text ? std::string(reinterpret_cast<const char*>(text), len) : "");
        }
        result.rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        result.success = false;
        result.error_message = errmsg(db_);
        result.rows.clear();
        return result;
    }

    result.success = true;
    if (!result.has_rows) {
        result.affected_rows = static_cast<uint64_t>(sqlite3_changes(db_));
    }
    return result;
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

SqliteConnectionFactory::SqliteConnectionFactory(SqliteOptions options)
    : options_(std::move(options)) {}

std::unique_ptr<IDbConnection> SqliteConnectionFactory::create(const std::string& path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
    if (options_.create_if_missing) {
        flags |= SQLITE_OPEN_CREATE;
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        utils::log::error(std::format("Failed to open {}: {}", path, errmsg(db)));
        sqlite3_close(db);
        return nullptr;
    }

    sqlite3_busy_timeout(db, static_cast<int>(options_.busy_timeout_ms));

    auto conn = std::make_unique<SqliteConnection>(db);

    // Tuning pragmas are best-effort; a failure only costs performance
    std::vector<std::string> pragmas;
    if (!options_.journal_mode.empty()) {
        pragmas.push_back(std::format("PRAGMA journal_mode={}", options_.journal_mode));
    }
    pragmas.push_back(std::format("PRAGMA synchronous={}", options_.synchronous));
    pragmas.push_back(std::format("PRAGMA cache_size={}", options_.cache_size));
    pragmas.push_back(std::format("PRAGMA mmap_size={}", options_.mmap_size));
    pragmas.push_back("PRAGMA temp_store=MEMORY");
    for (const auto& pragma : pragmas) {
        const auto result = conn->execute(pragma);
        if (!result.success) {
            utils::log::warn(std::format("{} failed on {}: {}", pragma, path, result.error_message));
        }
    }

    if (options_.query_only) {
        const auto result = conn->execute("PRAGMA query_only=ON");
        if (!result.success) {
            utils::log::error(std::format("Cannot make {} read-only: {}", path, result.error_message));
            return nullptr;
        }
    }

    return conn;
}

} // namespace litesync
