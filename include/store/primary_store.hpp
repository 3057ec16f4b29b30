#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/connection_pool.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace litesync {

/**
 * @brief The single writable store and source of truth
 *
 * Thin layer over the primary connection pool. Concurrent writers serialize
 * through SQLite's own locking (busy_timeout), not through this class.
 */
class PrimaryStore {
public:
    /**
     * @param pool Primary connection pool
     * @param acquire_timeout Wait bound for internal operations
     */
    PrimaryStore(std::shared_ptr<ConnectionPool> pool, std::chrono::milliseconds acquire_timeout);

    /**
     * @brief Create the replicated schema on the primary
     */
    [[nodiscard]] Result<void> initialize();

    /**
     * @brief Validate, stamp and upsert one record
     *
     * Unstamped drafts get max(now, newest modified_at + 1), taken inside
     * the write transaction, so later commits always carry larger stamps.
     * @return the stored record (with defaults applied)
     */
    [[nodiscard]] Result<Record> put(const RecordDraft& draft);

    [[nodiscard]] Result<std::optional<Record>> get(
        const std::string& collection, const std::string& id);

    /**
     * @brief Rows with modified_at > cutoff in replication order
     */
    [[nodiscard]] Result<std::vector<Record>> changes_since(Timestamp cutoff);

    [[nodiscard]] Result<Timestamp> max_modified_at();

    [[nodiscard]] Result<int64_t> record_count();

    [[nodiscard]] const std::shared_ptr<ConnectionPool>& pool() const { return pool_; }
    [[nodiscard]] const std::string& path() const { return pool_->path(); }

private:
    [[nodiscard]] Result<ConnectionPool::Handle> connection();

    std::shared_ptr<ConnectionPool> pool_;
    std::chrono::milliseconds acquire_timeout_;
};

} // namespace litesync
