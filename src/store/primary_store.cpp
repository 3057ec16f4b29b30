#include "store/primary_store.hpp"
#include "store/record_schema.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace litesync {

PrimaryStore::PrimaryStore(std::shared_ptr<ConnectionPool> pool,
                           std::chrono::milliseconds acquire_timeout)
    : pool_(std::move(pool)), acquire_timeout_(acquire_timeout) {}

Result<ConnectionPool::Handle> PrimaryStore::connection() {
    return pool_->acquire(acquire_timeout_);
}

Result<void> PrimaryStore::initialize() {
    auto conn = connection();
    if (conn.is_error()) {
        return Result<void>::error(conn.error_category(), conn.error_message());
    }
    auto result = records::ensure_schema(*conn.value()->get());
    if (result.is_ok()) {
        utils::log::info(std::format("Primary store ready: {}", path()));
    }
    return result;
}

Result<Record> PrimaryStore::put(const RecordDraft& draft) {
    auto record = records::normalize(draft, utils::now_ms());
    if (record.is_error()) {
        return record;
    }

    auto conn = connection();
    if (conn.is_error()) {
        return Result<Record>::error(conn.error_category(), conn.error_message());
    }
    auto& db = *conn.value()->get();

    if (draft.modified_at) {
        const auto written = records::upsert(db, record.value());
        if (written.is_error()) {
            return Result<Record>::error(written.error_category(), written.error_message());
        }
        return record;
    }

    // Stamp under the write lock so stamp order matches commit order
    const auto begin = db.execute("BEGIN IMMEDIATE");
    if (!begin.success) {
        return Result<Record>::error(ErrorCategory::STORE_ERROR,
            std::format("Write lock on {} failed: {}", path(), begin.error_message));
    }

    std::string error;
    auto newest = records::max_modified_at(db);
    if (newest.is_error()) {
        error = newest.error_message();
    } else {
        record.value().modified_at = std::max(utils::now_ms(), newest.value() + 1);
        const auto written = records::upsert(db, record.value());
        if (written.is_error()) {
            error = written.error_message();
        }
    }

    if (error.empty()) {
        const auto commit = db.execute("COMMIT");
        if (commit.success) {
            return record;
        }
        error = std::format("COMMIT failed: {}", commit.error_message);
    }

    const auto rollback = db.execute("ROLLBACK");
    if (!rollback.success) {
        // Never hand a connection with an open transaction back to the pool
        utils::log::warn(std::format("Primary rollback failed: {}", rollback.error_message));
        db.close();
    }
    return Result<Record>::error(ErrorCategory::STORE_ERROR, error);
}

Result<std::optional<Record>> PrimaryStore::get(const std::string& collection, const std::string& id) {
    auto conn = connection();
    if (conn.is_error()) {
        return Result<std::optional<Record>>::error(conn.error_category(), conn.error_message());
    }
    return records::find(*conn.value()->get(), collection, id);
}

Result<std::vector<Record>> PrimaryStore::changes_since(Timestamp cutoff) {
    auto conn = connection();
    if (conn.is_error()) {
        return Result<std::vector<Record>>::error(conn.error_category(), conn.error_message());
    }
    return records::select_since(*conn.value()->get(), cutoff);
}

Result<Timestamp> PrimaryStore::max_modified_at() {
    auto conn = connection();
    if (conn.is_error()) {
        return Result<Timestamp>::error(conn.error_category(), conn.error_message());
    }
    return records::max_modified_at(*conn.value()->get());
}

Result<int64_t> PrimaryStore::record_count() {
    auto conn = connection();
    if (conn.is_error()) {
        return Result<int64_t>::error(conn.error_category(), conn.error_message());
    }
    return records::count(*conn.value()->get());
}

} // namespace litesync
