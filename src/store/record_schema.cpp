#include "store/record_schema.hpp"
#include "core/utils.hpp"
#include <format>

namespace litesync::records {

namespace {

constexpr const char* kCreateTable =
    "CREATE TABLE IF NOT EXISTS records ("
    "    collection  TEXT    NOT NULL,"
    "    id          TEXT    NOT NULL,"
    "    modified_at INTEGER NOT NULL,"
    "    payload     TEXT    NOT NULL DEFAULT '',"
    "    PRIMARY KEY (collection, id)"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_records_modified_at "
    "    ON records (modified_at, id, collection);";

constexpr const char* kUpsert =
    "INSERT OR REPLACE INTO records (collection, id, modified_at, payload) "
    "VALUES (?1, ?2, ?3, ?4)";

constexpr const char* kSelectSince =
    "SELECT collection, id, modified_at, payload FROM records "
    "WHERE modified_at > ?1 "
    "ORDER BY modified_at ASC, id ASC, collection ASC";

constexpr const char* kFind =
    "SELECT collection, id, modified_at, payload FROM records "
    "WHERE collection = ?1 AND id = ?2";

Record row_to_record(const std::vector<std::string>& row) {
    Record record;
    record.collection = row[0];
    record.id = row[1];
    record.modified_at = utils::parse_int<Timestamp>(row[2]);
    record.payload = row[3];
    return record;
}

} // anonymous namespace

Result<void> ensure_schema(IDbConnection& conn) {
    const auto result = conn.execute(kCreateTable);
    if (!result.success) {
        return Result<void>::error(ErrorCategory::STORE_ERROR,
            std::format("Failed to create schema: {}", result.error_message));
    }
    return Result<void>::ok();
}

Result<Record> normalize(const RecordDraft& draft, Timestamp now_ms) {
    if (draft.id.empty()) {
        return Result<Record>::error(ErrorCategory::INVALID_RECORD, "Record id must not be empty");
    }
    if (draft.collection && draft.collection->empty()) {
        return Result<Record>::error(ErrorCategory::INVALID_RECORD,
            std::format("Record '{}': collection must not be empty when given", draft.id));
    }
    if (draft.modified_at && *draft.modified_at < 0) {
        return Result<Record>::error(ErrorCategory::INVALID_RECORD,
            std::format("Record '{}': modified_at must not be negative", draft.id));
    }

    Record record;
    record.collection = draft.collection.value_or(kDefaultCollection);
    record.id = draft.id;
    record.modified_at = draft.modified_at.value_or(now_ms);
    record.payload = draft.payload;
    return Result<Record>::ok(std::move(record));
}

Result<void> upsert(IDbConnection& conn, const Record& record) {
    const auto result = conn.execute(kUpsert, {
        record.collection, record.id, static_cast<int64_t>(record.modified_at), record.payload});
    if (!result.success) {
        return Result<void>::error(ErrorCategory::STORE_ERROR,
            std::format("Upsert of {}/{} failed: {}", record.collection, record.id,
                        result.error_message));
    }
    return Result<void>::ok();
}

Result<std::vector<Record>> select_since(IDbConnection& conn, Timestamp cutoff) {
    const auto result = conn.execute(kSelectSince, {static_cast<int64_t>(cutoff)});
    if (!result.success) {
        return Result<std::vector<Record>>::error(ErrorCategory::STORE_ERROR,
            std::format("Change query failed: {}", result.error_message));
    }

    std::vector<Record> changes;
    changes.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        changes.push_back(row_to_record(row));
    }
    return Result<std::vector<Record>>::ok(std::move(changes));
}

Result<std::optional<Record>> find(
    IDbConnection& conn, const std::string& collection, const std::string& id) {
    const auto result = conn.execute(kFind, {collection, id});
    if (!result.success) {
        return Result<std::optional<Record>>::error(ErrorCategory::STORE_ERROR,
            std::format("Lookup of {}/{} failed: {}", collection, id, result.error_message));
    }
    if (result.rows.empty()) {
        return Result<std::optional<Record>>::ok(std::nullopt);
    }
    return Result<std::optional<Record>>::ok(row_to_record(result.rows.front()));
}

Result<Timestamp> max_modified_at(IDbConnection& conn) {
    const auto result = conn.execute("SELECT COALESCE(MAX(modified_at), 0) FROM records");
    if (!result.success || result.rows.empty()) {
        return Result<Timestamp>::error(ErrorCategory::STORE_ERROR,
            std::format("Watermark query failed: {}", result.error_message));
    }
    return Result<Timestamp>::ok(utils::parse_int<Timestamp>(result.rows[0][0]));
}

Result<int64_t> count(IDbConnection& conn) {
    const auto result = conn.execute("SELECT COUNT(*) FROM records");
    if (!result.success || result.rows.empty()) {
        return Result<int64_t>::error(ErrorCategory::STORE_ERROR,
            std::format("Count query failed: {}", result.error_message));
    }
    return Result<int64_t>::ok(utils::parse_int<int64_t>(result.rows[0][0]));
}

} // namespace litesync::records
