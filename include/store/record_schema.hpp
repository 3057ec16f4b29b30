#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <optional>
#include <string>
#include <vector>

namespace litesync::records {

/// Replicated table; identical on the primary and every replica
inline constexpr const char* kTableName = "records";

/**
 * @brief Create the records table and its watermark index if missing
 */
[[nodiscard]] Result<void> ensure_schema(IDbConnection& conn);

/**
 * @brief Default optional fields and reject invalid drafts
 *
 * collection defaults to "default", modified_at to now_ms.
 * Empty id or negative modified_at -> INVALID_RECORD.
 */
[[nodiscard]] Result<Record> normalize(const RecordDraft& draft, Timestamp now_ms);

/**
 * @brief Insert-or-replace by (collection, id)
 */
[[nodiscard]] Result<void> upsert(IDbConnection& conn, const Record& record);

/**
 * @brief Rows with modified_at > cutoff, ordered by (modified_at, id, collection)
 */
[[nodiscard]] Result<std::vector<Record>> select_since(IDbConnection& conn, Timestamp cutoff);

[[nodiscard]] Result<std::optional<Record>> find(
    IDbConnection& conn, const std::string& collection, const std::string& id);

/// Newest watermark in the store, 0 when empty
[[nodiscard]] Result<Timestamp> max_modified_at(IDbConnection& conn);

[[nodiscard]] Result<int64_t> count(IDbConnection& conn);

} // namespace litesync::records
