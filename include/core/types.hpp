#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace litesync {

// ============================================================================
// Records
// ============================================================================

/// Watermark unit: milliseconds since the Unix epoch when stamped locally
using Timestamp = int64_t;

inline constexpr const char* kDefaultCollection = "default";

/**
 * @brief A replicated row
 *
 * Identity is (collection, id). The coordinator never looks inside payload.
 */
struct Record {
    std::string collection = kDefaultCollection;
    std::string id;
    Timestamp modified_at = 0;
    std::string payload;

    bool operator==(const Record&) const = default;
};

/**
 * @brief Write-side input; optional fields are defaulted at the store boundary
 */
struct RecordDraft {
    std::optional<std::string> collection;
    std::string id;
    std::optional<Timestamp> modified_at;
    std::string payload;
};

// ============================================================================
// Replication
// ============================================================================

enum class ReplicationState {
    IDLE,
    EXTRACTING,
    PUSHING
};

inline constexpr const char* replication_state_name(ReplicationState state) {
    switch (state) {
        case ReplicationState::IDLE:       return "idle";
        case ReplicationState::EXTRACTING: return "extracting";
        case ReplicationState::PUSHING:    return "pushing";
    }
    return "unknown";
}

/**
 * @brief Point-in-time copy of one replica's descriptor
 */
struct ReplicaStatus {
    std::string id;
    std::string path;
    Timestamp last_sync_watermark = 0;
    bool available = false;
    uint32_t consecutive_failures = 0;
    std::string last_error;
    std::optional<std::chrono::system_clock::time_point> last_sync_time;
};

// ============================================================================
// Backups
// ============================================================================

struct BackupArtifact {
    std::string path;
    std::chrono::system_clock::time_point created_at{};
    uint64_t size_bytes = 0;
    std::string sha256;
};

// ============================================================================
// Observability
// ============================================================================

struct ReplicaWatermark {
    std::string replica_id;
    Timestamp watermark = 0;
    bool available = false;
};

struct HealthSnapshot {
    size_t replica_count = 0;
    std::vector<ReplicaWatermark> replica_watermarks;
    uint64_t current_write_rate = 0;
    size_t backup_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_backup_time;
};

/**
 * @brief Result of probing one store with a row count
 */
struct StoreProbe {
    std::string name;
    bool passed = false;
    int64_t record_count = 0;
    std::string error;
};

struct DeepHealth {
    bool healthy = false;
    StoreProbe primary;
    std::vector<StoreProbe> replicas;
    size_t backup_count = 0;
    uint64_t current_write_rate = 0;
    uint32_t max_write_rate = 0;
};

} // namespace litesync
