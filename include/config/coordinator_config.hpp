#pragma once

#include "admission/write_rate_limiter.hpp"
#include "backup/backup_daemon.hpp"
#include <cstdint>
#include <string>

namespace litesync {

// ============================================================================
// Store Config
// ============================================================================

struct StoreConfig {
    std::string path = "data/litesync.db";
    int64_t pool_size = 20;
    int64_t busy_timeout_ms = 5000;
    int64_t acquire_timeout_ms = 5000;
    std::string journal_mode = "WAL";
    std::string synchronous = "NORMAL";
    int64_t cache_size = 10000;
};

// ============================================================================
// Replication Config
// ============================================================================

struct ReplicationConfig {
    bool enabled = true;
    std::string replica_dir = "data";
    int64_t replicas = 3;
    int64_t interval_ms = 5000;
    int64_t pool_size = 4;
    int64_t latency_warn_ms = 200;
    int64_t stale_after_ms = 0;      // 0 = every available replica counts as fresh
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Everything the coordinator needs, one struct per TOML section
 */
struct CoordinatorConfig {
    StoreConfig store;
    ReplicationConfig replication;
    BackupConfig backup;
    WriteRateConfig write_rate;
    LoggingConfig logging;
};

} // namespace litesync
