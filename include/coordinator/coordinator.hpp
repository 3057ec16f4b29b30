#pragma once

#include "admission/write_rate_limiter.hpp"
#include "backup/backup_daemon.hpp"
#include "config/coordinator_config.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "db/connection_pool.hpp"
#include "replication/change_extractor.hpp"
#include "replication/read_router.hpp"
#include "replication/replication_daemon.hpp"
#include "store/primary_store.hpp"
#include "store/replica_set.hpp"
#include <atomic>
#include <chrono>
#include <memory>

namespace litesync {

/**
 * @brief Owns the primary, the replicas, both daemons and the write gate
 *
 * Construct once through create() and pass by reference. Request threads
 * only touch get_connection(), record_write()/write() and the health
 * accessors; the daemons run on their own threads after start().
 *
 * shutdown() (also run by the destructor) stops the daemons, wakes
 * throttled writers and closes every pool, so blocked acquires fail
 * with POOL_CLOSED.
 */
class Coordinator {
    struct Token { explicit Token() = default; };

public:
    /**
     * @brief Open the primary and every replica, recover watermarks
     * @return coordinator, or STORE_ERROR if the primary cannot be used
     */
    [[nodiscard]] static Result<std::unique_ptr<Coordinator>> create(CoordinatorConfig config);

    Coordinator(Token, CoordinatorConfig config);

    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    /**
     * @brief Start the replication and backup loops
     */
    void start();

    void shutdown();

    /**
     * @brief Connection for a caller
     * @param read_only true routes to the freshest replica (primary fallback)
     */
    [[nodiscard]] Result<ConnectionPool::Handle> get_connection(bool read_only);

    /**
     * @brief Count one committed write; may delay the caller
     * @return true if throttled
     */
    bool record_write();

    /**
     * @brief Admit and upsert one record on the primary
     *
     * Invalid drafts are rejected before admission and never counted.
     * The count is taken at admission, ahead of the write, so a write that
     * then fails with STORE_ERROR has still been counted.
     */
    [[nodiscard]] Result<Record> write(const RecordDraft& draft);

    [[nodiscard]] Result<BackupArtifact> trigger_backup();

    [[nodiscard]] Result<CycleReport> run_replication_cycle();

    /**
     * @brief Cheap observability snapshot; no side effects
     */
    [[nodiscard]] HealthSnapshot health_snapshot() const;

    /**
     * @brief Row-count probe of the primary and every replica
     */
    [[nodiscard]] DeepHealth deep_health();

    [[nodiscard]] const CoordinatorConfig& config() const { return config_; }
    [[nodiscard]] PrimaryStore& primary() { return *primary_; }
    [[nodiscard]] ReplicaSet& replicas() { return *replicas_; }
    [[nodiscard]] ReadRouter& router() { return *router_; }
    [[nodiscard]] ReplicationDaemon& replication() { return *replication_; }
    [[nodiscard]] BackupDaemon& backups() { return *backups_; }
    [[nodiscard]] WriteRateLimiter& write_limiter() { return write_limiter_; }

private:
    [[nodiscard]] Result<void> initialize();

    CoordinatorConfig config_;
    std::chrono::milliseconds acquire_timeout_;

    std::shared_ptr<PrimaryStore> primary_;
    std::shared_ptr<ReplicaSet> replicas_;
    std::unique_ptr<ReadRouter> router_;
    std::unique_ptr<ReplicationDaemon> replication_;
    std::unique_ptr<BackupDaemon> backups_;
    WriteRateLimiter write_limiter_;

    std::atomic<bool> started_{false};
    std::atomic<bool> shut_down_{false};
};

} // namespace litesync
