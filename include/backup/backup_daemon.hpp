#pragma once

#include "core/error.hpp"
#include "core/periodic_task.hpp"
#include "core/types.hpp"
#include "db/connection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace litesync {

struct BackupConfig {
    bool enabled = true;                        // periodic loop only
    std::string dir = "backups";
    std::string name = "litesync";              // artifact file name prefix
    std::chrono::seconds interval{60};
    uint32_t retention_days = 30;
    std::chrono::milliseconds acquire_timeout{5000};
};

struct BackupStats {
    uint64_t snapshots = 0;
    uint64_t failures = 0;
    uint64_t archived = 0;
    uint64_t deleted = 0;
    std::optional<std::chrono::system_clock::time_point> last_backup_time;
};

struct RetentionReport {
    size_t archived = 0;
    size_t deleted = 0;
};

/**
 * @brief Periodic point-in-time snapshots of the primary with retention
 *
 * Artifacts live at <dir>/<name>_<YYYYmmdd_HHMMSS_mmm>.db with a
 * "<artifact>.sha256" sidecar. Retention, measured from the time in the
 * file name:
 * - older than retention_days      -> moved to <dir>/archive/
 * - older than 2 x retention_days  -> deleted (main dir or archive)
 *
 * A failed tick is logged and counted; the next tick tries again.
 * Snapshots are serialized between the loop and manual triggers.
 */
class BackupDaemon {
public:
    /**
     * @param primary_pool Pool the snapshots are read from
     * @param verify_factory Opens artifacts for integrity checks
     * @param config Backup settings
     */
    BackupDaemon(std::shared_ptr<ConnectionPool> primary_pool,
                 std::shared_ptr<IConnectionFactory> verify_factory,
                 BackupConfig config);

    ~BackupDaemon();

    BackupDaemon(const BackupDaemon&) = delete;
    BackupDaemon& operator=(const BackupDaemon&) = delete;

    /**
     * @brief Start the periodic loop (no-op when disabled)
     */
    void start();

    void stop();

    [[nodiscard]] bool is_running() const { return task_.is_running(); }

    /**
     * @brief One full tick: snapshot, retention sweep, metrics
     */
    [[nodiscard]] Result<BackupArtifact> trigger_backup();

    /**
     * @brief Write one artifact and its sidecar
     */
    [[nodiscard]] Result<BackupArtifact> snapshot();

    /**
     * @brief Archive and delete artifacts by age relative to now
     */
    RetentionReport sweep_retention(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /**
     * @brief Live (non-archived) artifacts, newest first
     */
    [[nodiscard]] std::vector<BackupArtifact> list_backups() const;

    /**
     * @brief Archived artifacts, newest first
     */
    [[nodiscard]] std::vector<BackupArtifact> list_archived() const;

    /**
     * @brief Check the sidecar digest and run PRAGMA integrity_check
     */
    [[nodiscard]] Result<void> verify_backup(const std::string& path);

    [[nodiscard]] BackupStats stats() const;

    [[nodiscard]] std::string archive_dir() const;

    /**
     * @brief Creation time encoded in an artifact file name
     * @return nullopt if the name does not follow <name>_<timestamp>[_n].db
     */
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point>
    parse_artifact_time(const std::filesystem::path& file) const;

private:
    [[nodiscard]] std::vector<BackupArtifact> list_dir(const std::filesystem::path& dir) const;
    [[nodiscard]] std::filesystem::path next_artifact_path(
        std::chrono::system_clock::time_point created) const;
    [[nodiscard]] bool is_artifact(const std::filesystem::path& file) const;

    void remove_artifact(const std::filesystem::path& file);
    bool move_artifact(const std::filesystem::path& file, const std::filesystem::path& dest_dir);

    std::shared_ptr<ConnectionPool> primary_pool_;
    std::shared_ptr<IConnectionFactory> verify_factory_;
    BackupConfig config_;

    std::mutex snapshot_mutex_;

    mutable std::mutex stats_mutex_;
    BackupStats stats_;

    PeriodicTask task_;
};

} // namespace litesync
