#pragma once

#include "core/error.hpp"
#include "core/periodic_task.hpp"
#include "core/types.hpp"
#include "replication/change_extractor.hpp"
#include "store/replica_set.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

namespace litesync {

struct ReplicationDaemonConfig {
    std::chrono::milliseconds interval{5000};
    std::chrono::milliseconds latency_warn{200};
};

/**
 * @brief Outcome of one replication cycle
 */
struct CycleReport {
    size_t rows_extracted = 0;
    size_t rows_applied = 0;
    size_t replicas_synced = 0;
    size_t replicas_failed = 0;
};

struct ReplicationStats {
    uint64_t cycles = 0;
    uint64_t rows_applied = 0;
    uint64_t push_failures = 0;
    uint64_t extract_failures = 0;
    ReplicationState state = ReplicationState::IDLE;
};

/**
 * @brief Background loop that keeps every replica caught up with the primary
 *
 * Per cycle: IDLE -> EXTRACTING -> PUSHING -> IDLE.
 * - Extraction runs once, from the lowest replica watermark
 * - Each replica gets only rows newer than its own watermark, applied in
 *   one transaction; its watermark advances on success only
 * - A failing replica is logged and skipped; the rest still sync
 *
 * Cycles are serialized: a manual run_cycle() waits for a running one.
 */
class ReplicationDaemon {
public:
    ReplicationDaemon(std::shared_ptr<ChangeExtractor> extractor,
                      std::shared_ptr<ReplicaSet> replicas,
                      ReplicationDaemonConfig config = {});

    ~ReplicationDaemon();

    ReplicationDaemon(const ReplicationDaemon&) = delete;
    ReplicationDaemon& operator=(const ReplicationDaemon&) = delete;

    /**
     * @brief Start the periodic loop (first cycle after one interval)
     */
    void start();

    /**
     * @brief Stop the loop; an in-flight cycle completes first
     */
    void stop();

    [[nodiscard]] bool is_running() const { return task_.is_running(); }

    /**
     * @brief Run one cycle synchronously
     * @return report, or the extraction error (push failures are not errors)
     */
    Result<CycleReport> run_cycle();

    [[nodiscard]] ReplicationState state() const { return state_.load(); }

    [[nodiscard]] ReplicationStats stats() const;

private:
    std::shared_ptr<ChangeExtractor> extractor_;
    std::shared_ptr<ReplicaSet> replicas_;
    ReplicationDaemonConfig config_;

    std::mutex cycle_mutex_;
    std::atomic<ReplicationState> state_{ReplicationState::IDLE};

    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> rows_applied_{0};
    std::atomic<uint64_t> push_failures_{0};
    std::atomic<uint64_t> extract_failures_{0};

    PeriodicTask task_;
};

} // namespace litesync
