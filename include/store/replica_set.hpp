#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/connection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace litesync {

struct ReplicaSpec {
    std::string id;
    std::string path;
};

/**
 * @brief Lightweight per-replica view used by the read router
 */
struct RoutingCandidate {
    size_t index = 0;
    Timestamp watermark = 0;
    bool available = false;
    std::optional<std::chrono::steady_clock::time_point> last_sync;
};

/**
 * @brief N read replicas, each with an independent watermark
 *
 * Every replica has:
 * - a writer connection, used only to apply replication batches
 * - a read pool opened query_only, handed to read callers
 * - a descriptor (watermark, availability, failure count)
 *
 * Descriptors are guarded by one shared_mutex: the replication daemon takes
 * it exclusively to update a single replica after its push, readers take it
 * shared. Batches to different replicas never hold a common lock while
 * writing.
 */
class ReplicaSet {
public:
    /**
     * @param specs Replica ids and file paths
     * @param read_pool_size Connections per replica read pool
     * @param writer_factory Opens writable replica connections
     * @param reader_factory Opens query-only replica connections
     */
    ReplicaSet(std::vector<ReplicaSpec> specs,
               size_t read_pool_size,
               std::shared_ptr<IConnectionFactory> writer_factory,
               std::shared_ptr<IConnectionFactory> reader_factory);

    ~ReplicaSet();

    ReplicaSet(const ReplicaSet&) = delete;
    ReplicaSet& operator=(const ReplicaSet&) = delete;

    /**
     * @brief Open every replica, create the schema, recover watermarks
     *
     * A replica that cannot be opened is left unavailable and retried by
     * the next push; this never fails the whole set.
     */
    void initialize();

    /**
     * @brief Apply a batch to one replica in a single transaction
     *
     * On success the watermark advances to max(current, batch max).
     * On failure the watermark is untouched and the replica is marked
     * unavailable.
     * @return new watermark, or REPLICA_UNAVAILABLE
     */
    [[nodiscard]] Result<Timestamp> apply_batch(size_t index, const std::vector<Record>& batch);

    [[nodiscard]] size_t size() const { return replicas_.size(); }

    [[nodiscard]] Timestamp watermark(size_t index) const;

    [[nodiscard]] Timestamp min_watermark() const;

    [[nodiscard]] ReplicaStatus status(size_t index) const;

    [[nodiscard]] std::vector<ReplicaStatus> statuses() const;

    [[nodiscard]] std::vector<RoutingCandidate> routing_candidates() const;

    [[nodiscard]] const std::shared_ptr<ConnectionPool>& read_pool(size_t index) const;

    [[nodiscard]] const std::string& id(size_t index) const;

    /**
     * @brief Close read pools and writer connections
     */
    void close();

private:
    struct Replica {
        ReplicaSpec spec;
        std::shared_ptr<ConnectionPool> read_pool;

        std::mutex writer_mutex;
        std::unique_ptr<IDbConnection> writer;

        // Guarded by ReplicaSet::state_mutex_
        Timestamp watermark = 0;
        bool available = false;
        uint32_t consecutive_failures = 0;
        std::string last_error;
        std::optional<std::chrono::system_clock::time_point> last_sync_time;
        std::optional<std::chrono::steady_clock::time_point> last_sync_steady;
    };

    /**
     * @brief Open (or reopen) a replica's writer; caller holds writer_mutex
     */
    [[nodiscard]] Result<void> ensure_writer(Replica& replica);

    void record_success(Replica& replica, Timestamp batch_max);
    void record_failure(Replica& replica, const std::string& error);

    std::vector<std::unique_ptr<Replica>> replicas_;
    size_t read_pool_size_;
    std::shared_ptr<IConnectionFactory> writer_factory_;
    std::shared_ptr<IConnectionFactory> reader_factory_;
    mutable std::shared_mutex state_mutex_;
};

} // namespace litesync
