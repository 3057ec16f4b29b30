#include "store/replica_set.hpp"
#include "store/record_schema.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <stdexcept>

namespace litesync {

ReplicaSet::ReplicaSet(std::vector<ReplicaSpec> specs,
                       size_t read_pool_size,
                       std::shared_ptr<IConnectionFactory> writer_factory,
                       std::shared_ptr<IConnectionFactory> reader_factory)
    : read_pool_size_(read_pool_size),
      writer_factory_(std::move(writer_factory)),
      reader_factory_(std::move(reader_factory)) {
    replicas_.reserve(specs.size());
    for (auto& spec : specs) {
        auto replica = std::make_unique<Replica>();
        replica->spec = std::move(spec);
        replicas_.push_back(std::move(replica));
    }
}

ReplicaSet::~ReplicaSet() {
    close();
}

void ReplicaSet::initialize() {
    for (auto& replica : replicas_) {
        std::error_code ec;
        const auto parent = std::filesystem::path(replica->spec.path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                utils::log::warn(std::format("Replica {}: cannot create {}: {}",
                    replica->spec.id, parent.string(), ec.message()));
            }
        }

        Timestamp recovered = 0;
        std::string error;
        {
            std::lock_guard<std::mutex> lock(replica->writer_mutex);
            auto opened = ensure_writer(*replica);
            if (opened.is_ok()) {
                auto max = records::max_modified_at(*replica->writer);
                if (max.is_ok()) {
                    recovered = max.value();
                } else {
                    error = max.error_message();
                }
            } else {
                error = opened.error_message();
            }
        }

        // The writer created the file and schema, so query_only readers can open it
        PoolConfig pool_config;
        pool_config.path = replica->spec.path;
        pool_config.pool_size = read_pool_size_;
        replica->read_pool = ConnectionPool::create(replica->spec.id, pool_config, reader_factory_);

        if (error.empty()) {
            std::unique_lock<std::shared_mutex> lock(state_mutex_);
            replica->watermark = recovered;
            replica->available = true;
            utils::log::info(std::format("Replica {} ready at {} (watermark {})",
                replica->spec.id, replica->spec.path, recovered));
        } else {
            record_failure(*replica, error);
        }
    }
}

Result<void> ReplicaSet::ensure_writer(Replica& replica) {
    if (replica.writer && replica.writer->is_connected()) {
        return Result<void>::ok();
    }
    replica.writer = writer_factory_->create(replica.spec.path);
    if (!replica.writer) {
        return Result<void>::error(ErrorCategory::REPLICA_UNAVAILABLE,
            std::format("Cannot open replica {} at {}", replica.spec.id, replica.spec.path));
    }
    auto schema = records::ensure_schema(*replica.writer);
    if (schema.is_error()) {
        replica.writer->close();
        replica.writer.reset();
        return Result<void>::error(ErrorCategory::REPLICA_UNAVAILABLE, schema.error_message());
    }
    return Result<void>::ok();
}

Result<Timestamp> ReplicaSet::apply_batch(size_t index, const std::vector<Record>& batch) {
    auto& replica = *replicas_.at(index);

    std::string error;
    Timestamp batch_max = 0;
    {
        std::lock_guard<std::mutex> lock(replica.writer_mutex);
        auto opened = ensure_writer(replica);
        if (opened.is_error()) {
            error = opened.error_message();
        } else if (batch.empty()) {
            if (!replica.writer->is_healthy("SELECT 1")) {
                error = "health check failed";
            }
        } else {
            auto& conn = *replica.writer;
            const auto begin = conn.execute("BEGIN IMMEDIATE");
            if (!begin.success) {
                error = std::format("BEGIN failed: {}", begin.error_message);
            } else {
                for (const auto& record : batch) {
                    auto written = records::upsert(conn, record);
                    if (written.is_error()) {
                        error = written.error_message();
                        break;
                    }
                    batch_max = std::max(batch_max, record.modified_at);
                }
                if (error.empty()) {
                    const auto commit = conn.execute("COMMIT");
                    if (!commit.success) {
                        error = std::format("COMMIT failed: {}", commit.error_message);
                    }
                }
                if (!error.empty()) {
                    const auto rollback = conn.execute("ROLLBACK");
                    if (!rollback.success) {
                        utils::log::warn(std::format("Replica {}: rollback failed: {}",
                            replica.spec.id, rollback.error_message));
                    }
                }
            }
        }

        // A failed writer is reopened from scratch on the next push
        if (!error.empty() && replica.writer) {
            replica.writer->close();
            replica.writer.reset();
        }
    }

    if (!error.empty()) {
        record_failure(replica, error);
        return Result<Timestamp>::error(ErrorCategory::REPLICA_UNAVAILABLE,
            std::format("Replica {}: {}", replica.spec.id, error));
    }

    record_success(replica, batch_max);
    return Result<Timestamp>::ok(watermark(index));
}

void ReplicaSet::record_success(Replica& replica, Timestamp batch_max) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (!replica.available) {
        utils::log::info(std::format("Replica {} is available again", replica.spec.id));
    }
    replica.watermark = std::max(replica.watermark, batch_max);
    replica.available = true;
    replica.consecutive_failures = 0;
    replica.last_error.clear();
    replica.last_sync_time = std::chrono::system_clock::now();
    replica.last_sync_steady = std::chrono::steady_clock::now();
}

void ReplicaSet::record_failure(Replica& replica, const std::string& error) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    replica.available = false;
    ++replica.consecutive_failures;
    replica.last_error = error;
    utils::log::error(std::format("Replica {} unavailable ({} consecutive failures): {}",
        replica.spec.id, replica.consecutive_failures, error));
}

Timestamp ReplicaSet::watermark(size_t index) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return replicas_.at(index)->watermark;
}

Timestamp ReplicaSet::min_watermark() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    if (replicas_.empty()) {
        return 0;
    }
    Timestamp min = replicas_.front()->watermark;
    for (const auto& replica : replicas_) {
        min = std::min(min, replica->watermark);
    }
    return min;
}

ReplicaStatus ReplicaSet::status(size_t index) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    const auto& replica = *replicas_.at(index);
    ReplicaStatus status;
    status.id = replica.spec.id;
    status.path = replica.spec.path;
    status.last_sync_watermark = replica.watermark;
    status.available = replica.available;
    status.consecutive_failures = replica.consecutive_failures;
    status.last_error = replica.last_error;
    status.last_sync_time = replica.last_sync_time;
    return status;
}

std::vector<ReplicaStatus> ReplicaSet::statuses() const {
    std::vector<ReplicaStatus> result;
    result.reserve(replicas_.size());
    for (size_t i = 0; i < replicas_.size(); ++i) {
        result.push_back(status(i));
    }
    return result;
}

std::vector<RoutingCandidate> ReplicaSet::routing_candidates() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    std::vector<RoutingCandidate> candidates;
    candidates.reserve(replicas_.size());
    for (size_t i = 0; i < replicas_.size(); ++i) {
        const auto& replica = *replicas_[i];
        candidates.push_back({i, replica.watermark,
                              replica.available && replica.read_pool != nullptr,
                              replica.last_sync_steady});
    }
    return candidates;
}

const std::shared_ptr<ConnectionPool>& ReplicaSet::read_pool(size_t index) const {
    const auto& pool = replicas_.at(index)->read_pool;
    if (!pool) {
        throw std::logic_error("ReplicaSet::read_pool called before initialize()");
    }
    return pool;
}

const std::string& ReplicaSet::id(size_t index) const {
    return replicas_.at(index)->spec.id;
}

void ReplicaSet::close() {
    for (auto& replica : replicas_) {
        if (replica->read_pool) {
            replica->read_pool->close();
        }
        std::lock_guard<std::mutex> lock(replica->writer_mutex);
        if (replica->writer) {
            replica->writer->close();
            replica->writer.reset();
        }
    }
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    for (auto& replica : replicas_) {
        replica->available = false;
    }
}

} // namespace litesync
