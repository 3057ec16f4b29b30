#include "replication/replication_daemon.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace litesync {

ReplicationDaemon::ReplicationDaemon(std::shared_ptr<ChangeExtractor> extractor,
                                     std::shared_ptr<ReplicaSet> replicas,
                                     ReplicationDaemonConfig config)
    : extractor_(std::move(extractor)),
      replicas_(std::move(replicas)),
      config_(config),
      task_("Replication daemon", config.interval, [this] {
          // Errors are already logged and counted by run_cycle
          (void)run_cycle();
      }) {}

ReplicationDaemon::~ReplicationDaemon() {
    stop();
}

void ReplicationDaemon::start() {
    task_.start();
}

void ReplicationDaemon::stop() {
    task_.stop();
}

Result<CycleReport> ReplicationDaemon::run_cycle() {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    CycleReport report;

    state_.store(ReplicationState::EXTRACTING);
    const Timestamp cutoff = replicas_->min_watermark();
    auto changes = extractor_->changes_since(cutoff);
    if (changes.is_error()) {
        state_.store(ReplicationState::IDLE);
        extract_failures_.fetch_add(1, std::memory_order_relaxed);
        cycles_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Replication: extraction since {} failed: {}",
            cutoff, changes.error_message()));
        return Result<CycleReport>::error(changes.error_category(), changes.error_message());
    }

    const auto& rows = changes.value();
    report.rows_extracted = rows.size();

    state_.store(ReplicationState::PUSHING);
    for (size_t i = 0; i < replicas_->size(); ++i) {
        const Timestamp watermark = replicas_->watermark(i);

        // rows are sorted by modified_at, so the replica's slice is a suffix
        const auto first = std::partition_point(rows.begin(), rows.end(),
            [watermark](const Record& r) { return r.modified_at <= watermark; });
        const std::vector<Record> batch(first, rows.end());

        utils::Timer timer;
        auto applied = replicas_->apply_batch(i, batch);
        const auto elapsed = timer.elapsed_ms();

        if (applied.is_error()) {
            ++report.replicas_failed;
            push_failures_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        ++report.replicas_synced;
        report.rows_applied += batch.size();
        rows_applied_.fetch_add(batch.size(), std::memory_order_relaxed);

        if (elapsed > config_.latency_warn) {
            utils::log::warn(std::format("Replication to {} took {}ms (target {}ms)",
                replicas_->id(i), elapsed.count(), config_.latency_warn.count()));
        }
        if (!batch.empty()) {
            utils::log::debug(std::format("Replicated {} rows to {} (watermark {})",
                batch.size(), replicas_->id(i), applied.value()));
        }
    }

    state_.store(ReplicationState::IDLE);
    cycles_.fetch_add(1, std::memory_order_relaxed);
    return Result<CycleReport>::ok(report);
}

ReplicationStats ReplicationDaemon::stats() const {
    ReplicationStats s;
    s.cycles = cycles_.load(std::memory_order_relaxed);
    s.rows_applied = rows_applied_.load(std::memory_order_relaxed);
    s.push_failures = push_failures_.load(std::memory_order_relaxed);
    s.extract_failures = extract_failures_.load(std::memory_order_relaxed);
    s.state = state_.load();
    return s;
}

} // namespace litesync
