#include "coordinator/coordinator.hpp"
#include "core/utils.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "store/record_schema.hpp"
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace litesync {

namespace {

SqliteOptions store_options(const StoreConfig& store) {
    SqliteOptions options;
    options.journal_mode = store.journal_mode;
    options.synchronous = store.synchronous;
    options.cache_size = store.cache_size;
    options.busy_timeout_ms = static_cast<uint32_t>(store.busy_timeout_ms);
    return options;
}

std::vector<ReplicaSpec> replica_specs(const CoordinatorConfig& config) {
    std::vector<ReplicaSpec> specs;
    const auto file_name = fs::path(config.store.path).filename();
    for (int64_t i = 1; i <= config.replication.replicas; ++i) {
        ReplicaSpec spec;
        spec.id = std::format("replica{}", i);
        spec.path = (fs::path(config.replication.replica_dir) / spec.id / file_name).string();
        specs.push_back(std::move(spec));
    }
    return specs;
}

} // anonymous namespace

Result<std::unique_ptr<Coordinator>> Coordinator::create(CoordinatorConfig config) {
    auto coordinator = std::make_unique<Coordinator>(Token{}, std::move(config));
    auto initialized = coordinator->initialize();
    if (initialized.is_error()) {
        return Result<std::unique_ptr<Coordinator>>::error(
            initialized.error_category(), initialized.error_message());
    }
    return Result<std::unique_ptr<Coordinator>>::ok(std::move(coordinator));
}

Coordinator::Coordinator(Token, CoordinatorConfig config)
    : config_(std::move(config)),
      acquire_timeout_(config_.store.acquire_timeout_ms),
      write_limiter_(config_.write_rate) {}

Coordinator::~Coordinator() {
    shutdown();
}

Result<void> Coordinator::initialize() {
    std::error_code ec;
    const auto primary_dir = fs::path(config_.store.path).parent_path();
    if (!primary_dir.empty()) {
        fs::create_directories(primary_dir, ec);
        if (ec) {
            return Result<void>::error(ErrorCategory::STORE_ERROR,
                std::format("Cannot create {}: {}", primary_dir.string(), ec.message()));
        }
    }

    const auto options = store_options(config_.store);
    auto writer_factory = std::make_shared<SqliteConnectionFactory>(options);

    auto reader_options = options;
    reader_options.query_only = true;
    auto reader_factory = std::make_shared<SqliteConnectionFactory>(reader_options);

    auto verify_options = options;
    verify_options.journal_mode.clear();
    verify_options.query_only = true;
    verify_options.create_if_missing = false;
    verify_options.mmap_size = 0;
    auto verify_factory = std::make_shared<SqliteConnectionFactory>(verify_options);

    PoolConfig primary_pool_config;
    primary_pool_config.path = config_.store.path;
    primary_pool_config.pool_size = static_cast<size_t>(config_.store.pool_size);
    auto primary_pool = ConnectionPool::create("primary", primary_pool_config, writer_factory);

    primary_ = std::make_shared<PrimaryStore>(primary_pool, acquire_timeout_);
    auto schema = primary_->initialize();
    if (schema.is_error()) {
        primary_pool->close();
        return schema;
    }

    replicas_ = std::make_shared<ReplicaSet>(
        replica_specs(config_),
        static_cast<size_t>(config_.replication.pool_size),
        writer_factory, reader_factory);
    replicas_->initialize();

    router_ = std::make_unique<ReadRouter>(
        replicas_, std::chrono::milliseconds(config_.replication.stale_after_ms));

    ReplicationDaemonConfig replication_config;
    replication_config.interval = std::chrono::milliseconds(config_.replication.interval_ms);
    replication_config.latency_warn = std::chrono::milliseconds(config_.replication.latency_warn_ms);
    replication_ = std::make_unique<ReplicationDaemon>(
        std::make_shared<ChangeExtractor>(primary_), replicas_, replication_config);

    backups_ = std::make_unique<BackupDaemon>(primary_pool, verify_factory, config_.backup);

    utils::log::info(std::format("Coordinator ready: primary {}, {} replicas, backups in {}",
        config_.store.path, replicas_->size(), config_.backup.dir));
    return Result<void>::ok();
}

void Coordinator::start() {
    if (started_.exchange(true)) return;
    if (config_.replication.enabled && replicas_->size() > 0) {
        replication_->start();
    } else {
        utils::log::info("Replication disabled");
    }
    backups_->start();
}

void Coordinator::shutdown() {
    if (shut_down_.exchange(true)) return;
    utils::log::info("Coordinator shutting down");

    if (replication_) replication_->stop();
    if (backups_) backups_->stop();
    write_limiter_.shutdown();
    if (replicas_) replicas_->close();
    if (primary_) primary_->pool()->close();
}

Result<ConnectionPool::Handle> Coordinator::get_connection(bool read_only) {
    if (read_only) {
        if (const auto index = router_->route_read()) {
            auto conn = replicas_->read_pool(*index)->acquire(acquire_timeout_);
            if (conn.is_ok()) {
                return conn;
            }
            utils::log::debug(std::format("Read on {} fell back to primary: {}",
                replicas_->id(*index), conn.error_message()));
        }
    }
    return primary_->pool()->acquire(acquire_timeout_);
}

bool Coordinator::record_write() {
    return write_limiter_.admit_write();
}

Result<Record> Coordinator::write(const RecordDraft& draft) {
    auto checked = records::normalize(draft, 0);
    if (checked.is_error()) {
        return checked;
    }
    record_write();
    return primary_->put(draft);
}

Result<BackupArtifact> Coordinator::trigger_backup() {
    return backups_->trigger_backup();
}

Result<CycleReport> Coordinator::run_replication_cycle() {
    return replication_->run_cycle();
}

HealthSnapshot Coordinator::health_snapshot() const {
    HealthSnapshot snapshot;
    snapshot.replica_count = replicas_->size();
    for (const auto& status : replicas_->statuses()) {
        snapshot.replica_watermarks.push_back(
            {status.id, status.last_sync_watermark, status.available});
    }
    snapshot.current_write_rate = write_limiter_.current_rate();

    const auto artifacts = backups_->list_backups();
    snapshot.backup_count = artifacts.size();
    if (!artifacts.empty()) {
        snapshot.last_backup_time = artifacts.front().created_at;
    } else {
        snapshot.last_backup_time = backups_->stats().last_backup_time;
    }
    return snapshot;
}

DeepHealth Coordinator::deep_health() {
    DeepHealth health;

    health.primary.name = "primary";
    auto primary_count = primary_->record_count();
    if (primary_count.is_ok()) {
        health.primary.passed = true;
        health.primary.record_count = primary_count.value();
    } else {
        health.primary.error = primary_count.error_message();
    }

    for (size_t i = 0; i < replicas_->size(); ++i) {
        StoreProbe probe;
        probe.name = replicas_->id(i);
        auto conn = replicas_->read_pool(i)->acquire(acquire_timeout_);
        if (conn.is_error()) {
            probe.error = conn.error_message();
        } else {
            auto count = records::count(*conn.value()->get());
            if (count.is_ok()) {
                probe.passed = true;
                probe.record_count = count.value();
            } else {
                probe.error = count.error_message();
            }
        }
        health.replicas.push_back(std::move(probe));
    }

    health.backup_count = backups_->list_backups().size();
    health.current_write_rate = write_limiter_.current_rate();
    health.max_write_rate = write_limiter_.max_rate();
    health.healthy = health.primary.passed;
    return health;
}

} // namespace litesync
