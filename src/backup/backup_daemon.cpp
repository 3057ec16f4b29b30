#include "backup/backup_daemon.hpp"
#include "backup/checksum.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <string_view>

namespace fs = std::filesystem;

namespace litesync {

namespace {

constexpr const char* kArtifactExtension = ".db";
constexpr const char* kPartialSuffix = ".partial";
constexpr size_t kTimestampLength = 19;   // YYYYmmdd_HHMMSS_mmm

std::chrono::system_clock::time_point file_mtime(const fs::path& file) {
    std::error_code ec;
    const auto ftime = fs::last_write_time(file, ec);
    if (ec) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

} // anonymous namespace

BackupDaemon::BackupDaemon(std::shared_ptr<ConnectionPool> primary_pool,
                           std::shared_ptr<IConnectionFactory> verify_factory,
                           BackupConfig config)
    : primary_pool_(std::move(primary_pool)),
      verify_factory_(std::move(verify_factory)),
      config_(std::move(config)),
      task_("Backup daemon", config_.interval, [this] {
          // Failures are logged and counted inside; the next tick retries
          (void)trigger_backup();
      }) {}

BackupDaemon::~BackupDaemon() {
    stop();
}

void BackupDaemon::start() {
    if (!config_.enabled) {
        utils::log::info("Backup daemon disabled; manual backups only");
        return;
    }
    std::error_code ec;
    fs::create_directories(config_.dir, ec);
    if (ec) {
        utils::log::warn(std::format("Cannot create backup dir {}: {}", config_.dir, ec.message()));
    }
    task_.start();
}

void BackupDaemon::stop() {
    task_.stop();
}

std::string BackupDaemon::archive_dir() const {
    return (fs::path(config_.dir) / "archive").string();
}

Result<BackupArtifact> BackupDaemon::trigger_backup() {
    auto artifact = snapshot();
    const auto report = sweep_retention();
    if (report.archived > 0 || report.deleted > 0) {
        utils::log::info(std::format("Backup retention: {} archived, {} deleted",
            report.archived, report.deleted));
    }
    if (artifact.is_ok()) {
        const auto& a = artifact.value();
        utils::log::info(std::format("Backup metrics: Size={:.2f}MB, Path={}",
            static_cast<double>(a.size_bytes) / (1024.0 * 1024.0), a.path));
    }
    return artifact;
}

Result<BackupArtifact> BackupDaemon::snapshot() {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);

    const auto fail = [this](std::string message) {
        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            ++stats_.failures;
        }
        utils::log::error(std::format("Backup failed: {}", message));
        return Result<BackupArtifact>::error(ErrorCategory::BACKUP_FAILED, std::move(message));
    };

    std::error_code ec;
    fs::create_directories(config_.dir, ec);
    if (ec) {
        return fail(std::format("cannot create {}: {}", config_.dir, ec.message()));
    }

    const auto created = std::chrono::system_clock::now();
    const auto path = next_artifact_path(created);
    const auto partial = fs::path(path.string() + kPartialSuffix);
    fs::remove(partial, ec);

    {
        auto conn = primary_pool_->acquire(config_.acquire_timeout);
        if (conn.is_error()) {
            return fail(std::format("no primary connection: {}", conn.error_message()));
        }
        const auto error = conn.value()->get()->snapshot_to(partial.string());
        if (!error.empty()) {
            fs::remove(partial, ec);
            return fail(error);
        }
    }

    fs::rename(partial, path, ec);
    if (ec) {
        fs::remove(partial, ec);
        return fail(std::format("cannot move snapshot into place at {}", path.string()));
    }

    BackupArtifact artifact;
    artifact.path = path.string();
    artifact.created_at = created;
    artifact.size_bytes = fs::file_size(path, ec);
    if (ec) {
        return fail(std::format("cannot stat {}: {}", artifact.path, ec.message()));
    }

    auto digest = checksum::sha256_file(artifact.path);
    if (digest.is_error()) {
        return fail(digest.error_message());
    }
    artifact.sha256 = digest.value();
    auto sidecar = checksum::write_sidecar(artifact.path, artifact.sha256);
    if (sidecar.is_error()) {
        return fail(sidecar.error_message());
    }

    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        ++stats_.snapshots;
        stats_.last_backup_time = created;
    }
    utils::log::info(std::format("Backup created: {}", artifact.path));
    return Result<BackupArtifact>::ok(std::move(artifact));
}

fs::path BackupDaemon::next_artifact_path(std::chrono::system_clock::time_point created) const {
    const auto stem = std::format("{}_{}", config_.name, utils::format_sortable_timestamp(created));
    auto path = fs::path(config_.dir) / (stem + kArtifactExtension);
    for (int n = 1; fs::exists(path); ++n) {
        path = fs::path(config_.dir) / std::format("{}_{}{}", stem, n, kArtifactExtension);
    }
    return path;
}

std::optional<std::chrono::system_clock::time_point>
BackupDaemon::parse_artifact_time(const fs::path& file) const {
    if (file.extension() != kArtifactExtension) {
        return std::nullopt;
    }
    const auto stem = file.stem().string();
    const auto prefix = config_.name + "_";
    if (stem.size() < prefix.size() + kTimestampLength || !stem.starts_with(prefix)) {
        return std::nullopt;
    }

    // Optional collision counter after the timestamp: "_<n>"
    const auto rest = std::string_view(stem).substr(prefix.size() + kTimestampLength);
    if (!rest.empty()) {
        if (rest.size() < 2 || rest.front() != '_' ||
            !std::all_of(rest.begin() + 1, rest.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }
    }
    return utils::parse_sortable_timestamp(
        std::string_view(stem).substr(prefix.size(), kTimestampLength));
}

bool BackupDaemon::is_artifact(const fs::path& file) const {
    return file.extension() == kArtifactExtension &&
           file.filename().string().starts_with(config_.name + "_");
}

std::vector<BackupArtifact> BackupDaemon::list_dir(const fs::path& dir) const {
    std::vector<BackupArtifact> artifacts;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return artifacts;
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec) || !is_artifact(entry.path())) {
            continue;
        }
        BackupArtifact artifact;
        artifact.path = entry.path().string();
        artifact.created_at = parse_artifact_time(entry.path()).value_or(file_mtime(entry.path()));
        artifact.size_bytes = entry.file_size(ec);
        auto digest = checksum::read_sidecar(artifact.path);
        if (digest.is_ok()) {
            artifact.sha256 = digest.value();
        }
        artifacts.push_back(std::move(artifact));
    }

    std::sort(artifacts.begin(), artifacts.end(), [](const auto& a, const auto& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.path > b.path;
    });
    return artifacts;
}

std::vector<BackupArtifact> BackupDaemon::list_backups() const {
    return list_dir(config_.dir);
}

std::vector<BackupArtifact> BackupDaemon::list_archived() const {
    return list_dir(archive_dir());
}

void BackupDaemon::remove_artifact(const fs::path& file) {
    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
        utils::log::error(std::format("Failed to remove old backup {}: {}", file.string(), ec.message()));
        return;
    }
    fs::remove(checksum::sidecar_path(file.string()), ec);
    utils::log::info(std::format("Removed old backup: {}", file.filename().string()));
}

bool BackupDaemon::move_artifact(const fs::path& file, const fs::path& dest_dir) {
    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    const auto dest = dest_dir / file.filename();
    fs::rename(file, dest, ec);
    if (ec) {
        utils::log::error(std::format("Failed to archive backup {}: {}", file.string(), ec.message()));
        return false;
    }
    const auto sidecar = fs::path(checksum::sidecar_path(file.string()));
    if (fs::exists(sidecar, ec)) {
        fs::rename(sidecar, dest_dir / sidecar.filename(), ec);
        if (ec) {
            utils::log::warn(std::format("Failed to archive checksum {}: {}",
                sidecar.string(), ec.message()));
        }
    }
    utils::log::info(std::format("Archived old backup: {}", file.filename().string()));
    return true;
}

RetentionReport BackupDaemon::sweep_retention(std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    RetentionReport report;

    const auto archive_after = std::chrono::hours{24} * config_.retention_days;
    const auto delete_after = archive_after * 2;

    for (const auto& artifact : list_backups()) {
        const auto age = now - artifact.created_at;
        if (age > delete_after) {
            remove_artifact(artifact.path);
            ++report.deleted;
        } else if (age > archive_after) {
            if (move_artifact(artifact.path, archive_dir())) {
                ++report.archived;
            }
        }
    }
    for (const auto& artifact : list_archived()) {
        if (now - artifact.created_at > delete_after) {
            remove_artifact(artifact.path);
            ++report.deleted;
        }
    }

    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    stats_.archived += report.archived;
    stats_.deleted += report.deleted;
    return report;
}

Result<void> BackupDaemon::verify_backup(const std::string& path) {
    auto expected = checksum::read_sidecar(path);
    if (expected.is_error()) {
        return Result<void>::error(ErrorCategory::BACKUP_FAILED, expected.error_message());
    }
    auto actual = checksum::sha256_file(path);
    if (actual.is_error()) {
        return Result<void>::error(ErrorCategory::BACKUP_FAILED, actual.error_message());
    }
    if (actual.value() != expected.value()) {
        return Result<void>::error(ErrorCategory::BACKUP_FAILED,
            std::format("Checksum mismatch for {}", path));
    }

    auto conn = verify_factory_->create(path);
    if (!conn) {
        return Result<void>::error(ErrorCategory::BACKUP_FAILED,
            std::format("Cannot open {}", path));
    }
    const auto check = conn->execute("PRAGMA integrity_check");
    conn->close();
    if (!check.success || check.rows.empty() || check.rows[0].empty() || check.rows[0][0] != "ok") {
        return Result<void>::error(ErrorCategory::BACKUP_FAILED,
            std::format("Integrity check failed for {}: {}", path,
                check.success && !check.rows.empty() && !check.rows[0].empty()
                    ? check.rows[0][0] : check.error_message));
    }
    return Result<void>::ok();
}

BackupStats BackupDaemon::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace litesync
