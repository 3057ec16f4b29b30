#include "coordinator/health_json.hpp"
#include "core/utils.hpp"

namespace litesync {

void to_json(nlohmann::json& j, const ReplicaWatermark& w) {
    j = nlohmann::json{
        {"replica_id", w.replica_id},
        {"watermark", w.watermark},
        {"available", w.available},
    };
}

void to_json(nlohmann::json& j, const HealthSnapshot& h) {
    j = nlohmann::json{
        {"replica_count", h.replica_count},
        {"replica_watermarks", h.replica_watermarks},
        {"current_write_rate", h.current_write_rate},
        {"backup_count", h.backup_count},
        {"last_backup_time", nullptr},
    };
    if (h.last_backup_time) {
        j["last_backup_time"] = utils::format_timestamp(*h.last_backup_time);
    }
}

void to_json(nlohmann::json& j, const BackupArtifact& a) {
    j = nlohmann::json{
        {"path", a.path},
        {"created_at", utils::format_timestamp(a.created_at)},
        {"size_bytes", a.size_bytes},
        {"size_mb", static_cast<double>(a.size_bytes) / (1024.0 * 1024.0)},
        {"sha256", a.sha256},
    };
}

void to_json(nlohmann::json& j, const StoreProbe& p) {
    j = nlohmann::json{
        {"name", p.name},
        {"status", p.passed ? "passed" : "failed"},
    };
    if (p.passed) {
        j["record_count"] = p.record_count;
    } else {
        j["error"] = p.error;
    }
}

void to_json(nlohmann::json& j, const DeepHealth& h) {
    j = nlohmann::json{
        {"status", h.healthy ? "healthy" : "unhealthy"},
        {"primary", h.primary},
        {"replicas", h.replicas},
        {"backup_count", h.backup_count},
        {"current_write_rate", h.current_write_rate},
        {"max_write_rate", h.max_write_rate},
    };
}

} // namespace litesync
