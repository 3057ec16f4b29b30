#pragma once

#include "core/types.hpp"
#include <nlohmann/json.hpp>

namespace litesync {

// nlohmann ADL hooks for the observability payloads

void to_json(nlohmann::json& j, const ReplicaWatermark& w);
void to_json(nlohmann::json& j, const HealthSnapshot& h);
void to_json(nlohmann::json& j, const BackupArtifact& a);
void to_json(nlohmann::json& j, const StoreProbe& p);
void to_json(nlohmann::json& j, const DeepHealth& h);

} // namespace litesync
