#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <format>
#include <stdexcept>
#include <algorithm>

using namespace std::string_literals;

namespace litesync {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

// Every string value, nested tables and arrays included, may use ${VAR};
// unset variables expand to empty

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

bool one_of(const std::string& value, std::initializer_list<const char*> allowed) {
    const std::string upper = [&] {
        std::string s = value;
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }();
    return std::any_of(allowed.begin(), allowed.end(),
                       [&](const char* a) { return upper == a; });
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

StoreConfig ConfigLoader::extract_store(const toml::table& root) {
    StoreConfig cfg;
    const auto* store = root["store"].as_table();
    if (!store) return cfg;
    const auto& s = *store;

    cfg.path = s["path"].value_or(cfg.path);
    cfg.pool_size = s["pool_size"].value_or(cfg.pool_size);
    cfg.busy_timeout_ms = s["busy_timeout_ms"].value_or(cfg.busy_timeout_ms);
    cfg.acquire_timeout_ms = s["acquire_timeout_ms"].value_or(cfg.acquire_timeout_ms);
    cfg.journal_mode = s["journal_mode"].value_or(cfg.journal_mode);
    cfg.synchronous = s["synchronous"].value_or(cfg.synchronous);
    cfg.cache_size = s["cache_size"].value_or(cfg.cache_size);
    return cfg;
}

ReplicationConfig ConfigLoader::extract_replication(const toml::table& root) {
    ReplicationConfig cfg;
    const auto* replication = root["replication"].as_table();
    if (!replication) return cfg;
    const auto& r = *replication;

    cfg.enabled = r["enabled"].value_or(cfg.enabled);
    cfg.replica_dir = r["replica_dir"].value_or(cfg.replica_dir);
    cfg.replicas = r["replicas"].value_or(cfg.replicas);
    cfg.interval_ms = r["interval_ms"].value_or(cfg.interval_ms);
    cfg.pool_size = r["pool_size"].value_or(cfg.pool_size);
    cfg.latency_warn_ms = r["latency_warn_ms"].value_or(cfg.latency_warn_ms);
    cfg.stale_after_ms = r["stale_after_ms"].value_or(cfg.stale_after_ms);
    return cfg;
}

BackupConfig ConfigLoader::extract_backup(const toml::table& root) {
    BackupConfig cfg;
    const auto* backup = root["backup"].as_table();
    if (!backup) return cfg;
    const auto& b = *backup;

    cfg.enabled = b["enabled"].value_or(cfg.enabled);
    cfg.dir = b["dir"].value_or(cfg.dir);
    cfg.name = b["name"].value_or(cfg.name);
    cfg.interval = std::chrono::seconds(b["interval_seconds"].value_or(int64_t{60}));
    const int64_t retention = b["retention_days"].value_or(int64_t{30});
    cfg.retention_days = utils::in_range<1, 36500>(retention) ? static_cast<uint32_t>(retention) : 0;
    return cfg;
}

WriteRateConfig ConfigLoader::extract_write_rate(const toml::table& root) {
    WriteRateConfig cfg;
    const auto* write_rate = root["write_rate"].as_table();
    if (!write_rate) return cfg;
    const auto& w = *write_rate;

    const int64_t max = w["max_writes_per_second"].value_or(int64_t{95});
    cfg.max_writes_per_second = utils::in_range<1, 1000000>(max) ? static_cast<uint32_t>(max) : 0;
    cfg.throttle_backoff = std::chrono::milliseconds(w["throttle_backoff_ms"].value_or(int64_t{10}));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

CoordinatorConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    CoordinatorConfig config;
    config.store = extract_store(tbl);
    config.replication = extract_replication(tbl);
    config.backup = extract_backup(tbl);
    config.write_rate = extract_write_rate(tbl);
    config.logging = extract_logging(tbl);
    config.backup.acquire_timeout = std::chrono::milliseconds(config.store.acquire_timeout_ms);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(CoordinatorConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const CoordinatorConfig& config) {
    std::vector<std::string> errors;

    const auto& store = config.store;
    if (store.path.empty()) {
        errors.push_back("store.path must not be empty");
    }
    if (!utils::in_range<1, 1024>(store.pool_size)) {
        errors.push_back(std::format("store.pool_size must be 1-1024, got {}", store.pool_size));
    }
    if (!utils::in_range<0, 600000>(store.busy_timeout_ms)) {
        errors.push_back(std::format("store.busy_timeout_ms must be 0-600000, got {}",
                                     store.busy_timeout_ms));
    }
    if (!utils::in_range<1, 600000>(store.acquire_timeout_ms)) {
        errors.push_back(std::format("store.acquire_timeout_ms must be 1-600000, got {}",
                                     store.acquire_timeout_ms));
    }
    if (!one_of(store.journal_mode, {"DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"})) {
        errors.push_back(std::format("store.journal_mode '{}' is not a SQLite journal mode",
                                     store.journal_mode));
    }
    if (!one_of(store.synchronous, {"OFF", "NORMAL", "FULL", "EXTRA"})) {
        errors.push_back(std::format("store.synchronous '{}' must be OFF, NORMAL, FULL or EXTRA",
                                     store.synchronous));
    }

    const auto& replication = config.replication;
    if (!utils::in_range<0, 64>(replication.replicas)) {
        errors.push_back(std::format("replication.replicas must be 0-64, got {}", replication.replicas));
    }
    if (replication.replicas > 0 && replication.replica_dir.empty()) {
        errors.push_back("replication.replica_dir must not be empty");
    }
    if (!utils::in_range<1, 86400000>(replication.interval_ms)) {
        errors.push_back(std::format("replication.interval_ms must be 1-86400000, got {}",
                                     replication.interval_ms));
    }
    if (!utils::in_range<1, 1024>(replication.pool_size)) {
        errors.push_back(std::format("replication.pool_size must be 1-1024, got {}",
                                     replication.pool_size));
    }
    if (replication.latency_warn_ms < 0) {
        errors.push_back("replication.latency_warn_ms must not be negative");
    }
    if (replication.stale_after_ms < 0) {
        errors.push_back("replication.stale_after_ms must not be negative");
    }

    const auto& backup = config.backup;
    if (backup.dir.empty()) {
        errors.push_back("backup.dir must not be empty");
    }
    if (backup.name.empty() || backup.name.find('/') != std::string::npos) {
        errors.push_back(std::format("backup.name '{}' must be a non-empty file name prefix",
                                     backup.name));
    }
    if (backup.interval.count() < 1) {
        errors.push_back(std::format("backup.interval_seconds must be positive, got {}",
                                     backup.interval.count()));
    }
    if (backup.retention_days == 0) {
        errors.push_back("backup.retention_days must be 1-36500");
    }

    if (config.write_rate.max_writes_per_second == 0) {
        errors.push_back("write_rate.max_writes_per_second must be 1-1000000");
    }
    if (config.write_rate.throttle_backoff.count() < 0) {
        errors.push_back("write_rate.throttle_backoff_ms must not be negative");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' must be debug, info, warn or error",
                                     config.logging.level));
    }

    return errors;
}

} // namespace litesync
