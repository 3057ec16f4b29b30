#pragma once

#include "config/coordinator_config.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace litesync {

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        CoordinatorConfig config;

        static LoadResult ok(CoordinatorConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to litesync.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check ranges and enums; returns every problem found
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const CoordinatorConfig& config);

private:
    static CoordinatorConfig extract_all_sections(const toml::table& root);
    static StoreConfig extract_store(const toml::table& root);
    static ReplicationConfig extract_replication(const toml::table& root);
    static BackupConfig extract_backup(const toml::table& root);
    static WriteRateConfig extract_write_rate(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static LoadResult validate_and_return(CoordinatorConfig config);
};

} // namespace litesync
