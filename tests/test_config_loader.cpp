#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <fstream>

using namespace litesync;
using namespace litesync::testing;

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.store.path == "data/litesync.db");
    CHECK(cfg.store.pool_size == 20);
    CHECK(cfg.store.journal_mode == "WAL");
    CHECK(cfg.replication.enabled);
    CHECK(cfg.replication.replicas == 3);
    CHECK(cfg.replication.interval_ms == 5000);
    CHECK(cfg.replication.latency_warn_ms == 200);
    CHECK(cfg.backup.enabled);
    CHECK(cfg.backup.interval == std::chrono::seconds{60});
    CHECK(cfg.backup.retention_days == 30);
    CHECK(cfg.write_rate.max_writes_per_second == 95);
    CHECK(cfg.write_rate.throttle_backoff == std::chrono::milliseconds{10});
    CHECK(cfg.logging.level == "info");
}

TEST_CASE("ConfigLoader: every section is read", "[config]") {
    const std::string toml = R"(
[store]
path = "/var/lib/app/main.db"
pool_size = 8
busy_timeout_ms = 2000
acquire_timeout_ms = 750
journal_mode = "wal"
synchronous = "FULL"
cache_size = 5000

[replication]
enabled = false
replica_dir = "/var/lib/app/replicas"
replicas = 2
interval_ms = 1000
pool_size = 3
latency_warn_ms = 50
stale_after_ms = 30000

[backup]
enabled = false
dir = "/var/backups/app"
name = "app"
interval_seconds = 300
retention_days = 7

[write_rate]
max_writes_per_second = 500
throttle_backoff_ms = 25

[logging]
level = "debug"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.store.path == "/var/lib/app/main.db");
    CHECK(cfg.store.pool_size == 8);
    CHECK(cfg.store.busy_timeout_ms == 2000);
    CHECK(cfg.store.acquire_timeout_ms == 750);
    CHECK(cfg.store.synchronous == "FULL");
    CHECK(cfg.store.cache_size == 5000);
    CHECK_FALSE(cfg.replication.enabled);
    CHECK(cfg.replication.replica_dir == "/var/lib/app/replicas");
    CHECK(cfg.replication.replicas == 2);
    CHECK(cfg.replication.pool_size == 3);
    CHECK(cfg.replication.stale_after_ms == 30000);
    CHECK_FALSE(cfg.backup.enabled);
    CHECK(cfg.backup.dir == "/var/backups/app");
    CHECK(cfg.backup.name == "app");
    CHECK(cfg.backup.interval == std::chrono::seconds{300});
    CHECK(cfg.backup.retention_days == 7);
    CHECK(cfg.backup.acquire_timeout == std::chrono::milliseconds{750});
    CHECK(cfg.write_rate.max_writes_per_second == 500);
    CHECK(cfg.write_rate.throttle_backoff == std::chrono::milliseconds{25});
    CHECK(cfg.logging.level == "debug");
}

TEST_CASE("ConfigLoader: environment variables are expanded", "[config]") {
    ::setenv("LITESYNC_TEST_DATA_DIR", "/srv/data", 1);
    const std::string toml = R"(
[store]
path = "${LITESYNC_TEST_DATA_DIR}/main.db"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.store.path == "/srv/data/main.db");

    SECTION("Unset variables expand to nothing") {
        auto unset = ConfigLoader::load_from_string(R"(
[backup]
dir = "${LITESYNC_TEST_UNSET_VAR}backups"
)");
        REQUIRE(unset.success);
        CHECK(unset.config.backup.dir == "backups");
    }

    SECTION("Unclosed substitution is an error") {
        auto bad = ConfigLoader::load_from_string(R"(
[store]
path = "${BROKEN"
)");
        CHECK_FALSE(bad.success);
        CHECK(bad.error_message.find("Unclosed") != std::string::npos);
    }
}

TEST_CASE("ConfigValidation: out-of-range values are all reported", "[config][validation]") {
    const std::string toml = R"(
[store]
pool_size = 0
journal_mode = "SIDEWAYS"

[replication]
replicas = -1

[backup]
retention_days = 0

[write_rate]
max_writes_per_second = 0

[logging]
level = "loud"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("store.pool_size") != std::string::npos);
    CHECK(result.error_message.find("store.journal_mode") != std::string::npos);
    CHECK(result.error_message.find("replication.replicas") != std::string::npos);
    CHECK(result.error_message.find("backup.retention_days") != std::string::npos);
    CHECK(result.error_message.find("write_rate.max_writes_per_second") != std::string::npos);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigValidation: backup name must be a plain prefix", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[backup]
name = "nested/name"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("backup.name") != std::string::npos);
}

TEST_CASE("ConfigValidation: zero replicas is allowed", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[replication]
replicas = 0
)");
    REQUIRE(result.success);
    CHECK(result.config.replication.replicas == 0);
}

TEST_CASE("ConfigLoader: malformed TOML is reported", "[config]") {
    auto result = ConfigLoader::load_from_string("[store\npath = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: load_from_file", "[config]") {
    TempDir dir;
    const auto path = dir.file("litesync.toml");
    std::ofstream(path) << "[write_rate]\nmax_writes_per_second = 42\n";

    auto result = ConfigLoader::load_from_file(path);
    REQUIRE(result.success);
    CHECK(result.config.write_rate.max_writes_per_second == 42);

    SECTION("Missing file") {
        auto missing = ConfigLoader::load_from_file(dir.file("absent.toml"));
        CHECK_FALSE(missing.success);
        CHECK(missing.error_message.find("Failed to load config") != std::string::npos);
    }
}
