#include <catch2/catch_test_macros.hpp>
#include "coordinator/coordinator.hpp"
#include "coordinator/health_json.hpp"
#include "store/record_schema.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <format>
#include <future>
#include <thread>

using namespace litesync;
using namespace litesync::testing;

namespace {

CoordinatorConfig test_config(const TempDir& dir, int64_t replicas = 3) {
    CoordinatorConfig config;
    config.store.path = dir.file("data/app.db");
    config.store.pool_size = 4;
    config.store.acquire_timeout_ms = 200;
    config.replication.replica_dir = dir.file("replicas");
    config.replication.replicas = replicas;
    config.replication.pool_size = 2;
    config.replication.interval_ms = 20;
    config.backup.dir = dir.file("backups");
    config.backup.name = "app";
    config.backup.interval = std::chrono::seconds{3600};
    config.write_rate.max_writes_per_second = 1000;
    return config;
}

std::unique_ptr<Coordinator> make_coordinator(const CoordinatorConfig& config) {
    auto created = Coordinator::create(config);
    REQUIRE(created.is_ok());
    return std::move(created.value());
}

RecordDraft draft(const std::string& id, Timestamp modified_at) {
    RecordDraft d;
    d.id = id;
    d.modified_at = modified_at;
    d.payload = R"({"title":"Proposal"})";
    return d;
}

} // anonymous namespace

TEST_CASE("Coordinator: lays out primary and replica files", "[coordinator]") {
    TempDir dir;
    auto coordinator = make_coordinator(test_config(dir));

    CHECK(std::filesystem::exists(dir.file("data/app.db")));
    for (int i = 1; i <= 3; ++i) {
        CHECK(std::filesystem::exists(dir.file(std::format("replicas/replica{}/app.db", i))));
    }
    CHECK(coordinator->replicas().size() == 3);
}

TEST_CASE("Coordinator: write, replicate, read from a replica", "[coordinator]") {
    TempDir dir;
    auto coordinator = make_coordinator(test_config(dir));

    auto written = coordinator->write(draft("p1", 100));
    REQUIRE(written.is_ok());

    SECTION("Available replicas serve reads before the first cycle") {
        auto conn = coordinator->get_connection(true);
        REQUIRE(conn.is_ok());
        CHECK(conn.value()->source() != "primary");
    }

    SECTION("After one cycle every replica serves the row") {
        auto report = coordinator->run_replication_cycle();
        REQUIRE(report.is_ok());
        CHECK(report.value().replicas_synced == 3);

        auto conn = coordinator->get_connection(true);
        REQUIRE(conn.is_ok());
        CHECK(conn.value()->source().starts_with("replica"));
        auto found = records::find(*conn.value()->get(), "default", "p1");
        REQUIRE(found.is_ok());
        REQUIRE(found.value().has_value());
        CHECK(*found.value() == written.value());
    }

    SECTION("Writes go to the primary") {
        auto conn = coordinator->get_connection(false);
        REQUIRE(conn.is_ok());
        CHECK(conn.value()->source() == "primary");
    }

    SECTION("Replica connections are read-only") {
        REQUIRE(coordinator->run_replication_cycle().is_ok());
        auto conn = coordinator->get_connection(true);
        REQUIRE(conn.is_ok());
        const auto insert = conn.value()->get()->execute(
            "INSERT INTO records (collection, id, modified_at) VALUES ('default', 'x', 1)");
        CHECK_FALSE(insert.success);
    }
}

TEST_CASE("Coordinator: no replicas means every read hits the primary", "[coordinator]") {
    TempDir dir;
    auto coordinator = make_coordinator(test_config(dir, 0));

    auto conn = coordinator->get_connection(true);
    REQUIRE(conn.is_ok());
    CHECK(conn.value()->source() == "primary");
    CHECK(coordinator->health_snapshot().replica_count == 0);
}

TEST_CASE("Coordinator: invalid writes are rejected", "[coordinator]") {
    TempDir dir;
    auto coordinator = make_coordinator(test_config(dir));

    auto result = coordinator->write(draft("", 1));
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::INVALID_RECORD);
    CHECK(coordinator->write(draft("p1", -5)).error_category() == ErrorCategory::INVALID_RECORD);

    // Rejected drafts never reach the write-rate window
    CHECK(coordinator->health_snapshot().current_write_rate == 0);
    CHECK(coordinator->write_limiter().stats().total_writes == 0);

    REQUIRE(coordinator->write(draft("p1", 1)).is_ok());
    CHECK(coordinator->write_limiter().stats().total_writes == 1);
}

TEST_CASE("Coordinator: health snapshot", "[coordinator]") {
    TempDir dir;
    auto coordinator = make_coordinator(test_config(dir));

    REQUIRE(coordinator->write(draft("p1", 100)).is_ok());
    REQUIRE(coordinator->run_replication_cycle().is_ok());
    REQUIRE(coordinator->trigger_backup().is_ok());

    const auto health = coordinator->health_snapshot();
    CHECK(health.replica_count == 3);
    REQUIRE(health.replica_watermarks.size() == 3);
    for (const auto& w : health.replica_watermarks) {
        CHECK(w.watermark == 100);
        CHECK(w.available);
    }
    CHECK(health.current_write_rate == 1);
    CHECK(health.backup_count == 1);
    CHECK(health.last_backup_time.has_value());

    SECTION("Rendered as JSON") {
        const nlohmann::json j = health;
        CHECK(j["replica_count"] == 3);
        CHECK(j["replica_watermarks"].size() == 3);
        CHECK(j["replica_watermarks"][0]["replica_id"] == "replica1");
        CHECK(j["replica_watermarks"][0]["watermark"] == 100);
        CHECK(j["backup_count"] == 1);
        CHECK(j["last_backup_time"].is_string());
    }
}

TEST_CASE("Coordinator: deep health probes every store", "[coordinator]") {
    TempDir dir;
    auto coordinator = make_coordinator(test_config(dir, 2));

    REQUIRE(coordinator->write(draft("p1", 100)).is_ok());
    REQUIRE(coordinator->write(draft("p2", 200)).is_ok());
    REQUIRE(coordinator->run_replication_cycle().is_ok());

    const auto deep = coordinator->deep_health();
    CHECK(deep.healthy);
    CHECK(deep.primary.passed);
    CHECK(deep.primary.record_count == 2);
    REQUIRE(deep.replicas.size() == 2);
    for (const auto& probe : deep.replicas) {
        CHECK(probe.passed);
        CHECK(probe.record_count == 2);
    }
    CHECK(deep.max_write_rate == 1000);

    const nlohmann::json j = deep;
    CHECK(j["status"] == "healthy");
    CHECK(j["primary"]["status"] == "passed");
    CHECK(j["replicas"][1]["name"] == "replica2");
}

TEST_CASE("Coordinator: manual backup returns the artifact", "[coordinator]") {
    TempDir dir;
    auto coordinator = make_coordinator(test_config(dir));
    REQUIRE(coordinator->write(draft("p1", 100)).is_ok());

    auto artifact = coordinator->trigger_backup();
    REQUIRE(artifact.is_ok());
    CHECK(std::filesystem::exists(artifact.value().path));
    CHECK(coordinator->backups().verify_backup(artifact.value().path).is_ok());

    const nlohmann::json j = artifact.value();
    CHECK(j["path"] == artifact.value().path);
    CHECK(j["size_bytes"] == artifact.value().size_bytes);
    CHECK(j["sha256"].get<std::string>().size() == 64);
}

TEST_CASE("Coordinator: background replication after start", "[coordinator]") {
    TempDir dir;
    auto coordinator = make_coordinator(test_config(dir));
    coordinator->start();

    REQUIRE(coordinator->write(draft("p1", 100)).is_ok());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (coordinator->replicas().min_watermark() < 100 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    CHECK(coordinator->replicas().min_watermark() == 100);

    coordinator->shutdown();
    CHECK_FALSE(coordinator->replication().is_running());
}

TEST_CASE("Coordinator: shutdown fails blocked and later acquires", "[coordinator]") {
    TempDir dir;
    auto config = test_config(dir, 0);
    config.store.pool_size = 1;
    config.store.acquire_timeout_ms = 10000;
    auto coordinator = make_coordinator(config);

    auto held = coordinator->get_connection(false);
    REQUIRE(held.is_ok());

    auto waiter = std::async(std::launch::async, [&coordinator] {
        return coordinator->get_connection(false).error_category();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds{50});

    coordinator->shutdown();
    REQUIRE(waiter.wait_for(std::chrono::seconds{5}) == std::future_status::ready);
    CHECK(waiter.get() == ErrorCategory::POOL_CLOSED);

    auto later = coordinator->get_connection(true);
    REQUIRE(later.is_error());
    CHECK(later.error_category() == ErrorCategory::POOL_CLOSED);
}

TEST_CASE("Coordinator: write rate is tracked through record_write", "[coordinator]") {
    TempDir dir;
    auto config = test_config(dir, 0);
    config.write_rate.max_writes_per_second = 2;
    auto coordinator = make_coordinator(config);

    CHECK_FALSE(coordinator->record_write());
    CHECK_FALSE(coordinator->record_write());
    CHECK(coordinator->record_write());
    CHECK(coordinator->health_snapshot().current_write_rate == 3);
}
