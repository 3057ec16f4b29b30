#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"
#include "replication_fixture.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace litesync;
using namespace litesync::testing;

namespace {

std::unique_ptr<ReplicationDaemon> make_daemon(
    ReplicationFixture& fx, std::shared_ptr<ReplicaSet> replicas,
    std::chrono::milliseconds interval = std::chrono::milliseconds{60000}) {
    ReplicationDaemonConfig config;
    config.interval = interval;
    return std::make_unique<ReplicationDaemon>(
        std::make_shared<ChangeExtractor>(fx.primary), std::move(replicas), config);
}

} // anonymous namespace

TEST_CASE("Replication: one cycle brings every replica to the primary", "[replication]") {
    ReplicationFixture fx(3);
    auto replicas = fx.make_replicas();
    auto daemon = make_daemon(fx, replicas);

    const auto written = fx.put("p1", 100, R"({"title":"Proposal"})");

    auto report = daemon->run_cycle();
    REQUIRE(report.is_ok());
    REQUIRE(report.value().rows_extracted == 1);
    REQUIRE(report.value().replicas_synced == 3);
    REQUIRE(report.value().replicas_failed == 0);

    for (size_t i = 0; i < replicas->size(); ++i) {
        REQUIRE(replicas->watermark(i) == 100);
        const auto row = ReplicationFixture::read_replica(*replicas, i, "p1");
        REQUIRE(row.has_value());
        REQUIRE(*row == written);
    }
    REQUIRE(daemon->state() == ReplicationState::IDLE);
}

TEST_CASE("Replication: replicas converge on many rows", "[replication]") {
    ReplicationFixture fx(2);
    auto replicas = fx.make_replicas();
    auto daemon = make_daemon(fx, replicas);

    for (int i = 1; i <= 50; ++i) {
        fx.put(std::format("r{}", i), i * 10);
    }
    REQUIRE(daemon->run_cycle().is_ok());

    for (size_t i = 0; i < replicas->size(); ++i) {
        REQUIRE(ReplicationFixture::replica_count(*replicas, i) == 50);
        REQUIRE(replicas->watermark(i) == 500);
    }

    const auto stats = daemon->stats();
    REQUIRE(stats.cycles == 1);
    REQUIRE(stats.rows_applied == 100);
    REQUIRE(stats.push_failures == 0);
}

TEST_CASE("Replication: each replica receives only rows past its own watermark", "[replication]") {
    ReplicationFixture fx(2);
    fx.writers->block(fx.specs[1].path);
    auto replicas = fx.make_replicas();
    auto daemon = make_daemon(fx, replicas);

    fx.put("a", 10);
    REQUIRE(daemon->run_cycle().is_ok());
    REQUIRE(replicas->watermark(0) == 10);
    REQUIRE(replicas->watermark(1) == 0);

    fx.writers->unblock(fx.specs[1].path);
    fx.put("b", 20);
    auto report = daemon->run_cycle();
    REQUIRE(report.is_ok());
    REQUIRE(report.value().rows_extracted == 2);
    // replica1 gets only "b", replica2 gets both
    REQUIRE(report.value().rows_applied == 3);
    REQUIRE(replicas->watermark(0) == 20);
    REQUIRE(replicas->watermark(1) == 20);
}

TEST_CASE("Replication: an unreachable replica does not hold back the others", "[replication]") {
    ReplicationFixture fx(3);
    fx.writers->block(fx.specs[1].path);
    auto replicas = fx.make_replicas();
    auto daemon = make_daemon(fx, replicas);

    REQUIRE_FALSE(replicas->status(1).available);

    fx.put("p1", 100);
    auto report = daemon->run_cycle();
    REQUIRE(report.is_ok());
    REQUIRE(report.value().replicas_synced == 2);
    REQUIRE(report.value().replicas_failed == 1);

    REQUIRE(replicas->watermark(0) == 100);
    REQUIRE(replicas->watermark(2) == 100);
    REQUIRE(replicas->watermark(1) == 0);

    const auto failed = replicas->status(1);
    REQUIRE_FALSE(failed.available);
    REQUIRE(failed.consecutive_failures >= 2);
    REQUIRE_FALSE(failed.last_error.empty());
    REQUIRE(daemon->stats().push_failures == 1);

    SECTION("Recovers on the first cycle after it comes back") {
        fx.writers->unblock(fx.specs[1].path);
        REQUIRE(daemon->run_cycle().is_ok());
        const auto recovered = replicas->status(1);
        REQUIRE(recovered.available);
        REQUIRE(recovered.consecutive_failures == 0);
        REQUIRE(recovered.last_sync_watermark == 100);
        REQUIRE(ReplicationFixture::read_replica(*replicas, 1, "p1").has_value());
    }
}

TEST_CASE("Replication: a replica failing mid-run keeps its watermark", "[replication]") {
    SqliteOptions writer_options;
    writer_options.busy_timeout_ms = 0;
    ReplicationFixture fx(3, writer_options);
    auto replicas = fx.make_replicas();
    auto daemon = make_daemon(fx, replicas);

    fx.put("p1", 100);
    REQUIRE(daemon->run_cycle().is_ok());
    REQUIRE(replicas->min_watermark() == 100);

    // Another process holds the write lock on replica2's file
    auto holder = fx.sqlite->create(fx.specs[1].path);
    REQUIRE(holder != nullptr);
    REQUIRE(holder->execute("BEGIN EXCLUSIVE").success);

    fx.put("p2", 200);
    auto report = daemon->run_cycle();
    REQUIRE(report.is_ok());
    REQUIRE(report.value().replicas_synced == 2);
    REQUIRE(report.value().replicas_failed == 1);

    REQUIRE(replicas->watermark(0) == 200);
    REQUIRE(replicas->watermark(2) == 200);
    REQUIRE(replicas->watermark(1) == 100);
    REQUIRE_FALSE(replicas->status(1).available);
    REQUIRE_FALSE(ReplicationFixture::read_replica(*replicas, 1, "p2").has_value());

    SECTION("Catches up once the lock is released") {
        REQUIRE(holder->execute("ROLLBACK").success);
        holder->close();

        REQUIRE(daemon->run_cycle().is_ok());
        REQUIRE(replicas->watermark(1) == 200);
        REQUIRE(replicas->status(1).available);
        REQUIRE(ReplicationFixture::read_replica(*replicas, 1, "p2").has_value());
    }
}

TEST_CASE("Replication: a write waiting on the lock is stamped after the one holding it", "[replication]") {
    ReplicationFixture fx(1);
    auto replicas = fx.make_replicas();
    auto daemon = make_daemon(fx, replicas);

    auto holder = fx.primary->pool()->acquire(std::chrono::milliseconds{1000});
    REQUIRE(holder.is_ok());
    auto& held = *holder.value()->get();
    REQUIRE(held.execute("BEGIN IMMEDIATE").success);

    auto waiting = std::async(std::launch::async, [&fx] {
        RecordDraft d;
        d.id = "waiting";
        return fx.primary->put(d);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds{50});

    Record first;
    first.id = "first";
    first.modified_at = utils::now_ms();
    REQUIRE(records::upsert(held, first).is_ok());
    REQUIRE(held.execute("COMMIT").success);
    holder.value()->release();

    // Replicate "first" while "waiting" may still be committing
    REQUIRE(daemon->run_cycle().is_ok());

    auto stored = waiting.get();
    REQUIRE(stored.is_ok());
    REQUIRE(stored.value().modified_at > first.modified_at);

    REQUIRE(daemon->run_cycle().is_ok());
    const auto row = ReplicationFixture::read_replica(*replicas, 0, "waiting");
    REQUIRE(row.has_value());
    REQUIRE(*row == stored.value());
}

TEST_CASE("Replication: concurrent unstamped writes all reach the replicas", "[replication]") {
    ReplicationFixture fx(2);
    auto replicas = fx.make_replicas();
    auto daemon = make_daemon(fx, replicas, std::chrono::milliseconds{1});

    constexpr int kWriters = 4;
    constexpr int kWritesPerThread = 50;
    std::atomic<int> failures{0};

    daemon->start();
    std::vector<std::thread> writers;
    for (int t = 0; t < kWriters; ++t) {
        writers.emplace_back([&fx, &failures, t] {
            for (int i = 0; i < kWritesPerThread; ++i) {
                RecordDraft d;
                d.id = std::format("w{}-{}", t, i);
                if (fx.primary->put(d).is_error()) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }
    daemon->stop();

    // One more cycle picks up whatever committed after the last background pass
    REQUIRE(daemon->run_cycle().is_ok());

    REQUIRE(failures.load() == 0);
    const auto primary_count = fx.primary->record_count().value();
    REQUIRE(primary_count == kWriters * kWritesPerThread);
    for (size_t i = 0; i < replicas->size(); ++i) {
        REQUIRE(ReplicationFixture::replica_count(*replicas, i) == primary_count);
        REQUIRE(replicas->watermark(i) == fx.primary->max_modified_at().value());
    }
}

TEST_CASE("Replication: watermarks never move backwards or past the primary", "[replication]") {
    ReplicationFixture fx(2);
    auto replicas = fx.make_replicas();
    auto daemon = make_daemon(fx, replicas);

    fx.put("a", 100);
    REQUIRE(daemon->run_cycle().is_ok());

    // A late-stamped write sits below every watermark
    fx.put("late", 50);
    REQUIRE(daemon->run_cycle().is_ok());
    REQUIRE(daemon->run_cycle().is_ok());

    const auto primary_max = fx.primary->max_modified_at().value();
    for (size_t i = 0; i < replicas->size(); ++i) {
        REQUIRE(replicas->watermark(i) == 100);
        REQUIRE(replicas->watermark(i) <= primary_max);
    }
}

TEST_CASE("Replication: logical deletes travel as tombstone upserts", "[replication]") {
    ReplicationFixture fx(2);
    auto replicas = fx.make_replicas();
    auto daemon = make_daemon(fx, replicas);

    fx.put("p1", 100, R"({"title":"draft"})");
    REQUIRE(daemon->run_cycle().is_ok());

    fx.put("p1", 200, R"({"deleted":true})");
    REQUIRE(daemon->run_cycle().is_ok());

    for (size_t i = 0; i < replicas->size(); ++i) {
        const auto row = ReplicationFixture::read_replica(*replicas, i, "p1");
        REQUIRE(row.has_value());
        REQUIRE(row->payload == R"({"deleted":true})");
        REQUIRE(row->modified_at == 200);
        REQUIRE(ReplicationFixture::replica_count(*replicas, i) == 1);
    }
}

TEST_CASE("Replication: watermarks are recovered from replica files", "[replication]") {
    ReplicationFixture fx(2);
    {
        auto replicas = fx.make_replicas();
        auto daemon = make_daemon(fx, replicas);
        fx.put("a", 100);
        fx.put("b", 250);
        REQUIRE(daemon->run_cycle().is_ok());
        replicas->close();
    }

    auto reopened = fx.make_replicas();
    REQUIRE(reopened->watermark(0) == 250);
    REQUIRE(reopened->watermark(1) == 250);
    REQUIRE(reopened->status(0).available);
}

TEST_CASE("Replication: extraction failure is reported and counted", "[replication]") {
    ReplicationFixture fx(1);
    auto replicas = fx.make_replicas();
    auto daemon = make_daemon(fx, replicas);

    fx.primary->pool()->close();
    auto report = daemon->run_cycle();
    REQUIRE(report.is_error());
    REQUIRE(report.error_category() == ErrorCategory::POOL_CLOSED);
    REQUIRE(daemon->stats().extract_failures == 1);
    REQUIRE(daemon->state() == ReplicationState::IDLE);
}

TEST_CASE("Replication: periodic loop syncs in the background", "[replication]") {
    ReplicationFixture fx(2);
    auto replicas = fx.make_replicas();
    auto daemon = make_daemon(fx, replicas, std::chrono::milliseconds{20});

    fx.put("p1", 100);
    daemon->start();
    REQUIRE(daemon->is_running());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (replicas->min_watermark() < 100 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    daemon->stop();

    REQUIRE(replicas->min_watermark() == 100);
    REQUIRE_FALSE(daemon->is_running());
}

TEST_CASE("Replication: stop interrupts a long interval promptly", "[replication]") {
    ReplicationFixture fx(1);
    auto replicas = fx.make_replicas();
    auto daemon = make_daemon(fx, replicas, std::chrono::milliseconds{60000});

    daemon->start();
    std::this_thread::sleep_for(std::chrono::milliseconds{20});

    const auto begin = std::chrono::steady_clock::now();
    daemon->stop();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE(elapsed < std::chrono::seconds{2});
    REQUIRE(daemon->stats().cycles == 0);
}
