#include "config/config_loader.hpp"
#include "coordinator/coordinator.hpp"
#include "coordinator/health_json.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <thread>

using namespace litesync;

namespace {

std::atomic<bool> g_stop_requested{false};

void signal_handler(int) {
    g_stop_requested.store(true);
}

void print_usage(const char* argv0) {
    std::cerr << std::format("Usage: {} [config.toml] [run|sync|backup|health]\n", argv0);
}

bool is_command(const std::string& arg) {
    return arg == "run" || arg == "sync" || arg == "backup" || arg == "health";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_file = "config/litesync.toml";
        std::string command = "run";

        // litesync [config] [command]; a lone argument may be either
        if (argc > 3) {
            print_usage(argv[0]);
            return 2;
        }
        if (argc == 2) {
            const std::string arg = argv[1];
            if (is_command(arg)) {
                command = arg;
            } else {
                config_file = arg;
            }
        } else if (argc == 3) {
            config_file = argv[1];
            command = argv[2];
            if (!is_command(command)) {
                print_usage(argv[0]);
                return 2;
            }
        }

        CoordinatorConfig config;
        if (std::filesystem::exists(config_file)) {
            auto loaded = ConfigLoader::load_from_file(config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return 1;
            }
            config = std::move(loaded.config);
            utils::log::info(std::format("Config loaded from {}", config_file));
        } else {
            utils::log::warn(std::format("Config file {} not found, using defaults", config_file));
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        auto created = Coordinator::create(config);
        if (created.is_error()) {
            utils::log::error(std::format("Startup failed ({}): {}",
                error_category_name(created.error_category()), created.error_message()));
            return 1;
        }
        auto& coordinator = *created.value();

        if (command == "sync") {
            auto report = coordinator.run_replication_cycle();
            if (report.is_error()) {
                utils::log::error(report.error_message());
                return 1;
            }
            std::cout << nlohmann::json(coordinator.health_snapshot()).dump(2) << '\n';
            return report.value().replicas_failed == 0 ? 0 : 1;
        }

        if (command == "backup") {
            auto artifact = coordinator.trigger_backup();
            if (artifact.is_error()) {
                utils::log::error(artifact.error_message());
                return 1;
            }
            std::cout << nlohmann::json(artifact.value()).dump(2) << '\n';
            return 0;
        }

        if (command == "health") {
            const auto deep = coordinator.deep_health();
            nlohmann::json out = coordinator.health_snapshot();
            out["deep"] = deep;
            std::cout << out.dump(2) << '\n';
            return deep.healthy ? 0 : 1;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        coordinator.start();
        utils::log::info("litesync running; send SIGINT or SIGTERM to stop");
        while (!g_stop_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }

        utils::log::info("Shutdown requested");
        coordinator.shutdown();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
