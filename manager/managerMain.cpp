// managerMain.cpp - spaman host application: runs the spa manager against the simulated network.
#include "SpaManager.hpp"
#include "ManagerOptions.hpp"
#include "LoggingEventHandler.hpp"
#include "sim/SimulatedSpaNetwork.hpp"
#include "sim/SimulatorOptions.hpp"
#include "transport/coro/coroIoContext.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <chrono>
#include <csignal>

// Global shutdown flag for signal handlers
static std::atomic<bool> shutdown_requested{false};

// Signal handler for graceful shutdown
static void signal_handler(int) {
    shutdown_requested.store(true, std::memory_order_relaxed);
}

// Body of the manager scope: keep the loop alive and report status until told to stop.
static Task<void> run_until_shutdown(spaman::SpaManager& manager,
                                     std::optional<std::chrono::milliseconds> run_duration,
                                     std::shared_ptr<Logger> logger) {
    constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);
    constexpr auto STATUS_INTERVAL = std::chrono::seconds(5);

    const auto started = std::chrono::steady_clock::now();
    auto next_status = started + STATUS_INTERVAL;

    while (!shutdown_requested.load(std::memory_order_relaxed)) {
        const auto now = std::chrono::steady_clock::now();
        if (run_duration && now - started >= *run_duration) {
            logger->info("Run duration elapsed");
            break;
        }
        if (now >= next_status) {
            logger->info("Status: " + manager.to_string());
            next_status = now + STATUS_INTERVAL;
        }
        co_await transport::sleep_for(POLL_INTERVAL);
    }
}

int main(int argc, char* argv[]) {

    // --- Stage 1: Build logging pipeline ---
    auto logger = std::make_shared<Logger>("spaman");
    auto stdout_sink = std::make_shared<StdoutSink>();
    stdout_sink->set_level(LogLevel::Info);
    logger->add_sink(stdout_sink);

    try {

        // --- Stage 2: Parse CLI/JSON options ---

        // Note, all options auto-register via static objects; no manual call needed
        std::string opts_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0; // help/version already printed
        } else if (parse_res == shared_opts::Options::ParseResult::Error) {
            logger->error(std::string("Failed to parse options: ") + opts_err);
            return 2;
        }
        logger->set_level(manager_opts::get_log_level());

        // --- Stage 3: Bring up the event loop and the simulated network ---
        auto context = std::make_shared<transport::CoroIoContext>();
        context->set_logger(logger);

        auto network = std::make_shared<sim::SimulatedSpaNetwork>(sim::sim_opts::get_network_config(), logger);
        auto spas = sim::sim_opts::get_spas();
        if (spas.empty()) {
            logger->info("No simulated spas configured; adding a default one");
            spas.push_back(sim::sim_opts::parse_spa_spec("SPA00000001:Demo Spa:127.0.0.1"));
        }
        for (auto& spa : spas) {
            network->add_spa(std::move(spa));
        }

        // --- Stage 4: Run the spa manager scope ---
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);

        auto config = manager_opts::make_manager_config();
        spaman::SpaManager* manager_view = nullptr;
        auto handler = std::make_shared<spaman::LoggingEventHandler>(logger, config.spa_name,
            [&manager_view] { return manager_view ? manager_view->status_line() : std::string(); });

        spaman::SpaManager manager(config, network, handler, context, logger);
        manager_view = &manager;

        logger->info("Spa manager starting...");
        const auto run_duration = manager_opts::get_run_duration();
        context->run_until_complete(manager.run_scoped([&](spaman::SpaManager& m) {
            return run_until_shutdown(m, run_duration, logger);
        }));

        // --- Stage 5: Summary ---
        logger->info("Final " + manager.to_string());
        logger->info(handler->format_summary());
        context->log_detailed_statistics();

    } catch (const std::exception& e) {
        logger->error("Exception in spa manager main loop: " + std::string(e.what()));
        return 1;
    }

    logger->info("Spa manager shut down successfully");

    return 0;
}
