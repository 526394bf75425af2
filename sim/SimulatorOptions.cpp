/**
 * \file sim/SimulatorOptions.cpp
 * \brief Implementation of simulator CLI and configuration option helpers.
 * \ingroup sim_module
 */

#include "SimulatorOptions.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>

namespace {
    std::mutex g_sim_opts_mtx;
    /// Spa definitions from the config file.
    std::vector<sim::SimulatedSpaConfig> g_json_spas;
    /// Raw `--sim-spa` values, validated by the option check.
    std::vector<std::string> g_cli_spa_specs;
    int g_discovery_latency_ms = 200;
    int g_connect_latency_ms = 100;
    int g_ping_interval_ms = 1000;
    bool g_discovery_fails = false;
    std::atomic<bool> g_sim_registered{false};

    sim::SimulatedSpaConfig spa_from_json(const nlohmann::json& sj) {
        sim::SimulatedSpaConfig spa;
        spa.descriptor.identifier = sj.at("identifier").get<std::string>();
        spa.descriptor.name = sj.value("name", spa.descriptor.identifier);
        spa.descriptor.address = sj.value("address", std::string("127.0.0.1"));
        spa.descriptor.port = sj.value("port", spa::kDefaultSpaPort);
        spa.outcome = sim::parse_handshake_outcome(sj.value("outcome", std::string("ready")));
        spa.reachable = sj.value("reachable", true);
        return spa;
    }
}

namespace sim { namespace sim_opts {

SimulatedSpaConfig parse_spa_spec(const std::string& spec) {
    const auto first = spec.find(':');
    const auto second = first == std::string::npos ? std::string::npos : spec.find(':', first + 1);
    if (second == std::string::npos) {
        throw std::invalid_argument("spa definition must be ID:NAME:ADDRESS, got '" + spec + "'");
    }

    SimulatedSpaConfig spa;
    spa.descriptor.identifier = spec.substr(0, first);
    spa.descriptor.name = spec.substr(first + 1, second - first - 1);
    spa.descriptor.address = spec.substr(second + 1);
    if (spa.descriptor.identifier.empty() || spa.descriptor.address.empty()) {
        throw std::invalid_argument("spa definition needs an identifier and an address: '" + spec + "'");
    }
    if (spa.descriptor.name.empty()) {
        spa.descriptor.name = spa.descriptor.identifier;
    }
    return spa;
}

void register_options() {
    bool expected = false;
    if (!g_sim_registered.compare_exchange_strong(expected, true)) {
        return;
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::lock_guard<std::mutex> lk(g_sim_opts_mtx);
        g_json_spas.clear();
        g_cli_spa_specs.clear();
        g_discovery_latency_ms = 200;
        g_connect_latency_ms = 100;
        g_ping_interval_ms = 1000;
        g_discovery_fails = false;

        if (j.contains("simulator") && j["simulator"].is_object()) {
            const auto& simj = j["simulator"];
            if (simj.contains("spas") && simj["spas"].is_array()) {
                for (const auto& sj : simj["spas"]) {
                    g_json_spas.push_back(spa_from_json(sj));
                }
            }
            if (simj.contains("discovery_latency_ms") && simj["discovery_latency_ms"].is_number_integer()) g_discovery_latency_ms = simj["discovery_latency_ms"].get<int>();
            if (simj.contains("connect_latency_ms") && simj["connect_latency_ms"].is_number_integer()) g_connect_latency_ms = simj["connect_latency_ms"].get<int>();
            if (simj.contains("ping_interval_ms") && simj["ping_interval_ms"].is_number_integer()) g_ping_interval_ms = simj["ping_interval_ms"].get<int>();
            if (simj.contains("discovery_fails") && simj["discovery_fails"].is_boolean()) g_discovery_fails = simj["discovery_fails"].get<bool>();
        }

        app.add_option("--sim-spa", g_cli_spa_specs, "Simulated spa ID:NAME:ADDRESS (repeatable)")
            ->check([](const std::string& value) {
                try {
                    parse_spa_spec(value);
                    return std::string();
                } catch (const std::invalid_argument& e) {
                    return std::string(e.what());
                }
            })
            ->group("Simulator");
        app.add_option("--sim-discovery-latency-ms", g_discovery_latency_ms, "Simulated discovery duration")
            ->check(CLI::NonNegativeNumber)
            ->group("Simulator");
        app.add_option("--sim-connect-latency-ms", g_connect_latency_ms, "Simulated handshake duration")
            ->check(CLI::NonNegativeNumber)
            ->group("Simulator");
        app.add_option("--sim-ping-interval-ms", g_ping_interval_ms, "Keep-alive period of connected spas (0 = off)")
            ->check(CLI::NonNegativeNumber)
            ->group("Simulator");
        app.add_flag("--sim-discovery-fails", g_discovery_fails, "Make every simulated discovery fail")
            ->group("Simulator");
    });
}

std::vector<SimulatedSpaConfig> get_spas() {
    std::lock_guard<std::mutex> lk(g_sim_opts_mtx);
    std::vector<SimulatedSpaConfig> spas = g_json_spas;
    for (const auto& spec : g_cli_spa_specs) {
        spas.push_back(parse_spa_spec(spec));
    }
    return spas;
}

SimulatedNetworkConfig get_network_config() {
    std::lock_guard<std::mutex> lk(g_sim_opts_mtx);
    SimulatedNetworkConfig config;
    config.discovery_latency = std::chrono::milliseconds(g_discovery_latency_ms);
    config.connect_latency = std::chrono::milliseconds(g_connect_latency_ms);
    config.ping_interval = std::chrono::milliseconds(g_ping_interval_ms);
    config.discovery_fails = g_discovery_fails;
    return config;
}

} } // namespace sim::sim_opts

namespace {
    struct SimOptsAutoReg {
        SimOptsAutoReg() { sim::sim_opts::register_options(); }
    } sim_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
