/**
 * \file sim/SimulatorOptions.hpp
 * \brief CLI and config options describing the simulated spa network used by the host.
 * \ingroup sim_module
 */
#pragma once

#include "SimulatedSpaNetwork.hpp"

#include <string>
#include <vector>

namespace sim { namespace sim_opts {

/**
 * \brief Register simulator options.
 *
 * JSON: `"simulator": {"spas": [{"identifier", "name", "address", "port", "outcome", "reachable"}],
 * "discovery_latency_ms", "connect_latency_ms", "ping_interval_ms", "discovery_fails"}`.
 * CLI: repeated `--sim-spa ID:NAME:ADDRESS`, appended to the JSON list, plus timing flags.
 */
void register_options();

/**
 * \brief Parse an `ID:NAME:ADDRESS` spa definition.
 * \throws std::invalid_argument on a malformed definition.
 */
SimulatedSpaConfig parse_spa_spec(const std::string& spec);

std::vector<SimulatedSpaConfig> get_spas();
SimulatedNetworkConfig get_network_config();

} } // namespace sim::sim_opts
