#pragma once

#include "SpaManager.hpp"
#include "logger.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace manager_opts {

/**
 * \brief Register spa manager options (client identity, spa hints, pump timing, logging).
 *
 * JSON section "spaman" supplies defaults; CLI flags override them. Safe to call multiple
 * times; registration is protected by an internal flag.
 */
void register_options();

std::string get_client_uuid();
std::optional<std::string> get_spa_address();
std::optional<std::string> get_spa_identifier();
std::optional<std::string> get_spa_name();

/**
 * \brief Log level chosen with --log-level or "log_level".
 * \throws std::invalid_argument if the configured name is not a level.
 */
LogLevel get_log_level();

std::chrono::milliseconds get_pump_interval();
std::chrono::milliseconds get_error_backoff();

/** \brief How long the host runs before leaving the manager scope; nullopt means until a signal. */
std::optional<std::chrono::milliseconds> get_run_duration();

/** \brief Assemble the manager configuration from the parsed options. */
spaman::SpaManagerConfig make_manager_config();

} // namespace manager_opts
