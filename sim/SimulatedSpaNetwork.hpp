// SimulatedSpaNetwork.hpp - In-process spa backend for tests and the demo host
#pragma once

#include "spa/ClientId.hpp"
#include "spa/ISpa.hpp"
#include "spa/ISpaBackend.hpp"
#include "spa/ISpaFacade.hpp"
#include "spa/ISpaLocator.hpp"
#include "spa/SpaDescriptor.hpp"
#include "spa/SpaEventPayload.hpp"
#include "transport/coro/CoroTask.hpp"
#include "transport/coro/TaskSupervisor.hpp"
#include "logger.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sim {

/**
 * \defgroup sim_module Simulated Spa Backend
 * \brief Collaborators that imitate spas on a local network without any I/O.
 */

/**
 * \file sim/SimulatedSpaNetwork.hpp
 * \brief Declares the simulated network and its locator, session and facade.
 * \ingroup sim_module
 */

/// How a simulated handshake ends.
enum class HandshakeOutcome {
    Ready,               ///< CONNECTION_SPA_COMPLETE, then keep-alive pings
    RetryCountExceeded,  ///< CONNECTION_PROTOCOL_RETRY_COUNT_EXCEEDED
    Throws               ///< connect() throws std::runtime_error
};

std::string to_string(HandshakeOutcome outcome);
/// Accepts "ready", "retry_exceeded", "throws". \throws std::invalid_argument otherwise.
HandshakeOutcome parse_handshake_outcome(const std::string& text);

struct SimulatedSpaConfig {
    spa::SpaDescriptor descriptor;
    HandshakeOutcome outcome{HandshakeOutcome::Ready};
    /// Unreachable spas answer discovery but miss their pings.
    bool reachable{true};
};

struct SimulatedNetworkConfig {
    std::chrono::milliseconds discovery_latency{0};
    std::chrono::milliseconds connect_latency{0};
    /// Keep-alive period of connected sessions; zero disables pings.
    std::chrono::milliseconds ping_interval{0};
    bool discovery_fails{false};
};

class SimulatedSpa;

/**
 * \brief Set of simulated spas plus the backend factory handing out collaborators for them.
 * \ingroup sim_module
 *
 * Spa definitions can change while sessions are live (e.g. `set_reachable(id, false)` makes the
 * next keep-alive report RUNNING_PING_NO_RESPONSE). Must be owned by a `std::shared_ptr`.
 */
class SimulatedSpaNetwork : public spa::ISpaBackend,
                            public std::enable_shared_from_this<SimulatedSpaNetwork> {
public:
    SimulatedSpaNetwork(SimulatedNetworkConfig config, std::shared_ptr<Logger> logger);

    // --- Network definition ---
    void add_spa(SimulatedSpaConfig spa);
    bool remove_spa(const std::string& identifier);
    bool set_reachable(const std::string& identifier, bool reachable);
    bool set_outcome(const std::string& identifier, HandshakeOutcome outcome);
    void set_discovery_fails(bool fails) { config_.discovery_fails = fails; }
    void set_discovery_latency(std::chrono::milliseconds latency) { config_.discovery_latency = latency; }

    std::optional<SimulatedSpaConfig> find_spa(const std::string& identifier) const;
    const std::vector<SimulatedSpaConfig>& spas() const { return spas_; }
    const SimulatedNetworkConfig& config() const { return config_; }

    /// Session for `identifier` that has not been disconnected, or nullptr.
    SimulatedSpa* session(const std::string& identifier) const;

    size_t discover_count() const { return discover_count_; }
    size_t connect_count() const { return connect_count_; }

    // --- spa::ISpaBackend ---
    std::unique_ptr<spa::ISpaLocator> create_locator(transport::TaskSupervisor& supervisor,
                                                     spa::SpaEventCallback on_event,
                                                     std::optional<std::string> spa_address,
                                                     std::optional<std::string> spa_identifier) override;

    std::unique_ptr<spa::ISpa> create_spa(const spa::ClientId& client_id,
                                          const spa::SpaDescriptor& descriptor,
                                          transport::TaskSupervisor& supervisor,
                                          spa::SpaEventCallback on_event) override;

    std::unique_ptr<spa::ISpaFacade> create_facade(spa::ISpa& spa) override;

private:
    friend class SimulatedLocator;
    friend class SimulatedSpa;

    std::vector<SimulatedSpaConfig> matching_spas(const std::optional<std::string>& spa_address,
                                                  const std::optional<std::string>& spa_identifier) const;

    SimulatedNetworkConfig config_;
    std::shared_ptr<Logger> logger_;
    std::vector<SimulatedSpaConfig> spas_;
    std::unordered_map<std::string, SimulatedSpa*> sessions_;
    size_t discover_count_{0};
    size_t connect_count_{0};
};

/**
 * \brief Discovery over the simulated network.
 * \ingroup sim_module
 */
class SimulatedLocator : public spa::ISpaLocator {
public:
    SimulatedLocator(std::shared_ptr<SimulatedSpaNetwork> network,
                     spa::SpaEventCallback on_event,
                     std::optional<std::string> spa_address,
                     std::optional<std::string> spa_identifier);

    Task<void> discover() override;
    const std::vector<spa::SpaDescriptor>& spas() const override { return spas_; }

private:
    std::shared_ptr<SimulatedSpaNetwork> network_;
    spa::SpaEventCallback on_event_;
    std::optional<std::string> spa_address_;
    std::optional<std::string> spa_identifier_;
    std::vector<spa::SpaDescriptor> spas_;
};

/**
 * \brief Session with one simulated spa.
 * \ingroup sim_module
 *
 * After a ready handshake a keep-alive task runs in supervisor key group "SPA" until
 * `disconnect()`. The keep-alive coroutine owns copies of everything it touches, so the
 * session may be destroyed from inside one of its own ping events.
 */
class SimulatedSpa : public spa::ISpa {
public:
    SimulatedSpa(std::shared_ptr<SimulatedSpaNetwork> network,
                 spa::ClientId client_id,
                 spa::SpaDescriptor descriptor,
                 transport::TaskSupervisor& supervisor,
                 spa::SpaEventCallback on_event);
    ~SimulatedSpa() override;

    Task<void> connect() override;
    Task<void> disconnect() override;
    const spa::SpaDescriptor& descriptor() const override { return descriptor_; }

    /// Report `event` through this session, as the protocol layer would (RF errors, disconnects).
    Task<void> emit(spa::SpaEvent event, spa::SpaEventPayload payload = {});

    bool is_connected() const { return connected_; }
    const spa::ClientId& client_id() const { return client_id_; }

    static constexpr const char* kPingTaskKey = "SPA";

private:
    void detach_from_network();

    static Task<void> ping_loop(std::shared_ptr<SimulatedSpaNetwork> network,
                                spa::SpaDescriptor descriptor,
                                spa::SpaEventCallback on_event,
                                std::chrono::milliseconds interval);

    std::shared_ptr<SimulatedSpaNetwork> network_;
    spa::ClientId client_id_;
    spa::SpaDescriptor descriptor_;
    transport::TaskSupervisor& supervisor_;
    spa::SpaEventCallback on_event_;
    bool connected_{false};
    /// Set by disconnect(); a handshake still in progress stops at its next step.
    bool closed_{false};
};

/**
 * \brief Facade over a ready simulated session.
 * \ingroup sim_module
 */
class SimulatedFacade : public spa::ISpaFacade {
public:
    explicit SimulatedFacade(spa::SpaDescriptor descriptor) : descriptor_(std::move(descriptor)) {}

    const spa::SpaDescriptor& descriptor() const override { return descriptor_; }
    std::string name() const override { return descriptor_.name; }

private:
    spa::SpaDescriptor descriptor_;
};

} // namespace sim
