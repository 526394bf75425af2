// SimulatedSpaNetwork.cpp - Simulated discovery, handshake and keep-alive
#include "SimulatedSpaNetwork.hpp"

#include "transport/coro/coroIoContext.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

/**
 * \file sim/SimulatedSpaNetwork.cpp
 * \brief Implements the simulated spa backend.
 * \ingroup sim_module
 */

namespace sim {

using spa::SpaEvent;
using spa::SpaEventPayload;

std::string to_string(HandshakeOutcome outcome) {
    switch (outcome) {
        case HandshakeOutcome::Ready:              return "ready";
        case HandshakeOutcome::RetryCountExceeded: return "retry_exceeded";
        case HandshakeOutcome::Throws:             return "throws";
        default:                                   return "unknown";
    }
}

HandshakeOutcome parse_handshake_outcome(const std::string& text) {
    if (text == "ready") return HandshakeOutcome::Ready;
    if (text == "retry_exceeded") return HandshakeOutcome::RetryCountExceeded;
    if (text == "throws") return HandshakeOutcome::Throws;
    throw std::invalid_argument("unknown handshake outcome: " + text);
}

// ---------------------------------------------------------------------------
// SimulatedSpaNetwork
// ---------------------------------------------------------------------------

SimulatedSpaNetwork::SimulatedSpaNetwork(SimulatedNetworkConfig config, std::shared_ptr<Logger> logger)
    : config_(config)
    , logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("SimulatedSpaNetwork: logger cannot be null");
    }
}

void SimulatedSpaNetwork::add_spa(SimulatedSpaConfig spa) {
    if (spa.descriptor.identifier.empty()) {
        throw std::invalid_argument("SimulatedSpaNetwork: spa identifier cannot be empty");
    }
    if (find_spa(spa.descriptor.identifier)) {
        throw std::invalid_argument("SimulatedSpaNetwork: duplicate spa identifier " + spa.descriptor.identifier);
    }
    logger_->debug("SimulatedSpaNetwork: added spa " + spa.descriptor.to_string() +
                   " outcome=" + to_string(spa.outcome));
    spas_.push_back(std::move(spa));
}

bool SimulatedSpaNetwork::remove_spa(const std::string& identifier) {
    auto it = std::find_if(spas_.begin(), spas_.end(),
        [&identifier](const SimulatedSpaConfig& s) { return s.descriptor.identifier == identifier; });
    if (it == spas_.end()) return false;
    spas_.erase(it);
    return true;
}

bool SimulatedSpaNetwork::set_reachable(const std::string& identifier, bool reachable) {
    for (auto& s : spas_) {
        if (s.descriptor.identifier == identifier) {
            s.reachable = reachable;
            return true;
        }
    }
    return false;
}

bool SimulatedSpaNetwork::set_outcome(const std::string& identifier, HandshakeOutcome outcome) {
    for (auto& s : spas_) {
        if (s.descriptor.identifier == identifier) {
            s.outcome = outcome;
            return true;
        }
    }
    return false;
}

std::optional<SimulatedSpaConfig> SimulatedSpaNetwork::find_spa(const std::string& identifier) const {
    for (const auto& s : spas_) {
        if (s.descriptor.identifier == identifier) return s;
    }
    return std::nullopt;
}

SimulatedSpa* SimulatedSpaNetwork::session(const std::string& identifier) const {
    auto it = sessions_.find(identifier);
    return it == sessions_.end() ? nullptr : it->second;
}

std::vector<SimulatedSpaConfig> SimulatedSpaNetwork::matching_spas(const std::optional<std::string>& spa_address,
                                                                   const std::optional<std::string>& spa_identifier) const {
    std::vector<SimulatedSpaConfig> matches;
    for (const auto& s : spas_) {
        if (spa_address && s.descriptor.address != *spa_address) continue;
        if (spa_identifier && s.descriptor.identifier != *spa_identifier) continue;
        matches.push_back(s);
    }
    return matches;
}

std::unique_ptr<spa::ISpaLocator> SimulatedSpaNetwork::create_locator(transport::TaskSupervisor&,
                                                                      spa::SpaEventCallback on_event,
                                                                      std::optional<std::string> spa_address,
                                                                      std::optional<std::string> spa_identifier) {
    return std::make_unique<SimulatedLocator>(shared_from_this(), std::move(on_event),
                                              std::move(spa_address), std::move(spa_identifier));
}

std::unique_ptr<spa::ISpa> SimulatedSpaNetwork::create_spa(const spa::ClientId& client_id,
                                                           const spa::SpaDescriptor& descriptor,
                                                           transport::TaskSupervisor& supervisor,
                                                           spa::SpaEventCallback on_event) {
    return std::make_unique<SimulatedSpa>(shared_from_this(), client_id, descriptor, supervisor, std::move(on_event));
}

std::unique_ptr<spa::ISpaFacade> SimulatedSpaNetwork::create_facade(spa::ISpa& spa) {
    return std::make_unique<SimulatedFacade>(spa.descriptor());
}

// ---------------------------------------------------------------------------
// SimulatedLocator
// ---------------------------------------------------------------------------

SimulatedLocator::SimulatedLocator(std::shared_ptr<SimulatedSpaNetwork> network,
                                   spa::SpaEventCallback on_event,
                                   std::optional<std::string> spa_address,
                                   std::optional<std::string> spa_identifier)
    : network_(std::move(network))
    , on_event_(std::move(on_event))
    , spa_address_(std::move(spa_address))
    , spa_identifier_(std::move(spa_identifier)) {}

Task<void> SimulatedLocator::discover() {
    network_->discover_count_++;
    if (network_->config_.discovery_latency.count() > 0) {
        co_await transport::sleep_for(network_->config_.discovery_latency);
    }
    if (network_->config_.discovery_fails) {
        throw std::runtime_error("simulated discovery failure");
    }

    spas_.clear();
    for (const auto& found : network_->matching_spas(spa_address_, spa_identifier_)) {
        spas_.push_back(found.descriptor);
        SpaEventPayload payload;
        payload.descriptor = found.descriptor;
        co_await on_event_(SpaEvent::LOCATING_DISCOVERED_SPA, std::move(payload));
    }
    network_->logger_->debug("SimulatedLocator: found " + std::to_string(spas_.size()) + " spa(s)");
}

// ---------------------------------------------------------------------------
// SimulatedSpa
// ---------------------------------------------------------------------------

SimulatedSpa::SimulatedSpa(std::shared_ptr<SimulatedSpaNetwork> network,
                           spa::ClientId client_id,
                           spa::SpaDescriptor descriptor,
                           transport::TaskSupervisor& supervisor,
                           spa::SpaEventCallback on_event)
    : network_(std::move(network))
    , client_id_(std::move(client_id))
    , descriptor_(std::move(descriptor))
    , supervisor_(supervisor)
    , on_event_(std::move(on_event)) {
    network_->sessions_[descriptor_.identifier] = this;
}

SimulatedSpa::~SimulatedSpa() {
    detach_from_network();
}

void SimulatedSpa::detach_from_network() {
    auto it = network_->sessions_.find(descriptor_.identifier);
    if (it != network_->sessions_.end() && it->second == this) {
        network_->sessions_.erase(it);
    }
}

Task<void> SimulatedSpa::connect() {
    network_->connect_count_++;
    if (network_->config_.connect_latency.count() > 0) {
        co_await transport::sleep_for(network_->config_.connect_latency);
    }
    if (closed_) {
        network_->logger_->debug("SimulatedSpa: handshake with " + descriptor_.identifier + " abandoned");
        co_return;
    }

    auto definition = network_->find_spa(descriptor_.identifier);
    if (!definition) {
        throw std::runtime_error("simulated spa " + descriptor_.identifier + " is gone");
    }

    SpaEventPayload progress;
    progress.descriptor = descriptor_;
    co_await on_event_(SpaEvent::CONNECTION_GOT_CHANNEL, progress);
    co_await on_event_(SpaEvent::CONNECTION_GOT_CONFIG_FILES, progress);

    switch (definition->outcome) {
        case HandshakeOutcome::Ready:
            connected_ = true;
            co_await on_event_(SpaEvent::CONNECTION_SPA_COMPLETE, progress);
            if (!closed_ && network_->config_.ping_interval.count() > 0) {
                supervisor_.add_task(ping_loop(network_, descriptor_, on_event_, network_->config_.ping_interval),
                                     "Ping " + descriptor_.identifier, kPingTaskKey);
            }
            break;
        case HandshakeOutcome::RetryCountExceeded:
            co_await on_event_(SpaEvent::CONNECTION_PROTOCOL_RETRY_COUNT_EXCEEDED, progress);
            break;
        case HandshakeOutcome::Throws:
            throw std::runtime_error("simulated handshake failure with " + descriptor_.identifier);
    }
}

Task<void> SimulatedSpa::disconnect() {
    supervisor_.cancel_key_tasks(kPingTaskKey);
    connected_ = false;
    closed_ = true;
    detach_from_network();
    co_return;
}

Task<void> SimulatedSpa::emit(SpaEvent event, SpaEventPayload payload) {
    if (!payload.descriptor) {
        payload.descriptor = descriptor_;
    }
    return on_event_(event, std::move(payload));
}

Task<void> SimulatedSpa::ping_loop(std::shared_ptr<SimulatedSpaNetwork> network,
                                   spa::SpaDescriptor descriptor,
                                   spa::SpaEventCallback on_event,
                                   std::chrono::milliseconds interval) {
    while (true) {
        co_await transport::sleep_for(interval);

        auto definition = network->find_spa(descriptor.identifier);
        const bool answered = definition && definition->reachable;

        SpaEventPayload payload;
        payload.descriptor = descriptor;
        co_await on_event(answered ? SpaEvent::RUNNING_PING_RECEIVED : SpaEvent::RUNNING_PING_NO_RESPONSE,
                          std::move(payload));
    }
}

} // namespace sim
