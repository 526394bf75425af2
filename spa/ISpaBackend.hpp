/**
 * @file spa/ISpaBackend.hpp
 * @brief Factory for the locator, session and facade collaborators.
 *
 * A concrete protocol implementation plugs into the manager here. Collaborators receive the
 * manager's TaskSupervisor so they can run their own background work (e.g. keep-alive pings)
 * under a key group of their own.
 */
#pragma once

#include "spa/ClientId.hpp"
#include "spa/ISpa.hpp"
#include "spa/ISpaFacade.hpp"
#include "spa/ISpaLocator.hpp"
#include "spa/SpaEventPayload.hpp"
#include "transport/coro/TaskSupervisor.hpp"

#include <memory>
#include <optional>
#include <string>

namespace spa {

class ISpaBackend {
public:
    virtual ~ISpaBackend() = default;

    virtual std::unique_ptr<ISpaLocator> create_locator(transport::TaskSupervisor& supervisor,
                                                        SpaEventCallback on_event,
                                                        std::optional<std::string> spa_address,
                                                        std::optional<std::string> spa_identifier) = 0;

    virtual std::unique_ptr<ISpa> create_spa(const ClientId& client_id,
                                             const SpaDescriptor& descriptor,
                                             transport::TaskSupervisor& supervisor,
                                             SpaEventCallback on_event) = 0;

    /// Called only for a session whose handshake completed.
    virtual std::unique_ptr<ISpaFacade> create_facade(ISpa& spa) = 0;
};

} // namespace spa
