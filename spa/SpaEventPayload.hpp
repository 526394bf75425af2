/**
 * @file spa/SpaEventPayload.hpp
 * @brief Payload carried with every dispatched event, and the callback type collaborators emit through.
 */
#pragma once

#include "spa/SpaDescriptor.hpp"
#include "spa/SpaEvent.hpp"
#include "transport/coro/CoroTask.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace spa {

class ISpaFacade;

/**
 * @brief Event arguments. Each event fills the fields that apply to it; the rest stay empty.
 *
 * The dispatcher forwards the payload to the host handler exactly as received.
 */
struct SpaEventPayload {
    std::optional<std::vector<SpaDescriptor>> spa_descriptors; ///< LOCATING_FINISHED
    ISpaFacade* facade{nullptr};                               ///< CONNECTION_FINISHED (non-owning)
    std::optional<std::string> spa_address;                    ///< SPA_NOT_FOUND
    std::optional<std::string> spa_identifier;                 ///< SPA_NOT_FOUND
    std::optional<SpaDescriptor> descriptor;                   ///< per-spa discovery and session events
    std::exception_ptr exception;                              ///< SPA_MAN_EXIT, when leaving on failure
    std::string detail;
};

/// Channel through which locators and sessions report events back to the manager.
using SpaEventCallback = std::function<Task<void>(SpaEvent, SpaEventPayload)>;

} // namespace spa
