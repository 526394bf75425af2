/**
 * @file spa/ISpaEventHandler.hpp
 * @brief Host-application extension point receiving every dispatched event.
 */
#pragma once

#include "spa/SpaEventPayload.hpp"
#include "transport/coro/CoroTask.hpp"

namespace spa {

/**
 * @brief Implemented by the embedding application (UI updates, reconnect policy, logging).
 *
 * Called after the manager has applied the event's state transition, so the manager's
 * `spa_state()` already reflects the event. An exception thrown here propagates to
 * whichever operation dispatched the event.
 */
class ISpaEventHandler {
public:
    virtual ~ISpaEventHandler() = default;

    virtual Task<void> handle_event(SpaEvent event, const SpaEventPayload& payload) = 0;
};

} // namespace spa
