// SpaManager.hpp - Connection lifecycle manager for a single spa
#pragma once

#include "spa/ClientId.hpp"
#include "spa/ISpa.hpp"
#include "spa/ISpaBackend.hpp"
#include "spa/ISpaEventHandler.hpp"
#include "spa/ISpaFacade.hpp"
#include "spa/SpaDescriptor.hpp"
#include "spa/SpaEvent.hpp"
#include "spa/SpaEventPayload.hpp"
#include "spa/SpaState.hpp"
#include "transport/coro/AsyncCondition.hpp"
#include "transport/coro/CoroTask.hpp"
#include "transport/coro/TaskSupervisor.hpp"
#include "transport/coro/coroIoContext.hpp"
#include "logger.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spaman {

/**
 * \defgroup spaman_module Spa Manager Module
 * \brief Connection lifecycle state machine and sequence pump.
 */

/**
 * \file manager/SpaManager.hpp
 * \brief Declares the spa connection lifecycle manager.
 * \ingroup spaman_module
 */

/// Construction parameters. Empty hint strings are treated as absent.
struct SpaManagerConfig {
    std::string client_uuid;
    std::optional<std::string> spa_address;
    std::optional<std::string> spa_identifier;
    std::optional<std::string> spa_name;
    /// Pause between pump iterations; zero yields without delay.
    std::chrono::milliseconds pump_interval{0};
    /// Pause after an operation failed inside the pump.
    std::chrono::milliseconds error_backoff{1000};
};

/**
 * \brief Owns the connection to one spa: discovery, session, facade and fault recovery.
 * \ingroup spaman_module
 *
 * Responsibilities:
 * - Map every event to a lifecycle state and rebuild the status line, then forward the event
 *   unchanged to the host's `ISpaEventHandler`.
 * - Run the "Sequence Pump" background task while entered; when idle it connects by the
 *   configured identifier, or runs discovery once when no identifier is configured.
 * - Reset (disconnect and forget everything) when a ping arrives in a recoverable error state.
 *
 * All members are used from the `CoroIoContext` thread only.
 */
class SpaManager {
public:
    /**
     * \throws std::invalid_argument on an empty client uuid or a null collaborator.
     */
    SpaManager(SpaManagerConfig config,
               std::shared_ptr<spa::ISpaBackend> backend,
               std::shared_ptr<spa::ISpaEventHandler> handler,
               std::shared_ptr<transport::CoroIoContext> context,
               std::shared_ptr<Logger> logger);
    ~SpaManager();

    SpaManager(const SpaManager&) = delete;
    SpaManager& operator=(const SpaManager&) = delete;

    // --- Scope ---
    /** \brief Dispatch SPA_MAN_ENTER and start the sequence pump. */
    Task<void> async_enter();
    /**
     * \brief Cancel the pump, dispatch SPA_MAN_EXIT and stop all background tasks.
     * \param failure Exception the scope is being left with, forwarded in the exit payload.
     */
    Task<void> async_exit(std::exception_ptr failure = nullptr);
    /** \brief Enter, run `body`, exit (also when `body` throws), then rethrow the body's failure. */
    Task<void> run_scoped(std::function<Task<void>(SpaManager&)> body);

    // --- Operations ---
    /**
     * \brief Forget descriptors and facade, disconnect the session and return to IDLE.
     *
     * Operations still in flight against the old session or locator finish without touching the
     * new state; events they report afterwards are dropped.
     */
    Task<void> async_reset();

    /**
     * \brief Run discovery; LOCATING_FINISHED is dispatched even when discovery throws.
     * \return Stored descriptors, or nullopt if no discovery has completed since the last reset.
     */
    Task<std::optional<std::vector<spa::SpaDescriptor>>> async_locate_spas(
        std::optional<std::string> spa_address = std::nullopt,
        std::optional<std::string> spa_identifier = std::nullopt);

    /**
     * \brief Connect to `descriptor`; CONNECTION_FINISHED is dispatched even when connecting throws.
     * \return Facade if the handshake left the manager in SPA_READY, else nullptr.
     * \throws std::logic_error if a session or facade already exists.
     */
    Task<spa::ISpaFacade*> async_connect_to_spa(spa::SpaDescriptor descriptor);

    /**
     * \brief Discover by identifier (and address) and connect to the first match.
     * \return Facade, or nullptr when nothing matched (SPA_NOT_FOUND dispatched) or not ready.
     */
    Task<spa::ISpaFacade*> async_connect(std::string spa_identifier,
                                         std::optional<std::string> spa_address = std::nullopt);

    /** \brief Replace the hints the pump works from, then reset. */
    Task<void> async_set_spa_info(std::optional<std::string> spa_address,
                                  std::optional<std::string> spa_identifier,
                                  std::optional<std::string> spa_name);

    /** \brief Complete once descriptors are available. */
    Task<void> wait_for_descriptors();
    /** \brief Complete once a facade is available. */
    Task<void> wait_for_facade();

    // --- Properties ---
    const std::optional<std::vector<spa::SpaDescriptor>>& spa_descriptors() const { return spa_descriptors_; }
    /// Non-owning; invalidated by the next reset.
    spa::ISpaFacade* facade() const { return facade_.get(); }
    spa::ISpa* spa() const { return spa_.get(); }
    spa::SpaState spa_state() const { return spa_state_; }
    const std::string& status_line() const { return status_line_; }
    const std::optional<std::string>& spa_address() const { return spa_address_; }
    const std::optional<std::string>& spa_identifier() const { return spa_identifier_; }
    const std::optional<std::string>& spa_name() const { return spa_name_; }
    const spa::ClientId& client_id() const { return client_id_; }
    bool is_entered() const { return entered_; }
    transport::TaskSupervisor& supervisor() { return *supervisor_; }

    std::string to_string() const { return status_line_; }

private:
    /** \brief Apply the transition for `event`, rebuild the status line and forward to the handler. */
    Task<void> dispatch_event(spa::SpaEvent event, spa::SpaEventPayload payload);
    /**
     * \brief Callback handed to collaborators; routes their events through `dispatch_event`.
     * \param generation Reset generation the collaborator belongs to; later events are dropped.
     */
    spa::SpaEventCallback event_callback(uint64_t generation);
    /** \brief Release detached sessions that no operation references any more. */
    void reap_retired_sessions();

    Task<void> sequence_pump();
    Task<void> pump_step();

    static std::optional<std::string> normalize_hint(std::optional<std::string> hint);

    SpaManagerConfig config_;
    std::shared_ptr<spa::ISpaBackend> backend_;
    std::shared_ptr<spa::ISpaEventHandler> handler_;
    std::shared_ptr<transport::CoroIoContext> context_;
    std::shared_ptr<Logger> logger_;

    spa::ClientId client_id_;
    std::optional<std::string> spa_address_;
    std::optional<std::string> spa_identifier_;
    std::optional<std::string> spa_name_;

    std::optional<std::vector<spa::SpaDescriptor>> spa_descriptors_;
    // Shared with the connect operation so a reset cannot free a session mid-handshake.
    std::shared_ptr<spa::ISpa> spa_;
    std::vector<std::shared_ptr<spa::ISpa>> retired_sessions_;
    uint64_t reset_generation_{0};
    std::unique_ptr<spa::ISpaFacade> facade_;
    spa::SpaState spa_state_{spa::SpaState::IDLE};
    std::string status_line_;
    bool entered_{false};

    transport::AsyncCondition changed_;
    // Declared last: destroyed first, draining background tasks while the members above still exist.
    std::unique_ptr<transport::TaskSupervisor> supervisor_;
};

} // namespace spaman
