// SpaManager.cpp - Event dispatcher, lifecycle operations and sequence pump
#include "SpaManager.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

/**
 * \file manager/SpaManager.cpp
 * \brief Implements the spa connection lifecycle manager.
 * \ingroup spaman_module
 */

namespace spaman {

using spa::SpaEvent;
using spa::SpaEventPayload;
using spa::SpaState;

namespace {
    constexpr const char* kPumpTaskName = "Sequence Pump";
    constexpr const char* kPumpTaskKey = "SPAMAN";

    std::string describe_hint(const std::optional<std::string>& hint) {
        return hint ? *hint : std::string("<none>");
    }

    Task<void> ignore_event() {
        co_return;
    }
}

SpaManager::SpaManager(SpaManagerConfig config,
                       std::shared_ptr<spa::ISpaBackend> backend,
                       std::shared_ptr<spa::ISpaEventHandler> handler,
                       std::shared_ptr<transport::CoroIoContext> context,
                       std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , backend_(std::move(backend))
    , handler_(std::move(handler))
    , context_(std::move(context))
    , logger_(std::move(logger)) {

    if (!backend_ || !handler_ || !context_ || !logger_) {
        throw std::invalid_argument("SpaManager: backend, handler, context and logger cannot be null");
    }

    client_id_ = spa::make_client_id(config_.client_uuid);
    spa_address_ = normalize_hint(config_.spa_address);
    spa_identifier_ = normalize_hint(config_.spa_identifier);
    spa_name_ = normalize_hint(config_.spa_name);
    status_line_ = "State: " + spa::to_string(spa_state_);
    supervisor_ = std::make_unique<transport::TaskSupervisor>(context_, logger_);

    logger_->debug("SpaManager: created for client " + spa::client_id_to_string(client_id_) +
                   " ADDR:" + describe_hint(spa_address_) +
                   " ID:" + describe_hint(spa_identifier_) +
                   " NAME:" + describe_hint(spa_name_));
}

SpaManager::~SpaManager() {
    if (entered_) {
        logger_->warning("SpaManager: destroyed without async_exit()");
    }
}

// ---------------------------------------------------------------------------
// Scope
// ---------------------------------------------------------------------------

Task<void> SpaManager::async_enter() {
    if (entered_) {
        throw std::logic_error("SpaManager: already entered");
    }
    co_await supervisor_->async_enter();
    entered_ = true;
    SpaEventPayload payload;
    co_await dispatch_event(SpaEvent::SPA_MAN_ENTER, std::move(payload));
    supervisor_->add_task(sequence_pump(), kPumpTaskName, kPumpTaskKey);
}

Task<void> SpaManager::async_exit(std::exception_ptr failure) {
    // No automatic connection attempts once teardown has begun.
    supervisor_->cancel_key_tasks(kPumpTaskKey);

    // A throwing handler must not leave background tasks running.
    std::exception_ptr handler_failure;
    try {
        SpaEventPayload payload;
        payload.exception = failure;
        co_await dispatch_event(SpaEvent::SPA_MAN_EXIT, std::move(payload));
    } catch (...) {
        handler_failure = std::current_exception();
    }

    co_await supervisor_->async_exit();
    entered_ = false;
    if (handler_failure) {
        std::rethrow_exception(handler_failure);
    }
}

Task<void> SpaManager::run_scoped(std::function<Task<void>(SpaManager&)> body) {
    co_await async_enter();

    std::exception_ptr failure;
    try {
        co_await body(*this);
    } catch (...) {
        failure = std::current_exception();
    }

    co_await async_exit(failure);
    if (failure) {
        std::rethrow_exception(failure);
    }
}

// ---------------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------------

Task<void> SpaManager::async_reset() {
    reset_generation_++;
    spa_descriptors_.reset();
    facade_.reset();

    if (spa_) {
        // The session may be the caller of this reset (ping event) or still inside connect(),
        // so it is retired rather than destroyed here.
        std::shared_ptr<spa::ISpa> spa = std::move(spa_);
        retired_sessions_.push_back(spa);
        co_await spa->disconnect();
    }

    spa_state_ = SpaState::IDLE;
    changed_.notify_all();
}

Task<std::optional<std::vector<spa::SpaDescriptor>>> SpaManager::async_locate_spas(
    std::optional<std::string> spa_address,
    std::optional<std::string> spa_identifier) {

    const uint64_t generation = reset_generation_;
    std::exception_ptr failure;
    try {
        SpaEventPayload started;
        co_await dispatch_event(SpaEvent::LOCATING_STARTED, std::move(started));
        auto locator = backend_->create_locator(*supervisor_, event_callback(generation), spa_address, spa_identifier);
        co_await locator->discover();
        if (generation == reset_generation_) {
            spa_descriptors_ = locator->spas();
        } else {
            logger_->debug("SpaManager: discarding discovery results from before a reset");
        }
    } catch (...) {
        failure = std::current_exception();
    }

    SpaEventPayload finished;
    finished.spa_descriptors = spa_descriptors_;
    co_await dispatch_event(SpaEvent::LOCATING_FINISHED, std::move(finished));

    if (failure) {
        std::rethrow_exception(failure);
    }
    co_return spa_descriptors_;
}

Task<spa::ISpaFacade*> SpaManager::async_connect_to_spa(spa::SpaDescriptor descriptor) {
    if (facade_ || spa_) {
        throw std::logic_error("SpaManager: connect requested while a session already exists");
    }

    reap_retired_sessions();

    const uint64_t generation = reset_generation_;
    std::exception_ptr failure;
    try {
        SpaEventPayload started;
        started.descriptor = descriptor;
        co_await dispatch_event(SpaEvent::CONNECTION_STARTED, std::move(started));

        std::shared_ptr<spa::ISpa> session =
            backend_->create_spa(client_id_, descriptor, *supervisor_, event_callback(generation));
        spa_ = session;
        co_await session->connect();

        if (generation != reset_generation_) {
            logger_->debug("SpaManager: session to " + descriptor.to_string() + " was reset during connect");
        } else if (spa_state_ == SpaState::SPA_READY) {
            facade_ = backend_->create_facade(*session);
        }
    } catch (...) {
        failure = std::current_exception();
    }

    spa::ISpaFacade* facade = generation == reset_generation_ ? facade_.get() : nullptr;
    SpaEventPayload finished;
    finished.facade = facade;
    finished.descriptor = descriptor;
    co_await dispatch_event(SpaEvent::CONNECTION_FINISHED, std::move(finished));

    if (failure) {
        std::rethrow_exception(failure);
    }
    co_return generation == reset_generation_ ? facade_.get() : nullptr;
}

Task<spa::ISpaFacade*> SpaManager::async_connect(std::string spa_identifier, std::optional<std::string> spa_address) {
    logger_->debug("SpaManager: async_connect ID:" + spa_identifier + " ADDR:" + describe_hint(spa_address));

    auto descriptors = co_await async_locate_spas(spa_address, spa_identifier);
    if (!descriptors) {
        // Reset while discovery was finishing; the pump re-evaluates from IDLE.
        logger_->debug("SpaManager: discovery for ID:" + spa_identifier + " was reset, not connecting");
        co_return nullptr;
    }

    if (descriptors->empty()) {
        SpaEventPayload payload;
        payload.spa_address = spa_address;
        payload.spa_identifier = spa_identifier;
        co_await dispatch_event(SpaEvent::SPA_NOT_FOUND, std::move(payload));
        co_return nullptr;
    }

    co_return co_await async_connect_to_spa(descriptors->front());
}

Task<void> SpaManager::async_set_spa_info(std::optional<std::string> spa_address,
                                          std::optional<std::string> spa_identifier,
                                          std::optional<std::string> spa_name) {
    spa_address_ = normalize_hint(std::move(spa_address));
    spa_identifier_ = normalize_hint(std::move(spa_identifier));
    spa_name_ = normalize_hint(std::move(spa_name));
    logger_->debug("SpaManager: set_spa_info ADDR:" + describe_hint(spa_address_) +
                   " ID:" + describe_hint(spa_identifier_) +
                   " NAME:" + describe_hint(spa_name_));
    co_await async_reset();
}

Task<void> SpaManager::wait_for_descriptors() {
    while (!spa_descriptors_) {
        co_await changed_.wait([this] { return spa_descriptors_.has_value(); });
    }
}

Task<void> SpaManager::wait_for_facade() {
    while (!facade_) {
        co_await changed_.wait([this] { return facade_ != nullptr; });
    }
}

// ---------------------------------------------------------------------------
// Event dispatcher
// ---------------------------------------------------------------------------

Task<void> SpaManager::dispatch_event(SpaEvent event, SpaEventPayload payload) {
    switch (event) {
        case SpaEvent::LOCATING_STARTED:
            spa_state_ = SpaState::LOCATING_SPAS;
            break;
        case SpaEvent::LOCATING_FINISHED:
            spa_state_ = SpaState::IDLE;
            break;
        case SpaEvent::SPA_NOT_FOUND:
            spa_state_ = SpaState::ERROR_SPA_NOT_FOUND;
            break;
        case SpaEvent::CONNECTION_STARTED:
            spa_state_ = SpaState::CONNECTING;
            break;
        case SpaEvent::CONNECTION_SPA_COMPLETE:
            spa_state_ = SpaState::SPA_READY;
            break;
        case SpaEvent::CONNECTION_FINISHED:
            if (facade_) {
                spa_state_ = SpaState::CONNECTED;
            }
            break;
        case SpaEvent::RUNNING_PING_NO_RESPONSE:
            spa_state_ = SpaState::ERROR_PING_MISSED;
            break;
        case SpaEvent::RUNNING_PING_RECEIVED:
            if (spa::is_recoverable_error(spa_state_)) {
                logger_->info("SpaManager: spa answered again in " + spa::to_string(spa_state_) + ", resetting");
                co_await async_reset();
            }
            break;
        case SpaEvent::ERROR_RF_ERROR:
            spa_state_ = SpaState::ERROR_RF_FAULT;
            break;
        case SpaEvent::CONNECTION_PROTOCOL_RETRY_COUNT_EXCEEDED:
        case SpaEvent::ERROR_PROTOCOL_RETRY_COUNT_EXCEEDED:
        case SpaEvent::ERROR_TOO_MANY_RF_ERRORS:
            spa_state_ = SpaState::ERROR_NEEDS_ATTENTION;
            break;
        // RUNNING_SPA_DISCONNECTED is forwarded without a transition; the host handler decides.
        default:
            break;
    }

    status_line_ = "State: " + spa::to_string(spa_state_) + ", last event " + spa::to_string(event);
    logger_->debug("SpaManager: " + status_line_);

    changed_.notify_all();

    co_await handler_->handle_event(event, payload);
}

spa::SpaEventCallback SpaManager::event_callback(uint64_t generation) {
    return [this, generation](SpaEvent event, SpaEventPayload payload) -> Task<void> {
        if (generation != reset_generation_) {
            logger_->debug("SpaManager: ignoring " + spa::to_string(event) + " from a detached collaborator");
            return ignore_event();
        }
        return dispatch_event(event, std::move(payload));
    };
}

void SpaManager::reap_retired_sessions() {
    retired_sessions_.erase(
        std::remove_if(retired_sessions_.begin(), retired_sessions_.end(),
                       [](const std::shared_ptr<spa::ISpa>& session) { return session.use_count() == 1; }),
        retired_sessions_.end());
}

// ---------------------------------------------------------------------------
// Sequence pump
// ---------------------------------------------------------------------------

Task<void> SpaManager::sequence_pump() {
    logger_->debug("SpaManager: sequence pump started");
    try {
        while (true) {
            bool failed = false;
            std::string failure;
            try {
                co_await pump_step();
            } catch (const transport::OperationCancelled&) {
                throw;
            } catch (const std::logic_error&) {
                throw;
            } catch (const std::exception& e) {
                failed = true;
                failure = e.what();
            }

            if (failed) {
                logger_->error("SpaManager: sequence pump step failed: " + failure);
                co_await transport::sleep_for(config_.error_backoff);
            } else if (config_.pump_interval.count() > 0) {
                co_await transport::sleep_for(config_.pump_interval);
            } else {
                co_await transport::yield();
            }
        }
    } catch (const transport::OperationCancelled&) {
        logger_->debug("SpaManager: sequence pump cancelled");
        throw;
    }
}

Task<void> SpaManager::pump_step() {
    if (spa_state_ != SpaState::IDLE) {
        co_return;
    }

    if (spa_identifier_) {
        if (!facade_) {
            co_await async_connect(*spa_identifier_, spa_address_);
        }
    } else if (!spa_descriptors_) {
        co_await async_locate_spas(spa_address_);
    }
}

std::optional<std::string> SpaManager::normalize_hint(std::optional<std::string> hint) {
    if (hint && hint->empty()) {
        return std::nullopt;
    }
    return hint;
}

} // namespace spaman
