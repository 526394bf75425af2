// LoggingEventHandler.cpp - Logs spa lifecycle events for the host executable
#include "LoggingEventHandler.hpp"
#include "spa/ISpaFacade.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace spaman {

using spa::SpaEvent;

LoggingEventHandler::LoggingEventHandler(std::shared_ptr<Logger> logger,
                                         std::optional<std::string> spa_name,
                                         std::function<std::string()> status_provider)
    : logger_(std::move(logger))
    , spa_name_(std::move(spa_name))
    , status_provider_(std::move(status_provider)) {
    if (!logger_) {
        throw std::invalid_argument("LoggingEventHandler: logger cannot be null");
    }
}

Task<void> LoggingEventHandler::handle_event(SpaEvent event, const spa::SpaEventPayload& payload) {
    counts_[event]++;
    total_events_++;

    switch (event) {
        case SpaEvent::SPA_MAN_ENTER:
            logger_->info("Host: spa manager started");
            break;

        case SpaEvent::SPA_MAN_EXIT:
            if (payload.exception) {
                try {
                    std::rethrow_exception(payload.exception);
                } catch (const std::exception& e) {
                    logger_->warning(std::string("Host: spa manager leaving on failure: ") + e.what());
                } catch (...) {
                    logger_->warning("Host: spa manager leaving on a non-standard exception");
                }
            } else {
                logger_->info("Host: spa manager stopping");
            }
            break;

        case SpaEvent::LOCATING_DISCOVERED_SPA:
            if (payload.descriptor) {
                logger_->info("Host: discovered " + payload.descriptor->to_string());
            }
            break;

        case SpaEvent::LOCATING_FINISHED: {
            const size_t found = payload.spa_descriptors ? payload.spa_descriptors->size() : 0;
            logger_->info("Host: discovery finished, " + std::to_string(found) + " spa(s) [" + status() + "]");
            break;
        }

        case SpaEvent::SPA_NOT_FOUND: {
            std::string what = spa_name_ ? "'" + *spa_name_ + "'" : std::string("spa");
            if (payload.spa_identifier) what += " (ID " + *payload.spa_identifier + ")";
            if (payload.spa_address) what += " at " + *payload.spa_address;
            logger_->warning("Host: could not find " + what);
            break;
        }

        case SpaEvent::CONNECTION_FINISHED:
            if (payload.facade) {
                logger_->info("Host: connected to " + payload.facade->name() + " [" + status() + "]");
            } else {
                logger_->warning("Host: connection attempt ended without a usable spa [" + status() + "]");
            }
            break;

        case SpaEvent::RUNNING_PING_NO_RESPONSE:
        case SpaEvent::ERROR_RF_ERROR:
        case SpaEvent::RUNNING_SPA_DISCONNECTED:
            logger_->warning("Host: " + spa::to_string(event) + " [" + status() + "]");
            break;

        case SpaEvent::CONNECTION_PROTOCOL_RETRY_COUNT_EXCEEDED:
        case SpaEvent::ERROR_PROTOCOL_RETRY_COUNT_EXCEEDED:
        case SpaEvent::ERROR_TOO_MANY_RF_ERRORS:
            logger_->error("Host: spa needs attention after " + spa::to_string(event));
            break;

        default:
            logger_->debug("Host: " + spa::to_string(event) + " [" + status() + "]");
            break;
    }
    co_return;
}

size_t LoggingEventHandler::event_count(SpaEvent event) const {
    auto it = counts_.find(event);
    return it == counts_.end() ? 0 : it->second;
}

std::string LoggingEventHandler::format_summary() const {
    std::string out = "Events handled: " + std::to_string(total_events_);
    for (const auto& [event, count] : counts_) {
        out += "\n  " + spa::to_string(event) + ": " + std::to_string(count);
    }
    return out;
}

std::string LoggingEventHandler::status() const {
    return status_provider_ ? status_provider_() : std::string("-");
}

} // namespace spaman
