/**
 * @file spa/SpaEvent.hpp
 * @brief Protocol and lifecycle events flowing through the manager's dispatcher.
 */
#pragma once

#include <cstdint>
#include <string>

namespace spa {

enum class SpaEvent : uint8_t {
    // Manager scope
    SPA_MAN_ENTER,
    SPA_MAN_EXIT,
    // Discovery
    LOCATING_STARTED,
    LOCATING_DISCOVERED_SPA,
    LOCATING_FINISHED,
    SPA_NOT_FOUND,
    // Connection
    CONNECTION_STARTED,
    CONNECTION_GOT_CHANNEL,
    CONNECTION_GOT_CONFIG_FILES,
    CONNECTION_PROTOCOL_RETRY_COUNT_EXCEEDED,
    CONNECTION_SPA_COMPLETE,
    CONNECTION_FINISHED,
    // Running session
    RUNNING_PING_RECEIVED,
    RUNNING_PING_NO_RESPONSE,
    RUNNING_SPA_DISCONNECTED,
    // Faults
    ERROR_PROTOCOL_RETRY_COUNT_EXCEEDED,
    ERROR_RF_ERROR,
    ERROR_TOO_MANY_RF_ERRORS
};

inline std::string to_string(SpaEvent event) {
    switch (event) {
        case SpaEvent::SPA_MAN_ENTER:                            return "SPA_MAN_ENTER";
        case SpaEvent::SPA_MAN_EXIT:                             return "SPA_MAN_EXIT";
        case SpaEvent::LOCATING_STARTED:                         return "LOCATING_STARTED";
        case SpaEvent::LOCATING_DISCOVERED_SPA:                  return "LOCATING_DISCOVERED_SPA";
        case SpaEvent::LOCATING_FINISHED:                        return "LOCATING_FINISHED";
        case SpaEvent::SPA_NOT_FOUND:                            return "SPA_NOT_FOUND";
        case SpaEvent::CONNECTION_STARTED:                       return "CONNECTION_STARTED";
        case SpaEvent::CONNECTION_GOT_CHANNEL:                   return "CONNECTION_GOT_CHANNEL";
        case SpaEvent::CONNECTION_GOT_CONFIG_FILES:              return "CONNECTION_GOT_CONFIG_FILES";
        case SpaEvent::CONNECTION_PROTOCOL_RETRY_COUNT_EXCEEDED: return "CONNECTION_PROTOCOL_RETRY_COUNT_EXCEEDED";
        case SpaEvent::CONNECTION_SPA_COMPLETE:                  return "CONNECTION_SPA_COMPLETE";
        case SpaEvent::CONNECTION_FINISHED:                      return "CONNECTION_FINISHED";
        case SpaEvent::RUNNING_PING_RECEIVED:                    return "RUNNING_PING_RECEIVED";
        case SpaEvent::RUNNING_PING_NO_RESPONSE:                 return "RUNNING_PING_NO_RESPONSE";
        case SpaEvent::RUNNING_SPA_DISCONNECTED:                 return "RUNNING_SPA_DISCONNECTED";
        case SpaEvent::ERROR_PROTOCOL_RETRY_COUNT_EXCEEDED:      return "ERROR_PROTOCOL_RETRY_COUNT_EXCEEDED";
        case SpaEvent::ERROR_RF_ERROR:                           return "ERROR_RF_ERROR";
        case SpaEvent::ERROR_TOO_MANY_RF_ERRORS:                 return "ERROR_TOO_MANY_RF_ERRORS";
        default:                                                 return "UNKNOWN";
    }
}

} // namespace spa
