/**
 * @file spa/SpaState.hpp
 * @brief Connection lifecycle states of the spa manager.
 */
#pragma once

#include <cstdint>
#include <string>

namespace spa {

enum class SpaState : uint8_t {
    IDLE,
    LOCATING_SPAS,
    CONNECTING,
    SPA_READY,              ///< Handshake complete; facade not created yet
    CONNECTED,
    ERROR_SPA_NOT_FOUND,
    ERROR_PING_MISSED,
    ERROR_RF_FAULT,
    ERROR_NEEDS_ATTENTION
};

inline std::string to_string(SpaState state) {
    switch (state) {
        case SpaState::IDLE:                  return "IDLE";
        case SpaState::LOCATING_SPAS:         return "LOCATING_SPAS";
        case SpaState::CONNECTING:            return "CONNECTING";
        case SpaState::SPA_READY:             return "SPA_READY";
        case SpaState::CONNECTED:             return "CONNECTED";
        case SpaState::ERROR_SPA_NOT_FOUND:   return "ERROR_SPA_NOT_FOUND";
        case SpaState::ERROR_PING_MISSED:     return "ERROR_PING_MISSED";
        case SpaState::ERROR_RF_FAULT:        return "ERROR_RF_FAULT";
        case SpaState::ERROR_NEEDS_ATTENTION: return "ERROR_NEEDS_ATTENTION";
        default:                              return "UNKNOWN";
    }
}

/// States left only through a reset triggered by a later successful ping.
inline bool is_recoverable_error(SpaState state) {
    return state == SpaState::ERROR_PING_MISSED ||
           state == SpaState::ERROR_RF_FAULT ||
           state == SpaState::ERROR_NEEDS_ATTENTION;
}

} // namespace spa
