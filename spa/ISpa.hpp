/**
 * @file spa/ISpa.hpp
 * @brief Session collaborator: the live protocol connection to one spa.
 */
#pragma once

#include "spa/SpaDescriptor.hpp"
#include "transport/coro/CoroTask.hpp"

namespace spa {

/**
 * @brief One connection attempt to one spa.
 *
 * `connect()` performs the handshake and reports progress through the event callback it was
 * created with; a successful handshake is signalled by CONNECTION_SPA_COMPLETE, not by the
 * return of `connect()`. `disconnect()` must be safe to call at any point, also repeatedly.
 */
class ISpa {
public:
    virtual ~ISpa() = default;

    virtual Task<void> connect() = 0;
    virtual Task<void> disconnect() = 0;

    virtual const SpaDescriptor& descriptor() const = 0;
};

} // namespace spa
