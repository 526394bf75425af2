/**
 * @file spa/ISpaLocator.hpp
 * @brief Discovery collaborator: finds spas matching optional address/identifier hints.
 */
#pragma once

#include "spa/SpaDescriptor.hpp"
#include "transport/coro/CoroTask.hpp"

#include <vector>

namespace spa {

class ISpaLocator {
public:
    virtual ~ISpaLocator() = default;

    /// Probe the network; may throw on transport failure.
    virtual Task<void> discover() = 0;

    /// Spas found by the last completed `discover()`, in discovery order.
    virtual const std::vector<SpaDescriptor>& spas() const = 0;
};

} // namespace spa
