/**
 * @file spa/ISpaFacade.hpp
 * @brief Control surface handed to the host once a session is ready.
 */
#pragma once

#include "spa/SpaDescriptor.hpp"

#include <string>

namespace spa {

/// Owned by the manager; do not keep a pointer across a reset.
class ISpaFacade {
public:
    virtual ~ISpaFacade() = default;

    virtual const SpaDescriptor& descriptor() const = 0;
    virtual std::string name() const = 0;
};

} // namespace spa
