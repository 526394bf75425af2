/**
 * @file spa/SpaDescriptor.hpp
 * @brief Data identifying one discovered spa, prior to any connection.
 */
#pragma once

#include <cstdint>
#include <string>

namespace spa {

/// Default port spa controllers listen on for the discovery/connect protocol.
inline constexpr uint16_t kDefaultSpaPort = 10022;

/**
 * @brief One device as reported by discovery.
 *
 * Plain value type; copies are handed to connect operations and event payloads.
 */
struct SpaDescriptor {
    std::string identifier;          ///< Stable device identifier used for connect-by-identifier
    std::string name;                ///< User-visible spa name
    std::string address;             ///< Network address the spa answered from
    uint16_t port{kDefaultSpaPort};

    std::string to_string() const {
        return name + "(" + identifier + ") at " + address + ":" + std::to_string(port);
    }

    bool operator==(const SpaDescriptor&) const = default;
};

} // namespace spa
