/**
 * @file spa/ClientId.hpp
 * @brief Identity bytes this client presents to the spa.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace spa {

using ClientId = std::vector<uint8_t>;

/**
 * @brief Build the client identity from a caller-supplied UUID string.
 * @throws std::invalid_argument if `client_uuid` is empty.
 */
ClientId make_client_id(const std::string& client_uuid);

/// Printable form of a client identity (bytes taken as characters).
std::string client_id_to_string(const ClientId& client_id);

} // namespace spa
