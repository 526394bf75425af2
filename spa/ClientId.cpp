#include "ClientId.hpp"

#include <stdexcept>

namespace spa {

namespace {
    // Prefix the controller expects in front of the client UUID.
    constexpr const char* kClientIdPrefix = "IOS";
}

ClientId make_client_id(const std::string& client_uuid) {
    if (client_uuid.empty()) {
        throw std::invalid_argument("client uuid cannot be empty");
    }
    const std::string text = std::string(kClientIdPrefix) + client_uuid;
    return ClientId(text.begin(), text.end());
}

std::string client_id_to_string(const ClientId& client_id) {
    return std::string(client_id.begin(), client_id.end());
}

} // namespace spa
