/**
 * @file directory_provider.cpp
 * @brief Device spec parsing.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/core/directory_provider.hpp"

#include <stdexcept>

namespace kasad {
namespace core {

DeviceCandidate parseDeviceSpec(const std::string& spec, uint16_t defaultPort) {
    auto first = spec.find(',');
    auto second = first == std::string::npos ? std::string::npos : spec.find(',', first + 1);
    if (second == std::string::npos) {
        throw std::invalid_argument("device spec '" + spec +
                                    "' is not <id>,<alias>,<host>[:<port>]");
    }

    DeviceCandidate candidate;
    candidate.device_id = spec.substr(0, first);
    candidate.alias = spec.substr(first + 1, second - first - 1);
    std::string address = spec.substr(second + 1);

    if (candidate.device_id.empty()) {
        throw std::invalid_argument("device spec '" + spec + "' has an empty id");
    }

    auto parsed = net::SocketAddress::parse(address, defaultPort);
    if (!parsed) {
        throw std::invalid_argument("device spec '" + spec + "' has a bad address '" +
                                    address + "'");
    }
    candidate.address = *parsed;
    return candidate;
}

}  // namespace core
}  // namespace kasad
