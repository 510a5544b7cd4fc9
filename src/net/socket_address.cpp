/**
 * @file socket_address.cpp
 * @brief SocketAddress parsing.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/net/socket_address.hpp"

#include <cctype>

namespace kasad {
namespace net {

std::optional<SocketAddress> SocketAddress::parse(const std::string& text,
                                                  uint16_t defaultPort) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos) {
        if (text.empty()) {
            return std::nullopt;
        }
        return SocketAddress(text, defaultPort);
    }

    std::string host = text.substr(0, colon);
    std::string portText = text.substr(colon + 1);
    if (host.empty() || portText.empty() || portText.size() > 5) {
        return std::nullopt;
    }

    unsigned long port = 0;
    for (char c : portText) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        port = port * 10 + static_cast<unsigned long>(c - '0');
    }
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }

    return SocketAddress(host, static_cast<uint16_t>(port));
}

}  // namespace net
}  // namespace kasad
