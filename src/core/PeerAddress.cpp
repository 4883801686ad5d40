#include "PeerAddress.hpp"
#include <stdexcept>

PeerAddress::PeerAddress(const std::string& ip, uint16_t port) : ip(ip), port(port) {}

PeerAddress PeerAddress::parse(const std::string& text) {
    size_t colon_pos = text.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 == text.size()) {
        throw std::invalid_argument("Invalid address format, expected <host>:<port>: " + text);
    }

    std::string port_text = text.substr(colon_pos + 1);
    size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(port_text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid port in address: " + text);
    }
    if (consumed != port_text.size() || port < 0 || port > 65535) {
        throw std::invalid_argument("Invalid port in address: " + text);
    }
    return PeerAddress(text.substr(0, colon_pos), static_cast<uint16_t>(port));
}

std::string PeerAddress::to_string() const {
    return ip + ":" + std::to_string(port);
}
