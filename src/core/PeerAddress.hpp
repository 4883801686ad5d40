#pragma once
#include <string>
#include <cstdint>

struct PeerAddress {
    std::string ip;
    uint16_t port = 0;

    PeerAddress() = default;
    PeerAddress(const std::string& ip, uint16_t port);

    // Parses "host:port". Throws std::invalid_argument.
    static PeerAddress parse(const std::string& text);

    std::string to_string() const;
    bool empty() const { return ip.empty() && port == 0; }

    bool operator==(const PeerAddress& other) const { return ip == other.ip && port == other.port; }
    bool operator!=(const PeerAddress& other) const { return !(*this == other); }
    bool operator<(const PeerAddress& other) const {
        return ip < other.ip || (ip == other.ip && port < other.port);
    }
};
