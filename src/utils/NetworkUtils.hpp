#pragma once
#include "../core/PeerAddress.hpp"
#include <chrono>
#include <string>
#include <netinet/in.h>

class NetworkUtils {
public:
    // Resolves an IPv4 host name or dotted quad. Throws NetworkError.
    static sockaddr_in to_sockaddr(const PeerAddress& address);
    static PeerAddress from_sockaddr(const sockaddr_in& addr);

    // Waits until the descriptor is readable. False on timeout.
    static bool wait_readable(int fd, std::chrono::milliseconds timeout);
    static uint16_t bound_port(int fd);
    static std::string last_error();
};

// Owns a socket descriptor and closes it on scope exit.
class SocketHandle {
public:
    SocketHandle() = default;
    explicit SocketHandle(int fd) : fd(fd) {}
    ~SocketHandle() { reset(); }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;
    SocketHandle(SocketHandle&& other) noexcept : fd(other.release()) {}
    SocketHandle& operator=(SocketHandle&& other) noexcept;

    int get() const { return fd; }
    bool valid() const { return fd >= 0; }
    int release();
    void reset(int new_fd = -1);

private:
    int fd = -1;
};
