#include "NetworkUtils.hpp"
#include "../core/Errors.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

sockaddr_in NetworkUtils::to_sockaddr(const PeerAddress& address) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(address.port);

    if (inet_pton(AF_INET, address.ip.c_str(), &addr.sin_addr) == 1) {
        return addr;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    addrinfo* result = nullptr;
    int rc = getaddrinfo(address.ip.c_str(), nullptr, &hints, &result);
    if (rc != 0 || result == nullptr) {
        throw NetworkError("Could not resolve host " + address.ip + ": " + gai_strerror(rc));
    }
    addr.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return addr;
}

PeerAddress NetworkUtils::from_sockaddr(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return PeerAddress(ip, ntohs(addr.sin_port));
}

bool NetworkUtils::wait_readable(int fd, std::chrono::milliseconds timeout) {
    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(fd, &read_fds);

    struct timeval tv;
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);

    int result = select(fd + 1, &read_fds, NULL, NULL, &tv);
    if (result < 0 && errno != EINTR) {
        throw NetworkError("select() failed: " + last_error());
    }
    return result > 0;
}

uint16_t NetworkUtils::bound_port(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        throw NetworkError("getsockname() failed: " + last_error());
    }
    return ntohs(addr.sin_port);
}

std::string NetworkUtils::last_error() {
    return strerror(errno);
}

SocketHandle& SocketHandle::operator=(SocketHandle&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

int SocketHandle::release() {
    int released = fd;
    fd = -1;
    return released;
}

void SocketHandle::reset(int new_fd) {
    if (fd >= 0) {
        close(fd);
    }
    fd = new_fd;
}
