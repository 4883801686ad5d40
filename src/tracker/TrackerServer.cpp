#include "TrackerServer.hpp"
#include "TrackerProtocol.hpp"
#include "../core/Errors.hpp"
#include <arpa/inet.h>
#include <sys/socket.h>
#include <iostream>
#include <stdexcept>

namespace {
constexpr std::chrono::milliseconds POLL_INTERVAL{200};
}

TrackerServer::TrackerServer(PeerRegistry& registry, int num_workers)
    : registry(registry), num_workers(num_workers < 1 ? 1 : num_workers) {}

TrackerServer::~TrackerServer() {
    stop();
}

void TrackerServer::start(uint16_t port, const std::string& bind_host) {
    if (running) {
        throw std::logic_error("Tracker already running");
    }

    SocketHandle handle(socket(AF_INET, SOCK_DGRAM, 0));
    if (!handle.valid()) {
        throw NetworkError("Socket creation failed: " + NetworkUtils::last_error());
    }

    int reuse = 1;
    setsockopt(handle.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr = NetworkUtils::to_sockaddr(PeerAddress(bind_host, port));
    if (bind(handle.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw NetworkError("Failed to bind tracker to " + bind_host + ":" + std::to_string(port) + ": "
                           + NetworkUtils::last_error());
    }

    sock = std::move(handle);
    bound_port = NetworkUtils::bound_port(sock.get());
    running = true;

    receiver = std::thread(&TrackerServer::receive_loop, this);
    for (int i = 0; i < num_workers; ++i) {
        workers.emplace_back(&TrackerServer::worker_loop, this);
    }
    sweeper = std::thread(&TrackerServer::sweep_loop, this);

    std::cout << "Tracker listening on UDP port " << bound_port << " (liveness window "
              << registry.liveness_window().count() << " ms)" << std::endl;
}

void TrackerServer::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mtx);
        if (!running) {
            return;
        }
        running = false;
    }
    state_cv.notify_all();

    if (receiver.joinable()) {
        receiver.join();
    }
    queue.mark_finished();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
    if (sweeper.joinable()) {
        sweeper.join();
    }
    sock.reset();
    std::cout << "Tracker stopped" << std::endl;
}

void TrackerServer::wait() {
    std::unique_lock<std::mutex> lock(state_mtx);
    state_cv.wait(lock, [this] { return !running; });
}

void TrackerServer::receive_loop() {
    std::vector<char> buffer(Config::MAX_DATAGRAM_SIZE);

    while (running) {
        try {
            if (!NetworkUtils::wait_readable(sock.get(), POLL_INTERVAL)) {
                continue;
            }
            Datagram datagram;
            socklen_t len = sizeof(datagram.from);
            ssize_t n = recvfrom(sock.get(), buffer.data(), buffer.size(), 0,
                                 reinterpret_cast<sockaddr*>(&datagram.from), &len);
            if (n < 0) {
                std::cerr << "Error receiving datagram: " << NetworkUtils::last_error() << std::endl;
                continue;
            }
            datagram.payload.assign(buffer.data(), static_cast<size_t>(n));
            queue.push(std::move(datagram));
        } catch (const std::exception& e) {
            std::cerr << "Tracker receive error: " << e.what() << std::endl;
        }
    }
}

void TrackerServer::worker_loop() {
    Datagram datagram;
    while (queue.pop(datagram)) {
        try {
            PeerAddress source = NetworkUtils::from_sockaddr(datagram.from);
            std::string response = TrackerProtocol::handle(registry, datagram.payload, source.ip);
            ssize_t sent = sendto(sock.get(), response.data(), response.size(), 0,
                                  reinterpret_cast<const sockaddr*>(&datagram.from), sizeof(datagram.from));
            if (sent < 0) {
                std::cerr << "Failed to answer " << source.to_string() << ": "
                          << NetworkUtils::last_error() << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Tracker worker error: " << e.what() << std::endl;
        }
    }
}

void TrackerServer::sweep_loop() {
    std::unique_lock<std::mutex> lock(state_mtx);
    while (running) {
        state_cv.wait_for(lock, Config::SWEEP_INTERVAL, [this] { return !running; });
        if (!running) {
            break;
        }
        lock.unlock();
        size_t evicted = registry.evict_expired();
        if (evicted > 0) {
            std::cout << "Clean-up removed " << evicted << " inactive peer(s)" << std::endl;
        }
        lock.lock();
    }
}
