#pragma once
#include "PeerRegistry.hpp"
#include "../utils/NetworkUtils.hpp"
#include "../utils/WorkQueue.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <netinet/in.h>

// UDP front end of the tracker. One receive thread hands datagrams to a pool of
// workers; a sweeper thread evicts peers that stopped sending heartbeats.
class TrackerServer {
public:
    explicit TrackerServer(PeerRegistry& registry, int num_workers = Config::TRACKER_WORKERS);
    ~TrackerServer();

    TrackerServer(const TrackerServer&) = delete;
    TrackerServer& operator=(const TrackerServer&) = delete;

    // Port 0 binds an ephemeral port; see port().
    void start(uint16_t port, const std::string& bind_host = "0.0.0.0");
    void stop();
    // Blocks until stop() is called from another thread.
    void wait();

    uint16_t port() const { return bound_port; }
    bool is_running() const { return running; }

private:
    struct Datagram {
        std::string payload;
        sockaddr_in from{};
    };

    void receive_loop();
    void worker_loop();
    void sweep_loop();

    PeerRegistry& registry;
    int num_workers;
    SocketHandle sock;
    uint16_t bound_port = 0;
    std::atomic<bool> running{false};

    WorkQueue<Datagram> queue;
    std::thread receiver;
    std::thread sweeper;
    std::vector<std::thread> workers;

    std::mutex state_mtx;
    std::condition_variable state_cv;
};
