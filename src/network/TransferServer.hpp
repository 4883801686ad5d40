#pragma once
#include "PeerConnection.hpp"
#include "../core/Config.hpp"
#include "../storage/FileStorage.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>

// Seeder side of the transfer protocol. Every accepted connection gets its own
// thread and read timeout, so a stalled downloader only ties up itself. Chunks
// come from the storage, which is only ever read here.
class TransferServer {
public:
    explicit TransferServer(const FileStorage& storage,
                            std::chrono::milliseconds read_timeout = Config::TRANSFER_READ_TIMEOUT,
                            size_t max_connections = Config::MAX_TRANSFER_CONNECTIONS);
    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    // Port 0 binds an ephemeral port; see port().
    void start(uint16_t port, const std::string& bind_host = "0.0.0.0");
    void stop();

    uint16_t port() const { return bound_port; }
    bool is_running() const { return running; }
    size_t active_connections() const;

private:
    struct Connection {
        std::thread thread;
        int fd = -1;
        bool done = false;
    };

    void accept_loop();
    void serve_connection(uint64_t id, SocketHandle sock, PeerAddress remote);
    // Returns false when the connection should be closed.
    bool handle_request(int fd, const Message& request);
    void reap_finished();

    const FileStorage& storage;
    std::chrono::milliseconds read_timeout;
    size_t max_connections;

    SocketHandle listener;
    uint16_t bound_port = 0;
    std::atomic<bool> running{false};
    std::thread acceptor;

    std::map<uint64_t, Connection> connections;
    uint64_t next_connection_id = 0;
    mutable std::mutex conn_mtx;
};
