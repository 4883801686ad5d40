#pragma once
#include "FileDescriptor.hpp"
#include "../network/TrackerClient.hpp"
#include "../network/TransferServer.hpp"
#include "../storage/SharedDirectory.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Serving role of a peer: answers chunk and metadata requests from local
// storage and keeps the tracker's view of the shared files current.
class Seeder {
private:
    SharedDirectory& storage;
    TrackerClient& tracker;
    std::string peer_id;
    TransferServer server;

public:
    Seeder(SharedDirectory& storage, TrackerClient& tracker, std::string peer_id,
           std::chrono::milliseconds read_timeout = Config::TRANSFER_READ_TIMEOUT);

    void start(uint16_t port, const std::string& bind_host = "0.0.0.0");
    void stop();
    uint16_t port() const { return server.port(); }
    bool is_running() const { return server.is_running(); }

    // Describes, stores and announces one file.
    FileDescriptor share_file(const std::string& path);
    // Announces files that appeared in the shared directory.
    std::vector<FileDescriptor> scan();
    // Withdraws files deleted from disk. Returns their ids.
    std::vector<std::string> refresh();

    std::vector<FileDescriptor> shared_files() const;
};
