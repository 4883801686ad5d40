#pragma once
#include "../core/Config.hpp"
#include "../core/FileDescriptor.hpp"
#include "../core/PeerRecord.hpp"
#include "../utils/NetworkUtils.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

using json = nlohmann::json;

// UDP client for the tracker protocol. Each call is one request/response
// exchange with a timeout, resent up to `retries` times before giving up with
// NetworkError. Non-OK statuses come back as the matching RegistryError.
class TrackerClient {
public:
    TrackerClient(const PeerAddress& tracker,
                  std::chrono::milliseconds timeout = Config::DEFAULT_REQUEST_TIMEOUT,
                  int retries = Config::DEFAULT_TRACKER_RETRIES);

    // An empty advertised host lets the tracker use the datagram's source address.
    // Files that do not fit the registration datagram are announced in batches.
    PeerRecord register_peer(const std::string& peer_id, const std::string& username,
                             const PeerAddress& advertised, const std::vector<FileDescriptor>& files = {});
    void heartbeat(const std::string& peer_id);
    void announce_file(const std::string& peer_id, const FileDescriptor& descriptor);
    bool withdraw_file(const std::string& peer_id, const std::string& file_id);
    std::vector<PeerRecord> query_peers(const std::string& file_id);
    bool deregister(const std::string& peer_id);
    void rename(const std::string& peer_id, const std::string& username);

    bool ping();
    std::vector<PeerRecord> list_peers();
    std::vector<FileListing> list_files();

    const PeerAddress& tracker_address() const { return tracker; }

private:
    json send_request(json request);
    std::vector<json> file_batches(const std::vector<FileDescriptor>& files, size_t request_size);
    std::vector<PeerRecord> parse_peers(const json& result);

    PeerAddress tracker;
    std::chrono::milliseconds timeout;
    int retries;

    SocketHandle sock;
    uint64_t next_request_id = 0;
    std::mutex mtx;
};
