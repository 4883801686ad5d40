#pragma once
#include "Config.hpp"
#include "Leecher.hpp"
#include "Seeder.hpp"
#include "../download/ChunkSource.hpp"
#include "../download/ReseedPromoter.hpp"
#include "../network/TrackerClient.hpp"
#include "../storage/SharedDirectory.hpp"
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// One peer in the swarm: a single identity and tracker session with both the
// Seeder and the Leecher role attached. start() registers with the local file
// list and keeps the session alive with heartbeats until stop().
class SwarmPeer {
private:
    static constexpr const char* PEER_ID_PREFIX = "-SS0001-";

    Settings settings;
    std::string id;
    TrackerClient tracker;
    SharedDirectory storage;
    NetworkChunkSource source;
    ReseedPromoter promoter;
    Seeder seeder_role;
    Leecher leecher_role;

    std::thread heartbeat_thread;
    std::mutex state_mtx;
    std::condition_variable state_cv;
    bool running = false;

    void register_session();
    void heartbeat_loop();

public:
    explicit SwarmPeer(const Settings& settings);
    ~SwarmPeer();

    SwarmPeer(const SwarmPeer&) = delete;
    SwarmPeer& operator=(const SwarmPeer&) = delete;

    void start();
    // Deregisters and joins every thread. Safe to call twice.
    void stop();

    const std::string& peer_id() const { return id; }
    uint16_t transfer_port() const { return seeder_role.port(); }

    Seeder& seeder() { return seeder_role; }
    Leecher& leecher() { return leecher_role; }
    SharedDirectory& local_storage() { return storage; }

    DownloadResult download(const std::string& file_id);
    FileDescriptor share(const std::string& path);
    std::vector<std::string> refresh();

    std::vector<PeerRecord> list_peers();
    std::vector<FileListing> list_files();
    void rename(const std::string& username);
    bool ping_tracker();

    static std::string generate_peer_id();
};
