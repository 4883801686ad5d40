#pragma once
#include "../core/Config.hpp"
#include "../core/PeerRecord.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Tracker state: the peer table, the file -> seeders availability index and a
// catalog of file names. One instance per tracker, shared by reference with
// every handler thread. All operations serialise on one mutex and evict expired
// peers before doing anything else, so a peer id is in the availability index
// only while its record is live.
class PeerRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit PeerRegistry(std::chrono::milliseconds liveness_window = Config::DEFAULT_LIVENESS_WINDOW,
                          size_t peer_limit = Config::DEFAULT_PEER_LIMIT);

    // Idempotent for the same peer id: refreshes address, username and
    // heartbeat and keeps the announced files. Throws DuplicateAddressConflict
    // when another live peer holds the address, PeerLimitReached when full.
    // `files` are announced under the same lock as the registration.
    PeerRecord register_peer(const std::string& peer_id, const PeerAddress& address, const std::string& username,
                             const std::vector<FileListing>& files = {});

    // The following throw UnknownPeerError for unregistered or expired peers.
    void heartbeat(const std::string& peer_id);
    void announce_file(const std::string& peer_id, const std::string& file_id,
                       const std::string& name = "", uint64_t size = 0);
    // Returns how many files the peer holds afterwards.
    size_t announce_files(const std::string& peer_id, const std::vector<FileListing>& files);
    bool withdraw_file(const std::string& peer_id, const std::string& file_id);
    void rename(const std::string& peer_id, const std::string& username);

    std::vector<PeerRecord> query_peers(const std::string& file_id);
    bool deregister(const std::string& peer_id);

    std::vector<PeerRecord> list_peers();
    std::vector<FileListing> list_files();
    std::optional<PeerRecord> find_peer(const std::string& peer_id);
    size_t evict_expired();

    std::chrono::milliseconds liveness_window() const { return window; }

private:
    struct CatalogEntry {
        std::string name;
        uint64_t size = 0;
    };

    size_t evict_expired_locked(Clock::time_point now);
    void announce_locked(PeerRecord& record, const FileListing& listing);
    void remove_peer_locked(const std::string& peer_id);
    void drop_membership_locked(const std::string& peer_id, const std::string& file_id);
    PeerRecord& live_peer_locked(const std::string& peer_id);

    std::chrono::milliseconds window;
    size_t max_peers;

    std::map<std::string, PeerRecord> peers;
    std::map<std::string, std::set<std::string>> availability;
    std::map<std::string, CatalogEntry> catalog;
    mutable std::mutex mtx;
};
