#include "PeerRegistry.hpp"
#include "../core/Errors.hpp"
#include <iostream>
#include <stdexcept>

PeerRegistry::PeerRegistry(std::chrono::milliseconds liveness_window, size_t peer_limit)
    : window(liveness_window), max_peers(peer_limit) {
    if (window.count() <= 0) {
        throw std::invalid_argument("Liveness window must be positive");
    }
}

PeerRecord PeerRegistry::register_peer(const std::string& peer_id, const PeerAddress& address,
                                       const std::string& username, const std::vector<FileListing>& files) {
    if (peer_id.empty()) {
        throw std::invalid_argument("Peer id must not be empty");
    }
    if (address.ip.empty() || address.port == 0) {
        throw std::invalid_argument("Peer address must name a host and a non-zero port");
    }
    for (const auto& listing : files) {
        if (listing.file_id.empty()) {
            throw std::invalid_argument("File id must not be empty");
        }
    }

    std::lock_guard<std::mutex> lock(mtx);
    auto now = Clock::now();
    evict_expired_locked(now);

    for (const auto& entry : peers) {
        if (entry.first != peer_id && entry.second.address == address) {
            throw DuplicateAddressConflict("Address " + address.to_string() + " already registered by peer "
                                           + entry.first);
        }
    }

    auto it = peers.find(peer_id);
    if (it == peers.end()) {
        if (peers.size() >= max_peers) {
            throw PeerLimitReached("Peer limit reached, registration denied");
        }
        PeerRecord record;
        record.peer_id = peer_id;
        it = peers.emplace(peer_id, record).first;
    }

    it->second.address = address;
    it->second.username = username;
    it->second.last_heartbeat = now;
    for (const auto& listing : files) {
        announce_locked(it->second, listing);
    }
    return it->second;
}

void PeerRegistry::heartbeat(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mtx);
    live_peer_locked(peer_id).last_heartbeat = Clock::now();
}

void PeerRegistry::announce_file(const std::string& peer_id, const std::string& file_id,
                                 const std::string& name, uint64_t size) {
    FileListing listing;
    listing.file_id = file_id;
    listing.name = name;
    listing.size = size;
    announce_files(peer_id, {listing});
}

size_t PeerRegistry::announce_files(const std::string& peer_id, const std::vector<FileListing>& files) {
    for (const auto& listing : files) {
        if (listing.file_id.empty()) {
            throw std::invalid_argument("File id must not be empty");
        }
    }

    std::lock_guard<std::mutex> lock(mtx);
    PeerRecord& record = live_peer_locked(peer_id);
    for (const auto& listing : files) {
        announce_locked(record, listing);
    }
    return record.files.size();
}

void PeerRegistry::announce_locked(PeerRecord& record, const FileListing& listing) {
    record.files.insert(listing.file_id);
    availability[listing.file_id].insert(record.peer_id);

    CatalogEntry& entry = catalog[listing.file_id];
    if (!listing.name.empty()) {
        entry.name = listing.name;
        entry.size = listing.size;
    }
}

bool PeerRegistry::withdraw_file(const std::string& peer_id, const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mtx);
    PeerRecord& record = live_peer_locked(peer_id);
    if (record.files.erase(file_id) == 0) {
        return false;
    }
    drop_membership_locked(peer_id, file_id);
    return true;
}

void PeerRegistry::rename(const std::string& peer_id, const std::string& username) {
    std::lock_guard<std::mutex> lock(mtx);
    live_peer_locked(peer_id).username = username;
}

std::vector<PeerRecord> PeerRegistry::query_peers(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mtx);
    evict_expired_locked(Clock::now());

    std::vector<PeerRecord> result;
    auto it = availability.find(file_id);
    if (it == availability.end()) {
        return result;
    }
    for (const auto& peer_id : it->second) {
        result.push_back(peers.at(peer_id));
    }
    return result;
}

bool PeerRegistry::deregister(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mtx);
    evict_expired_locked(Clock::now());
    if (peers.find(peer_id) == peers.end()) {
        return false;
    }
    remove_peer_locked(peer_id);
    return true;
}

std::vector<PeerRecord> PeerRegistry::list_peers() {
    std::lock_guard<std::mutex> lock(mtx);
    evict_expired_locked(Clock::now());

    std::vector<PeerRecord> result;
    for (const auto& entry : peers) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<FileListing> PeerRegistry::list_files() {
    std::lock_guard<std::mutex> lock(mtx);
    evict_expired_locked(Clock::now());

    std::vector<FileListing> result;
    for (const auto& entry : availability) {
        FileListing listing;
        listing.file_id = entry.first;
        listing.seeders = entry.second.size();
        auto cat = catalog.find(entry.first);
        if (cat != catalog.end()) {
            listing.name = cat->second.name;
            listing.size = cat->second.size;
        }
        result.push_back(listing);
    }
    return result;
}

std::optional<PeerRecord> PeerRegistry::find_peer(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mtx);
    evict_expired_locked(Clock::now());
    auto it = peers.find(peer_id);
    if (it == peers.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t PeerRegistry::evict_expired() {
    std::lock_guard<std::mutex> lock(mtx);
    return evict_expired_locked(Clock::now());
}

size_t PeerRegistry::evict_expired_locked(Clock::time_point now) {
    std::vector<std::string> expired;
    for (const auto& entry : peers) {
        if (now - entry.second.last_heartbeat > window) {
            expired.push_back(entry.first);
        }
    }
    for (const auto& peer_id : expired) {
        std::cout << "Peer " << peer_id << " expired (no heartbeat within "
                  << window.count() << " ms)" << std::endl;
        remove_peer_locked(peer_id);
    }
    return expired.size();
}

void PeerRegistry::remove_peer_locked(const std::string& peer_id) {
    auto it = peers.find(peer_id);
    if (it == peers.end()) {
        return;
    }
    for (const auto& file_id : it->second.files) {
        drop_membership_locked(peer_id, file_id);
    }
    peers.erase(it);
}

void PeerRegistry::drop_membership_locked(const std::string& peer_id, const std::string& file_id) {
    auto it = availability.find(file_id);
    if (it == availability.end()) {
        return;
    }
    it->second.erase(peer_id);
    if (it->second.empty()) {
        availability.erase(it);
        catalog.erase(file_id);
    }
}

PeerRecord& PeerRegistry::live_peer_locked(const std::string& peer_id) {
    evict_expired_locked(Clock::now());
    auto it = peers.find(peer_id);
    if (it == peers.end()) {
        throw UnknownPeerError("Peer not registered: " + peer_id);
    }
    return it->second;
}
