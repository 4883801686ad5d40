#pragma once
#include "PeerAddress.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

// A tracker's view of one peer. The registry owns the live records; everyone
// else holds copies.
struct PeerRecord {
    std::string peer_id;
    std::string username;
    PeerAddress address;
    std::chrono::steady_clock::time_point last_heartbeat{};
    std::set<std::string> files;
    // What the tracker reports; the file ids themselves stay on the tracker.
    size_t file_count = 0;
};

// One row of the tracker's file catalog.
struct FileListing {
    std::string file_id;
    std::string name;
    uint64_t size = 0;
    size_t seeders = 0;
};
