#include "SwarmPeer.hpp"
#include "Errors.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace {

const Settings& validated(const Settings& settings) {
    settings.validate();
    return settings;
}

}

SwarmPeer::SwarmPeer(const Settings& config)
    : settings(validated(config)),
      id(generate_peer_id()),
      tracker(PeerAddress(config.tracker_host, config.tracker_port), config.request_timeout, config.tracker_retries),
      storage(config.shared_dir, config.download_dir, config.chunk_size),
      source(Config::TRANSFER_READ_TIMEOUT),
      promoter(tracker, storage, id),
      seeder_role(storage, tracker, id),
      leecher_role(tracker, storage, promoter, source, id,
                   SchedulerOptions{config.concurrency, config.max_retries, Config::SEEDER_FAILURE_LIMIT}) {}

SwarmPeer::~SwarmPeer() {
    try {
        stop();
    } catch (const std::exception& e) {
        std::cerr << "Error while stopping peer: " << e.what() << std::endl;
    }
}

std::string SwarmPeer::generate_peer_id() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    std::ostringstream oss;
    oss << PEER_ID_PREFIX;
    for (int i = 0; i < 6; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << dis(gen);
    }
    return oss.str();
}

void SwarmPeer::register_session() {
    std::string username;
    {
        std::lock_guard<std::mutex> lock(state_mtx);
        username = settings.username;
    }
    PeerAddress advertised(settings.advertise_host, seeder_role.port());
    std::vector<FileDescriptor> files = storage.list_local_files();
    PeerRecord record = tracker.register_peer(id, username, advertised, files);
    std::cout << "Registered with tracker " << tracker.tracker_address().to_string() << " as " << id
              << " (" << record.address.to_string() << ", " << files.size() << " shared files)" << std::endl;
}

void SwarmPeer::start() {
    {
        std::lock_guard<std::mutex> lock(state_mtx);
        if (running) {
            return;
        }
    }

    seeder_role.start(settings.transfer_port);
    try {
        storage.refresh();
        storage.scan();
        register_session();
    } catch (const std::exception&) {
        seeder_role.stop();
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(state_mtx);
        running = true;
    }
    heartbeat_thread = std::thread(&SwarmPeer::heartbeat_loop, this);
}

void SwarmPeer::heartbeat_loop() {
    std::unique_lock<std::mutex> lock(state_mtx);
    while (running) {
        state_cv.wait_for(lock, settings.heartbeat_interval, [this] { return !running; });
        if (!running) {
            break;
        }
        lock.unlock();

        try {
            seeder_role.refresh();
            tracker.heartbeat(id);
        } catch (const UnknownPeerError&) {
            // The tracker expired us or restarted.
            std::cerr << "Tracker no longer knows this peer, registering again" << std::endl;
            try {
                register_session();
            } catch (const std::exception& e) {
                std::cerr << "Re-registration failed: " << e.what() << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Heartbeat failed: " << e.what() << std::endl;
        }

        lock.lock();
    }
}

void SwarmPeer::stop() {
    bool was_running;
    {
        std::lock_guard<std::mutex> lock(state_mtx);
        was_running = running;
        running = false;
    }
    state_cv.notify_all();
    if (heartbeat_thread.joinable()) {
        heartbeat_thread.join();
    }
    if (!was_running) {
        return;
    }

    leecher_role.cancel_all();
    try {
        tracker.deregister(id);
    } catch (const NetworkError& e) {
        std::cerr << "Could not deregister from tracker: " << e.what() << std::endl;
    }
    seeder_role.stop();
    std::cout << "Peer " << id << " stopped" << std::endl;
}

DownloadResult SwarmPeer::download(const std::string& file_id) {
    return leecher_role.download(file_id);
}

FileDescriptor SwarmPeer::share(const std::string& path) {
    return seeder_role.share_file(path);
}

std::vector<std::string> SwarmPeer::refresh() {
    std::vector<std::string> removed = seeder_role.refresh();
    seeder_role.scan();
    return removed;
}

std::vector<PeerRecord> SwarmPeer::list_peers() {
    return tracker.list_peers();
}

std::vector<FileListing> SwarmPeer::list_files() {
    return tracker.list_files();
}

void SwarmPeer::rename(const std::string& username) {
    tracker.rename(id, username);
    std::lock_guard<std::mutex> lock(state_mtx);
    settings.username = username;
}

bool SwarmPeer::ping_tracker() {
    return tracker.ping();
}
