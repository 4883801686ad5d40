#include "core/ChunkCodec.hpp"
#include "core/Config.hpp"
#include "core/SwarmPeer.hpp"
#include "network/TrackerClient.hpp"
#include "tracker/PeerRegistry.hpp"
#include "tracker/TrackerServer.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

Settings peer_settings(const test::TempDir& dir, const std::string& name, uint16_t tracker_port) {
    Settings settings;
    settings.tracker_host = "127.0.0.1";
    settings.tracker_port = tracker_port;
    settings.transfer_port = 0;
    settings.advertise_host = "127.0.0.1";
    settings.username = name;
    settings.shared_dir = (dir / (name + "_shared")).string();
    settings.download_dir = (dir / (name + "_downloads")).string();
    settings.chunk_size = 4096;
    settings.concurrency = 3;
    settings.max_retries = 2;
    settings.liveness_window = 3000ms;
    settings.heartbeat_interval = 200ms;
    settings.request_timeout = 500ms;
    return settings;
}

void download_then_reseed() {
    test::TempDir dir("e2e");
    PeerRegistry registry(3000ms);
    TrackerServer server(registry, 2);
    server.start(0, "127.0.0.1");

    auto bytes = test::make_bytes(50 * 1024 + 123, 42);
    Settings alice_settings = peer_settings(dir, "alice", server.port());
    std::filesystem::create_directories(alice_settings.shared_dir);
    test::write_file(std::filesystem::path(alice_settings.shared_dir) / "movie.bin", bytes);

    SwarmPeer alice(alice_settings);
    alice.start();
    assert(alice.transfer_port() != 0);

    const std::string file_id = ChunkCodec::split(bytes, 4096).descriptor.file_id();
    auto listing = alice.list_files();
    assert(listing.size() == 1);
    assert(listing[0].file_id == file_id);
    assert(listing[0].name == "movie.bin");
    assert(listing[0].seeders == 1);

    SwarmPeer bob(peer_settings(dir, "bob", server.port()));
    bob.start();
    assert(bob.peer_id() != alice.peer_id());
    assert(bob.list_peers().size() == 2);

    std::vector<DownloadEvent> events;
    std::mutex events_mtx;
    bob.leecher().set_observer([&](const DownloadEvent& event) {
        std::lock_guard<std::mutex> lock(events_mtx);
        events.push_back(event);
    });

    DownloadResult result = bob.download(file_id);
    assert(result.status == DownloadStatus::Completed);
    assert(result.data == bytes);
    assert(test::read_file(result.path) == bytes);
    {
        std::lock_guard<std::mutex> lock(events_mtx);
        assert(!events.empty());
        assert(events.back().type == DownloadEventType::DownloadComplete);
    }

    // The downloaded copy is seeded too.
    TrackerClient observer(PeerAddress("127.0.0.1", server.port()), 500ms, 3);
    assert(observer.query_peers(file_id).size() == 2);
    assert(bob.local_storage().find_file(file_id));
    assert(bob.local_storage().read_chunk(file_id, 0));

    // A second download of a file already held is refused.
    bool refused = false;
    try {
        bob.download(file_id);
    } catch (const std::runtime_error&) {
        refused = true;
    }
    assert(refused);

    bob.stop();
    auto holders = observer.query_peers(file_id);
    assert(holders.size() == 1);
    assert(holders[0].peer_id == alice.peer_id());

    alice.stop();
    assert(observer.list_peers().empty());
    assert(observer.list_files().empty());
    server.stop();
}

void downloads_from_the_second_seeder_when_first_leaves() {
    test::TempDir dir("e2e_handoff");
    PeerRegistry registry(3000ms);
    TrackerServer server(registry, 2);
    server.start(0, "127.0.0.1");

    auto bytes = test::make_bytes(20000, 7);
    const std::string file_id = ChunkCodec::split(bytes, 4096).descriptor.file_id();

    Settings first_settings = peer_settings(dir, "first", server.port());
    std::filesystem::create_directories(first_settings.shared_dir);
    test::write_file(std::filesystem::path(first_settings.shared_dir) / "doc.txt", bytes);
    auto first = std::make_unique<SwarmPeer>(first_settings);
    first->start();

    SwarmPeer second(peer_settings(dir, "second", server.port()));
    second.start();
    assert(second.download(file_id).status == DownloadStatus::Completed);

    first->stop();
    first.reset();

    SwarmPeer third(peer_settings(dir, "third", server.port()));
    third.start();
    DownloadResult result = third.download(file_id);
    assert(result.status == DownloadStatus::Completed);
    assert(test::read_file(result.path) == bytes);

    third.stop();
    second.stop();
    server.stop();
}

void unknown_file_is_exhausted() {
    test::TempDir dir("e2e_unknown");
    PeerRegistry registry(3000ms);
    TrackerServer server(registry, 2);
    server.start(0, "127.0.0.1");

    SwarmPeer lone(peer_settings(dir, "lone", server.port()));
    lone.start();
    bool exhausted = false;
    try {
        lone.download(std::string(64, 'a'));
    } catch (const ResourceExhaustedError&) {
        exhausted = true;
    }
    assert(exhausted);

    bool invalid = false;
    try {
        lone.download("not-a-file-id");
    } catch (const std::invalid_argument&) {
        invalid = true;
    }
    assert(invalid);

    lone.stop();
    server.stop();
}

void heartbeats_keep_session_alive() {
    test::TempDir dir("e2e_alive");
    PeerRegistry registry(600ms);
    TrackerServer server(registry, 2);
    server.start(0, "127.0.0.1");

    Settings settings = peer_settings(dir, "steady", server.port());
    settings.liveness_window = 600ms;
    settings.heartbeat_interval = 100ms;
    SwarmPeer peer(settings);
    peer.start();

    std::this_thread::sleep_for(1500ms);
    assert(registry.find_peer(peer.peer_id()));

    peer.rename("renamed");
    assert(registry.find_peer(peer.peer_id())->username == "renamed");
    assert(peer.ping_tracker());

    peer.stop();
    assert(!registry.find_peer(peer.peer_id()));
    server.stop();
}

}  // namespace

int main() {
    download_then_reseed();
    downloads_from_the_second_seeder_when_first_leaves();
    unknown_file_is_exhausted();
    heartbeats_keep_session_alive();
    return 0;
}
