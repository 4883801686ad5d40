#include "core/Errors.hpp"
#include "core/Leecher.hpp"
#include "download/ReseedPromoter.hpp"
#include "network/TrackerClient.hpp"
#include "tracker/PeerRegistry.hpp"
#include "tracker/TrackerServer.hpp"
#include "test_support.hpp"

#include <cassert>
#include <cctype>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Mode = test::FakeChunkSource::Mode;

namespace {

const PeerAddress REMOTE_SEEDER("10.9.9.1", 1000);
const PeerAddress LOCAL_PEER("10.9.9.2", 1000);

struct TrackerFixture {
    PeerRegistry registry;
    TrackerServer server{registry, 2};
    std::unique_ptr<TrackerClient> client;

    TrackerFixture() {
        server.start(0, "127.0.0.1");
        client.reset(new TrackerClient(PeerAddress("127.0.0.1", server.port()), 500ms, 3));
    }
};

template <typename Error, typename Fn>
bool throws(Fn fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

void promoting_twice_keeps_one_membership() {
    TrackerFixture tracker;
    test::MemoryStorage storage;
    tracker.client->register_peer("local", "me", LOCAL_PEER);

    SplitResult file = ChunkCodec::split(test::make_bytes(500, 1), 100, "song.ogg");
    for (int i = 0; i < file.descriptor.get_chunk_count(); ++i) {
        storage.write_chunk(file.descriptor, i, file.chunks[i]);
    }
    std::string path = storage.commit(file.descriptor);

    ReseedPromoter promoter(*tracker.client, storage, "local");
    assert(promoter.promote(file.descriptor, path));
    assert(!promoter.promote(file.descriptor, path));

    auto peers = tracker.registry.query_peers(file.descriptor.file_id());
    assert(peers.size() == 1);
    assert(peers[0].peer_id == "local");
    assert(tracker.registry.list_files().at(0).seeders == 1);
    assert(storage.find_file(file.descriptor.file_id()));
    assert(storage.read_chunk(file.descriptor.file_id(), 2) == file.chunks[2]);
}

void failed_announce_rolls_back() {
    TrackerFixture tracker;
    test::MemoryStorage storage;
    SplitResult file = ChunkCodec::split(test::make_bytes(50, 2), 100, "a");
    storage.write_chunk(file.descriptor, 0, file.chunks[0]);
    std::string path = storage.commit(file.descriptor);

    ReseedPromoter promoter(*tracker.client, storage, "not-registered");
    assert(throws<UnknownPeerError>([&] { promoter.promote(file.descriptor, path); }));
    assert(!storage.find_file(file.descriptor.file_id()));
    assert(throws<std::runtime_error>([&] { promoter.promote(file.descriptor, "mem://nowhere"); }));
}

void download_commits_and_reseeds() {
    TrackerFixture tracker;
    auto bytes = test::make_bytes(1000, 3);
    SplitResult file = ChunkCodec::split(bytes, 128, "paper.pdf");
    const std::string file_id = file.descriptor.file_id();

    tracker.client->register_peer("remote", "them", REMOTE_SEEDER, {file.descriptor});
    tracker.client->register_peer("local", "me", LOCAL_PEER);

    test::FakeChunkSource source(file);
    source.add_seeder(REMOTE_SEEDER);
    test::MemoryStorage storage;
    ReseedPromoter promoter(*tracker.client, storage, "local");
    Leecher leecher(*tracker.client, storage, promoter, source, "local");

    std::string upper = file_id;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    DownloadResult result = leecher.download(upper);

    assert(result.status == DownloadStatus::Completed);
    assert(storage.committed_bytes(result.path) == bytes);
    assert(storage.find_file(file_id));
    assert(tracker.registry.query_peers(file_id).size() == 2);
    assert(!leecher.is_downloading(file_id));

    // Held now, so a second download is refused.
    assert(throws<std::runtime_error>([&] { leecher.download(file_id); }));
}

void failed_download_writes_nothing() {
    TrackerFixture tracker;
    SplitResult file = ChunkCodec::split(test::make_bytes(800, 4), 100, "broken");
    const std::string file_id = file.descriptor.file_id();
    tracker.client->register_peer("remote", "them", REMOTE_SEEDER, {file.descriptor});
    tracker.client->register_peer("local", "me", LOCAL_PEER);

    test::FakeChunkSource source(file);
    source.add_seeder(REMOTE_SEEDER, Mode::Honest, [](int i) { return i != 3; });
    test::MemoryStorage storage;
    ReseedPromoter promoter(*tracker.client, storage, "local");

    SchedulerOptions options;
    options.concurrency = 1;
    options.max_retries = 2;
    Leecher leecher(*tracker.client, storage, promoter, source, "local", options);

    DownloadResult result = leecher.download(file_id);
    assert(result.status == DownloadStatus::Failed);
    assert(result.path.empty());
    assert(source.attempts_for(3) == 3);
    assert(storage.writes == 0);
    assert(storage.committed_count() == 0);
    assert(storage.staged_count() == 0);
    assert(!storage.find_file(file_id));
    assert(tracker.registry.query_peers(file_id).size() == 1);
}

void own_announcement_is_not_a_seeder() {
    TrackerFixture tracker;
    SplitResult file = ChunkCodec::split(test::make_bytes(100, 5), 100, "mine");
    tracker.client->register_peer("local", "me", LOCAL_PEER, {file.descriptor});

    test::FakeChunkSource source(file);
    source.add_seeder(LOCAL_PEER);
    test::MemoryStorage storage;
    ReseedPromoter promoter(*tracker.client, storage, "local");
    Leecher leecher(*tracker.client, storage, promoter, source, "local");

    assert(throws<ResourceExhaustedError>([&] { leecher.download(file.descriptor.file_id()); }));
    assert(source.attempts_to(LOCAL_PEER) == 0);
    assert(throws<std::invalid_argument>([&] { leecher.download("not-a-digest"); }));
}

void same_file_cannot_download_twice_at_once() {
    TrackerFixture tracker;
    auto bytes = test::make_bytes(20 * 10, 6);
    SplitResult file = ChunkCodec::split(bytes, 10, "slow");
    const std::string file_id = file.descriptor.file_id();
    tracker.client->register_peer("remote", "them", REMOTE_SEEDER, {file.descriptor});
    tracker.client->register_peer("local", "me", LOCAL_PEER);

    test::FakeChunkSource source(file);
    source.set_delay(20ms);
    source.add_seeder(REMOTE_SEEDER);
    test::MemoryStorage storage;
    ReseedPromoter promoter(*tracker.client, storage, "local");
    SchedulerOptions options;
    options.concurrency = 1;
    Leecher leecher(*tracker.client, storage, promoter, source, "local", options);

    DownloadResult first;
    std::thread downloader([&] { first = leecher.download(file_id); });
    assert(test::wait_until([&] { return leecher.is_downloading(file_id); }));
    assert(throws<std::runtime_error>([&] { leecher.download(file_id); }));
    downloader.join();

    assert(first.status == DownloadStatus::Completed);
    assert(storage.committed_bytes(first.path) == bytes);
}

void cancel_before_scheduling_stops_the_download() {
    TrackerFixture tracker;
    SplitResult file = ChunkCodec::split(test::make_bytes(500, 7), 50, "late");
    const std::string file_id = file.descriptor.file_id();
    tracker.client->register_peer("remote", "them", REMOTE_SEEDER, {file.descriptor});
    tracker.client->register_peer("local", "me", LOCAL_PEER);

    test::FakeChunkSource source(file);
    source.set_metadata_delay(300ms);
    source.add_seeder(REMOTE_SEEDER);
    test::MemoryStorage storage;
    ReseedPromoter promoter(*tracker.client, storage, "local");
    Leecher leecher(*tracker.client, storage, promoter, source, "local");

    std::vector<DownloadEvent> events;
    leecher.set_observer([&](const DownloadEvent& event) { events.push_back(event); });

    DownloadResult result;
    std::thread downloader([&] { result = leecher.download(file_id); });
    assert(test::wait_until([&] { return source.metadata_requests() > 0; }));
    leecher.cancel_all();
    downloader.join();

    assert(result.status == DownloadStatus::Cancelled);
    assert(result.error == ErrorKind::Cancelled);
    for (int i = 0; i < file.descriptor.get_chunk_count(); ++i) {
        assert(source.attempts_for(i) == 0);
    }
    assert(storage.writes == 0);
    assert(!storage.find_file(file_id));
    assert(!leecher.is_downloading(file_id));
    assert(events.size() == 1 && events[0].type == DownloadEventType::DownloadFailed);

    // The cancel only applied to that attempt.
    source.set_metadata_delay(0ms);
    assert(leecher.download(file_id).status == DownloadStatus::Completed);
}

}  // namespace

int main() {
    promoting_twice_keeps_one_membership();
    failed_announce_rolls_back();
    download_commits_and_reseeds();
    failed_download_writes_nothing();
    own_announcement_is_not_a_seeder();
    same_file_cannot_download_twice_at_once();
    cancel_before_scheduling_stops_the_download();
    return 0;
}
