#include "core/Errors.hpp"
#include "tracker/PeerRegistry.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

const std::string FILE_A(64, 'a');
const std::string FILE_B(64, 'b');

template <typename Error, typename Fn>
bool throws(Fn fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

void register_and_query() {
    PeerRegistry registry;
    PeerRecord record = registry.register_peer("peer-1", PeerAddress("10.0.0.1", 4000), "alice");
    assert(record.peer_id == "peer-1");
    assert(record.username == "alice");

    registry.announce_file("peer-1", FILE_A, "a.txt", 12);
    auto peers = registry.query_peers(FILE_A);
    assert(peers.size() == 1);
    assert(peers[0].address == PeerAddress("10.0.0.1", 4000));
    assert(peers[0].files.count(FILE_A) == 1);
    assert(registry.query_peers(FILE_B).empty());
}

void reregistration_is_idempotent() {
    PeerRegistry registry;
    registry.register_peer("peer-1", PeerAddress("10.0.0.1", 4000), "alice");
    registry.announce_file("peer-1", FILE_A);

    PeerRecord again = registry.register_peer("peer-1", PeerAddress("10.0.0.1", 4001), "alice2");
    assert(again.address.port == 4001);
    assert(again.username == "alice2");
    assert(again.files.count(FILE_A) == 1);
    assert(registry.list_peers().size() == 1);
    assert(registry.query_peers(FILE_A).size() == 1);
}

void duplicate_address_is_rejected() {
    PeerRegistry registry;
    registry.register_peer("peer-1", PeerAddress("10.0.0.1", 4000), "alice");
    assert(throws<DuplicateAddressConflict>([&] {
        registry.register_peer("peer-2", PeerAddress("10.0.0.1", 4000), "bob");
    }));
    assert(!registry.find_peer("peer-2"));
    assert(registry.find_peer("peer-1")->username == "alice");
}

void expired_holder_frees_its_address() {
    PeerRegistry registry(50ms);
    registry.register_peer("peer-1", PeerAddress("10.0.0.1", 4000), "alice");
    std::this_thread::sleep_for(120ms);
    registry.register_peer("peer-2", PeerAddress("10.0.0.1", 4000), "bob");
    assert(!registry.find_peer("peer-1"));
    assert(registry.find_peer("peer-2"));
}

void expired_peers_are_never_returned() {
    PeerRegistry registry(150ms);
    registry.register_peer("stale", PeerAddress("10.0.0.1", 4000), "stale");
    registry.register_peer("fresh", PeerAddress("10.0.0.2", 4000), "fresh");
    registry.announce_file("stale", FILE_A);
    registry.announce_file("fresh", FILE_A);

    for (int i = 0; i < 5; ++i) {
        std::this_thread::sleep_for(50ms);
        registry.heartbeat("fresh");
    }

    auto peers = registry.query_peers(FILE_A);
    assert(peers.size() == 1);
    assert(peers[0].peer_id == "fresh");
    assert(registry.list_peers().size() == 1);
    assert(throws<UnknownPeerError>([&] { registry.heartbeat("stale"); }));
    assert(throws<UnknownPeerError>([&] { registry.announce_file("stale", FILE_B); }));
}

void sweep_evicts_and_counts() {
    PeerRegistry registry(30ms);
    registry.register_peer("p1", PeerAddress("10.0.0.1", 1), "a");
    registry.register_peer("p2", PeerAddress("10.0.0.2", 1), "b");
    registry.announce_file("p1", FILE_A, "a", 1);
    std::this_thread::sleep_for(80ms);
    assert(registry.evict_expired() == 2);
    assert(registry.evict_expired() == 0);
    assert(registry.list_files().empty());
}

void unknown_peer_operations_fail() {
    PeerRegistry registry;
    assert(throws<UnknownPeerError>([&] { registry.heartbeat("ghost"); }));
    assert(throws<UnknownPeerError>([&] { registry.announce_file("ghost", FILE_A); }));
    assert(throws<UnknownPeerError>([&] { registry.rename("ghost", "x"); }));
    assert(throws<UnknownPeerError>([&] { registry.withdraw_file("ghost", FILE_A); }));
}

void deregister_removes_every_membership() {
    PeerRegistry registry;
    registry.register_peer("peer-1", PeerAddress("10.0.0.1", 4000), "alice");
    registry.register_peer("peer-2", PeerAddress("10.0.0.2", 4000), "bob");
    registry.announce_file("peer-1", FILE_A);
    registry.announce_file("peer-1", FILE_B);
    registry.announce_file("peer-2", FILE_B);

    assert(registry.deregister("peer-1"));
    assert(registry.query_peers(FILE_A).empty());
    auto b = registry.query_peers(FILE_B);
    assert(b.size() == 1 && b[0].peer_id == "peer-2");
    for (const auto& listing : registry.list_files()) {
        assert(listing.file_id != FILE_A);
    }

    assert(!registry.deregister("peer-1"));
    assert(!registry.deregister("never-registered"));
}

void withdraw_and_catalog() {
    PeerRegistry registry;
    registry.register_peer("peer-1", PeerAddress("10.0.0.1", 4000), "alice");
    registry.register_peer("peer-2", PeerAddress("10.0.0.2", 4000), "bob");
    registry.announce_file("peer-1", FILE_A, "a.txt", 100);
    registry.announce_file("peer-2", FILE_A);

    auto files = registry.list_files();
    assert(files.size() == 1);
    assert(files[0].name == "a.txt");
    assert(files[0].size == 100);
    assert(files[0].seeders == 2);

    assert(registry.withdraw_file("peer-1", FILE_A));
    assert(!registry.withdraw_file("peer-1", FILE_A));
    assert(registry.list_files()[0].seeders == 1);

    registry.withdraw_file("peer-2", FILE_A);
    assert(registry.list_files().empty());
    assert(registry.query_peers(FILE_A).empty());
}

void announcing_twice_keeps_one_membership() {
    PeerRegistry registry;
    registry.register_peer("peer-1", PeerAddress("10.0.0.1", 4000), "alice");
    registry.announce_file("peer-1", FILE_A);
    registry.announce_file("peer-1", FILE_A);
    assert(registry.query_peers(FILE_A).size() == 1);
    assert(registry.list_files()[0].seeders == 1);
}

void rename_changes_username() {
    PeerRegistry registry;
    registry.register_peer("peer-1", PeerAddress("10.0.0.1", 4000), "alice");
    registry.rename("peer-1", "carol");
    assert(registry.find_peer("peer-1")->username == "carol");
}

void peer_limit_is_enforced() {
    PeerRegistry registry(Config::DEFAULT_LIVENESS_WINDOW, 2);
    registry.register_peer("p1", PeerAddress("10.0.0.1", 1), "a");
    registry.register_peer("p2", PeerAddress("10.0.0.2", 1), "b");
    assert(throws<PeerLimitReached>([&] { registry.register_peer("p3", PeerAddress("10.0.0.3", 1), "c"); }));
    // Known peers may still refresh.
    registry.register_peer("p2", PeerAddress("10.0.0.2", 1), "b");
    registry.deregister("p1");
    registry.register_peer("p3", PeerAddress("10.0.0.3", 1), "c");
}

void invalid_input_is_rejected() {
    PeerRegistry registry;
    assert(throws<std::invalid_argument>([&] { registry.register_peer("", PeerAddress("10.0.0.1", 1), "a"); }));
    assert(throws<std::invalid_argument>([&] { registry.register_peer("p", PeerAddress("10.0.0.1", 0), "a"); }));
    assert(throws<std::invalid_argument>([] { PeerRegistry bad(0ms); }));
}

void registration_carries_files() {
    PeerRegistry registry;
    FileListing a;
    a.file_id = FILE_A;
    a.name = "a.txt";
    a.size = 3;
    FileListing b;
    b.file_id = FILE_B;

    PeerRecord record = registry.register_peer("peer-1", PeerAddress("10.0.0.1", 4000), "alice", {a, b});
    assert(record.files.size() == 2);
    assert(registry.query_peers(FILE_A).size() == 1);
    assert(registry.query_peers(FILE_B).size() == 1);

    FileListing empty;
    assert(throws<std::invalid_argument>([&] {
        registry.register_peer("peer-2", PeerAddress("10.0.0.2", 4000), "bob", {a, empty});
    }));
    assert(!registry.find_peer("peer-2"));
}

void registered_files_are_visible_with_the_peer() {
    PeerRegistry registry;
    FileListing a;
    a.file_id = FILE_A;
    FileListing b;
    b.file_id = FILE_B;

    std::atomic<bool> done{false};
    std::atomic<bool> partial{false};
    std::thread reader([&] {
        while (!done) {
            for (const auto& record : registry.list_peers()) {
                if (record.files.size() != 2) {
                    partial = true;
                }
            }
        }
    });
    for (int round = 0; round < 200; ++round) {
        std::string peer_id = "peer-" + std::to_string(round % 4);
        registry.register_peer(peer_id, PeerAddress("10.0.2." + std::to_string(round % 4), 5000), "u", {a, b});
        if (round % 2 == 1) {
            registry.deregister(peer_id);
        }
    }
    done = true;
    reader.join();
    assert(!partial);
}

void concurrent_operations_keep_index_consistent() {
    PeerRegistry registry;
    std::vector<std::thread> threads;
    std::atomic<bool> failed{false};

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            std::string peer_id = "peer-" + std::to_string(t);
            for (int round = 0; round < 50; ++round) {
                try {
                    registry.register_peer(peer_id, PeerAddress("10.0.1." + std::to_string(t), 5000), "u");
                    registry.announce_file(peer_id, FILE_A);
                    registry.announce_file(peer_id, FILE_B);
                    for (const auto& record : registry.query_peers(FILE_A)) {
                        if (record.files.count(FILE_A) == 0) {
                            failed = true;
                        }
                    }
                    if (round % 3 == 0) {
                        registry.deregister(peer_id);
                    }
                } catch (const std::exception&) {
                    failed = true;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    assert(!failed);

    for (const auto& record : registry.query_peers(FILE_B)) {
        assert(registry.find_peer(record.peer_id));
    }
}

}  // namespace

int main() {
    register_and_query();
    registration_carries_files();
    registered_files_are_visible_with_the_peer();
    reregistration_is_idempotent();
    duplicate_address_is_rejected();
    expired_holder_frees_its_address();
    expired_peers_are_never_returned();
    sweep_evicts_and_counts();
    unknown_peer_operations_fail();
    deregister_removes_every_membership();
    withdraw_and_catalog();
    announcing_twice_keeps_one_membership();
    rename_changes_username();
    peer_limit_is_enforced();
    invalid_input_is_rejected();
    concurrent_operations_keep_index_consistent();
    return 0;
}
