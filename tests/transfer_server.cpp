#include "core/Errors.hpp"
#include "network/PeerConnection.hpp"
#include "network/TransferServer.hpp"
#include "test_support.hpp"

#include <sys/socket.h>
#include <cassert>
#include <chrono>
#include <string>

using namespace std::chrono_literals;

namespace {

// The server may close with a FIN or a reset; either way no further message.
bool closed_by_peer(int fd) {
    try {
        return !PeerConnection::recv_message(fd, 1000ms);
    } catch (const NetworkError&) {
        return true;
    }
}

void serves_chunks_metadata_and_ping() {
    test::MemoryStorage storage;
    auto bytes = test::make_bytes(10000, 2);
    FileDescriptor descriptor = storage.add_file(bytes, "movie.bin", 4096);

    TransferServer server(storage, 1000ms);
    server.start(0, "127.0.0.1");
    PeerAddress seeder("127.0.0.1", server.port());

    for (int i = 0; i < descriptor.get_chunk_count(); ++i) {
        FetchResult result = PeerConnection::request_chunk(seeder, descriptor.file_id(), i, 1000ms);
        assert(result.status == FetchStatus::Ok);
        assert(result.data.size() == descriptor.get_chunk_size(i));
        assert(result.digest == descriptor.chunk_digests[i]);
        assert(ChunkCodec::verify_chunk(result.data, descriptor.chunk_digests[i]));
    }

    FetchResult missing = PeerConnection::request_chunk(seeder, descriptor.file_id(), 99, 1000ms);
    assert(missing.status == FetchStatus::NotAvailable);
    FetchResult unknown = PeerConnection::request_chunk(seeder, std::string(64, '0'), 0, 1000ms);
    assert(unknown.status == FetchStatus::NotAvailable);

    auto metadata = PeerConnection::request_metadata(seeder, descriptor.file_id(), 1000ms);
    assert(metadata);
    assert(*metadata == descriptor);
    assert(!PeerConnection::request_metadata(seeder, std::string(64, '0'), 1000ms));

    assert(PeerConnection::ping(seeder, 1000ms));
    server.stop();
    assert(!PeerConnection::ping(seeder, 300ms));
}

void one_connection_serves_several_requests() {
    test::MemoryStorage storage;
    FileDescriptor descriptor = storage.add_file(test::make_bytes(300, 8), "small", 100);
    TransferServer server(storage, 1000ms);
    server.start(0, "127.0.0.1");

    SocketHandle sock = PeerConnection::connect_to_peer(PeerAddress("127.0.0.1", server.port()));
    for (int i = 0; i < 3; ++i) {
        PeerConnection::send_message(sock.get(), MessageId::RequestChunk,
                                     PeerConnection::encode_chunk_request(i, descriptor.file_id()));
        auto reply = PeerConnection::recv_message(sock.get(), 1000ms);
        assert(reply && reply->id == MessageId::Chunk);
        assert(reply->payload.size() == Config::DIGEST_SIZE + 100);
    }
    PeerConnection::send_message(sock.get(), MessageId::Ping);
    auto pong = PeerConnection::recv_message(sock.get(), 1000ms);
    assert(pong && pong->id == MessageId::Pong);
}

void malformed_frames_get_error_and_close() {
    test::MemoryStorage storage;
    FileDescriptor descriptor = storage.add_file(test::make_bytes(100, 3), "x", 50);
    TransferServer server(storage, 1000ms);
    server.start(0, "127.0.0.1");
    PeerAddress seeder("127.0.0.1", server.port());

    std::vector<std::vector<uint8_t>> frames = {
        {0xFF, 0xFF, 0xFF, 0xFF},                   // oversized length
        {0x00, 0x00, 0x00, 0x00},                   // zero length
        {0x00, 0x00, 0x00, 0x01, 0x63},             // unknown id
        {0x00, 0x00, 0x00, 0x03, 0x01, 0x00, 0x01}, // short chunk request
        {0x00, 0x00, 0x00, 0x01, 0x02},             // reply type sent as request
    };
    for (const auto& frame : frames) {
        SocketHandle sock = PeerConnection::connect_to_peer(seeder);
        send(sock.get(), frame.data(), frame.size(), MSG_NOSIGNAL);
        auto reply = PeerConnection::recv_message(sock.get(), 1000ms);
        assert(reply && reply->id == MessageId::Error);
        assert(closed_by_peer(sock.get()));
    }

    FetchResult ok = PeerConnection::request_chunk(seeder, descriptor.file_id(), 1, 1000ms);
    assert(ok.status == FetchStatus::Ok);
}

void stalled_connection_does_not_block_others() {
    test::MemoryStorage storage;
    FileDescriptor descriptor = storage.add_file(test::make_bytes(2048, 4), "y", 1024);
    TransferServer server(storage, 2000ms);
    server.start(0, "127.0.0.1");
    PeerAddress seeder("127.0.0.1", server.port());

    // Half a header, then silence.
    SocketHandle stalled = PeerConnection::connect_to_peer(seeder);
    uint8_t partial[2] = {0x00, 0x00};
    send(stalled.get(), partial, sizeof(partial), MSG_NOSIGNAL);
    assert(test::wait_until([&] { return server.active_connections() == 1; }));

    auto start = std::chrono::steady_clock::now();
    FetchResult result = PeerConnection::request_chunk(seeder, descriptor.file_id(), 1, 1000ms);
    assert(result.status == FetchStatus::Ok);
    assert(std::chrono::steady_clock::now() - start < 1000ms);

    // The stalled reader is dropped after its read timeout.
    assert(test::wait_until([&] { return server.active_connections() == 0; }, 4000ms));
}

void connections_over_the_limit_are_refused() {
    test::MemoryStorage storage;
    storage.add_file(test::make_bytes(10, 5), "z", 10);
    TransferServer server(storage, 3000ms, 1);
    server.start(0, "127.0.0.1");
    PeerAddress seeder("127.0.0.1", server.port());

    SocketHandle holder = PeerConnection::connect_to_peer(seeder);
    assert(test::wait_until([&] { return server.active_connections() == 1; }));

    SocketHandle extra = PeerConnection::connect_to_peer(seeder);
    auto reply = PeerConnection::recv_message(extra.get(), 2000ms);
    assert(reply && reply->id == MessageId::Error);

    holder.reset();
    assert(test::wait_until([&] { return server.active_connections() == 0; }));
    assert(PeerConnection::ping(seeder, 1000ms));
}

void stop_interrupts_blocked_readers() {
    test::MemoryStorage storage;
    TransferServer server(storage, 10000ms);
    server.start(0, "127.0.0.1");
    SocketHandle idle = PeerConnection::connect_to_peer(PeerAddress("127.0.0.1", server.port()));
    assert(test::wait_until([&] { return server.active_connections() == 1; }));

    auto start = std::chrono::steady_clock::now();
    server.stop();
    assert(std::chrono::steady_clock::now() - start < 2000ms);
    assert(server.active_connections() == 0);
}

}  // namespace

int main() {
    serves_chunks_metadata_and_ping();
    one_connection_serves_several_requests();
    malformed_frames_get_error_and_close();
    stalled_connection_does_not_block_others();
    connections_over_the_limit_are_refused();
    stop_interrupts_blocked_readers();
    return 0;
}
