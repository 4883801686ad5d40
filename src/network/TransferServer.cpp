#include "TransferServer.hpp"
#include "../core/Errors.hpp"
#include <sys/socket.h>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {
constexpr std::chrono::milliseconds ACCEPT_POLL_INTERVAL{200};
}

TransferServer::TransferServer(const FileStorage& storage, std::chrono::milliseconds read_timeout,
                               size_t max_connections)
    : storage(storage), read_timeout(read_timeout), max_connections(max_connections) {}

TransferServer::~TransferServer() {
    stop();
}

void TransferServer::start(uint16_t port, const std::string& bind_host) {
    if (running) {
        throw std::logic_error("Transfer server already running");
    }

    SocketHandle sock(socket(AF_INET, SOCK_STREAM, 0));
    if (!sock.valid()) {
        throw NetworkError("Socket creation failed: " + NetworkUtils::last_error());
    }

    int reuse = 1;
    setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr = NetworkUtils::to_sockaddr(PeerAddress(bind_host, port));
    if (bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw NetworkError("Failed to bind transfer port " + std::to_string(port) + ": " + NetworkUtils::last_error());
    }
    if (listen(sock.get(), 16) < 0) {
        throw NetworkError("listen() failed: " + NetworkUtils::last_error());
    }

    listener = std::move(sock);
    bound_port = NetworkUtils::bound_port(listener.get());
    running = true;
    acceptor = std::thread(&TransferServer::accept_loop, this);

    std::cout << "Seeder listening on TCP port " << bound_port << std::endl;
}

void TransferServer::stop() {
    if (!running.exchange(false)) {
        return;
    }
    if (acceptor.joinable()) {
        acceptor.join();
    }
    listener.reset();

    // Wake connections blocked in a read, then wait for them outside the lock.
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(conn_mtx);
        for (auto& entry : connections) {
            if (!entry.second.done) {
                shutdown(entry.second.fd, SHUT_RDWR);
            }
            threads.push_back(std::move(entry.second.thread));
        }
        connections.clear();
    }
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

size_t TransferServer::active_connections() const {
    std::lock_guard<std::mutex> lock(conn_mtx);
    size_t active = 0;
    for (const auto& entry : connections) {
        if (!entry.second.done) {
            ++active;
        }
    }
    return active;
}

void TransferServer::accept_loop() {
    while (running) {
        try {
            reap_finished();
            if (!NetworkUtils::wait_readable(listener.get(), ACCEPT_POLL_INTERVAL)) {
                continue;
            }

            sockaddr_in remote_addr{};
            socklen_t len = sizeof(remote_addr);
            SocketHandle client(accept(listener.get(), reinterpret_cast<sockaddr*>(&remote_addr), &len));
            if (!client.valid()) {
                std::cerr << "accept() failed: " << NetworkUtils::last_error() << std::endl;
                continue;
            }
            PeerAddress remote = NetworkUtils::from_sockaddr(remote_addr);

            std::lock_guard<std::mutex> lock(conn_mtx);
            size_t active = 0;
            for (const auto& entry : connections) {
                active += entry.second.done ? 0 : 1;
            }
            if (active >= max_connections) {
                std::cerr << "Rejecting connection from " << remote.to_string() << ": too many connections" << std::endl;
                std::string reason = "server busy";
                try {
                    PeerConnection::send_message(client.get(), MessageId::Error,
                                                 std::vector<uint8_t>(reason.begin(), reason.end()));
                } catch (const NetworkError&) {
                    // Closing anyway
                }
                continue;
            }

            uint64_t id = ++next_connection_id;
            Connection& connection = connections[id];
            connection.fd = client.get();
            connection.thread = std::thread(&TransferServer::serve_connection, this, id, std::move(client), remote);
        } catch (const std::exception& e) {
            std::cerr << "Transfer accept error: " << e.what() << std::endl;
        }
    }
}

void TransferServer::serve_connection(uint64_t id, SocketHandle sock, PeerAddress remote) {
    try {
        while (running) {
            std::optional<Message> request = PeerConnection::recv_message(sock.get(), read_timeout);
            if (!request) {
                break; // Peer closed
            }
            if (!handle_request(sock.get(), *request)) {
                break;
            }
        }
    } catch (const ProtocolError& e) {
        std::cerr << "Protocol error from " << remote.to_string() << ": " << e.what() << std::endl;
        std::string reason = e.what();
        try {
            PeerConnection::send_message(sock.get(), MessageId::Error, std::vector<uint8_t>(reason.begin(), reason.end()));
        } catch (const NetworkError&) {
            // Peer already gone
        }
    } catch (const NetworkError& e) {
        // Idle timeout or reset; nothing to answer.
        if (running) {
            std::cerr << "Connection from " << remote.to_string() << " closed: " << e.what() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error serving " << remote.to_string() << ": " << e.what() << std::endl;
    }

    // Close under the lock so stop() never shuts down a recycled descriptor.
    std::lock_guard<std::mutex> lock(conn_mtx);
    sock.reset();
    auto it = connections.find(id);
    if (it != connections.end()) {
        it->second.done = true;
        it->second.fd = -1;
    }
}

bool TransferServer::handle_request(int fd, const Message& request) {
    switch (request.id) {
        case MessageId::RequestChunk: {
            int chunk_index = 0;
            std::string file_id;
            PeerConnection::decode_chunk_request(request.payload, chunk_index, file_id);

            std::optional<ChunkBytes> chunk = storage.read_chunk(file_id, chunk_index);
            if (!chunk) {
                PeerConnection::send_message(fd, MessageId::ChunkNotAvailable,
                                             PeerConnection::encode_u32(static_cast<uint32_t>(chunk_index)));
                return true;
            }

            Digest digest = CryptoUtils::sha256(*chunk);
            std::vector<uint8_t> payload(digest.begin(), digest.end());
            payload.insert(payload.end(), chunk->begin(), chunk->end());
            PeerConnection::send_message(fd, MessageId::Chunk, payload);
            return true;
        }
        case MessageId::RequestMetadata: {
            std::string file_id(request.payload.begin(), request.payload.end());
            std::optional<FileDescriptor> descriptor = storage.find_file(file_id);
            if (!descriptor) {
                PeerConnection::send_message(fd, MessageId::FileNotFound, request.payload);
                return true;
            }
            std::string body = descriptor->to_json().dump();
            PeerConnection::send_message(fd, MessageId::Metadata, std::vector<uint8_t>(body.begin(), body.end()));
            return true;
        }
        case MessageId::Ping:
            PeerConnection::send_message(fd, MessageId::Pong);
            return true;
        default:
            throw ProtocolError("Unexpected message ID from downloader: "
                                + std::to_string(static_cast<int>(request.id)));
    }
}

void TransferServer::reap_finished() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(conn_mtx);
        for (auto it = connections.begin(); it != connections.end();) {
            if (it->second.done) {
                finished.push_back(std::move(it->second.thread));
                it = connections.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& thread : finished) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}
