#include "PeerConnection.hpp"
#include "../core/Errors.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/select.h>
#include <errno.h>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <iostream>

SocketHandle PeerConnection::connect_to_peer(const PeerAddress& peer, std::chrono::milliseconds timeout) {
    SocketHandle sock(socket(AF_INET, SOCK_STREAM, 0));
    if (!sock.valid()) {
        throw NetworkError("Socket creation failed: " + NetworkUtils::last_error());
    }

    sockaddr_in server_addr = NetworkUtils::to_sockaddr(peer);

    // Non-blocking connect so the timeout applies
    int flags = fcntl(sock.get(), F_GETFL, 0);
    fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK);

    int result = connect(sock.get(), (struct sockaddr*)&server_addr, sizeof(server_addr));
    if (result < 0 && errno != EINPROGRESS) {
        throw NetworkError("Connection to " + peer.to_string() + " failed: " + NetworkUtils::last_error());
    }

    if (result < 0) {
        fd_set write_fds;
        FD_ZERO(&write_fds);
        FD_SET(sock.get(), &write_fds);

        struct timeval tv;
        tv.tv_sec = static_cast<long>(timeout.count() / 1000);
        tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);

        result = select(sock.get() + 1, NULL, &write_fds, NULL, &tv);
        if (result <= 0) {
            throw NetworkError("Connection to " + peer.to_string() + " timed out");
        }

        // Check if connection was successful
        int error = 0;
        socklen_t len = sizeof(error);
        if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &error, &len) < 0 || error != 0) {
            throw NetworkError("Connection to " + peer.to_string() + " failed: "
                               + std::string(strerror(error != 0 ? error : errno)));
        }
    }

    // Set back to blocking mode
    fcntl(sock.get(), F_SETFL, flags);

    return sock;
}

void PeerConnection::send_message(int sockfd, MessageId id, const std::vector<uint8_t>& payload) {
    if (payload.size() + 1 > Config::MAX_FRAME_LENGTH) {
        throw ProtocolError("Message too large: " + std::to_string(payload.size()) + " bytes");
    }

    std::vector<uint8_t> frame = encode_u32(static_cast<uint32_t>(1 + payload.size()));
    frame.push_back(static_cast<uint8_t>(id));
    frame.insert(frame.end(), payload.begin(), payload.end());

    size_t total_sent = 0;
    while (total_sent < frame.size()) {
        ssize_t n = send(sockfd, frame.data() + total_sent, frame.size() - total_sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw NetworkError("Failed to send message: " + NetworkUtils::last_error());
        }
        total_sent += static_cast<size_t>(n);
    }
}

std::optional<Message> PeerConnection::recv_message(int sockfd, std::chrono::milliseconds timeout) {
    // Read exact number of bytes, each read bounded by the timeout.
    // Returns the number of bytes read before the peer closed.
    auto read_exact = [&](void* buf, size_t count) -> size_t {
        size_t total_read = 0;
        char* buffer = static_cast<char*>(buf);

        while (total_read < count) {
            if (!NetworkUtils::wait_readable(sockfd, timeout)) {
                throw NetworkError("Timed out waiting for peer");
            }

            ssize_t bytes_read = read(sockfd, buffer + total_read, count - total_read);
            if (bytes_read < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw NetworkError("Read failed: " + NetworkUtils::last_error());
            }
            if (bytes_read == 0) {
                return total_read; // Connection closed
            }
            total_read += static_cast<size_t>(bytes_read);
        }
        return total_read;
    };

    // Read message length
    uint8_t len_buf[4];
    size_t got = read_exact(len_buf, 4);
    if (got == 0) {
        return std::nullopt;
    }
    if (got < 4) {
        throw NetworkError("Connection closed inside message header");
    }
    uint32_t length = decode_u32(std::vector<uint8_t>(len_buf, len_buf + 4));

    if (length == 0 || length > Config::MAX_FRAME_LENGTH) {
        throw ProtocolError("Invalid message length: " + std::to_string(length));
    }

    // Read message ID
    uint8_t id = 0;
    if (read_exact(&id, 1) != 1) {
        throw NetworkError("Connection closed before message ID");
    }
    if (id < static_cast<uint8_t>(MessageId::RequestChunk) || id > static_cast<uint8_t>(MessageId::Error)) {
        throw ProtocolError("Unknown message ID: " + std::to_string(id));
    }

    // Read payload
    Message message{static_cast<MessageId>(id), std::vector<uint8_t>(length - 1)};
    if (!message.payload.empty()) {
        if (read_exact(message.payload.data(), message.payload.size()) != message.payload.size()) {
            throw NetworkError("Connection closed inside message payload");
        }
    }
    return message;
}

std::vector<uint8_t> PeerConnection::encode_chunk_request(int chunk_index, const std::string& file_id) {
    std::vector<uint8_t> payload = encode_u32(static_cast<uint32_t>(chunk_index));
    payload.insert(payload.end(), file_id.begin(), file_id.end());
    return payload;
}

void PeerConnection::decode_chunk_request(const std::vector<uint8_t>& payload, int& chunk_index,
                                          std::string& file_id) {
    if (payload.size() <= 4) {
        throw ProtocolError("Chunk request too short");
    }
    uint32_t index = decode_u32(payload);
    if (index > static_cast<uint32_t>(INT32_MAX)) {
        throw ProtocolError("Chunk index out of range");
    }
    chunk_index = static_cast<int>(index);
    file_id.assign(payload.begin() + 4, payload.end());
}

std::vector<uint8_t> PeerConnection::encode_u32(uint32_t value) {
    uint32_t network = htonl(value);
    std::vector<uint8_t> bytes(4);
    memcpy(bytes.data(), &network, 4);
    return bytes;
}

uint32_t PeerConnection::decode_u32(const std::vector<uint8_t>& payload, size_t offset) {
    if (payload.size() < offset + 4) {
        throw ProtocolError("Truncated integer field");
    }
    uint32_t network = 0;
    memcpy(&network, payload.data() + offset, 4);
    return ntohl(network);
}

FetchResult PeerConnection::request_chunk(const PeerAddress& peer, const std::string& file_id, int chunk_index,
                                          std::chrono::milliseconds timeout) {
    FetchResult result;
    try {
        SocketHandle sock = connect_to_peer(peer, timeout);
        send_message(sock.get(), MessageId::RequestChunk, encode_chunk_request(chunk_index, file_id));

        std::optional<Message> reply = recv_message(sock.get(), timeout);
        if (!reply) {
            throw NetworkError("Peer closed the connection without answering");
        }

        if (reply->id == MessageId::Chunk) {
            if (reply->payload.size() < Config::DIGEST_SIZE) {
                throw ProtocolError("Chunk message too short");
            }
            std::copy(reply->payload.begin(), reply->payload.begin() + Config::DIGEST_SIZE, result.digest.begin());
            result.data.assign(reply->payload.begin() + Config::DIGEST_SIZE, reply->payload.end());
            result.status = FetchStatus::Ok;
        } else if (reply->id == MessageId::ChunkNotAvailable) {
            result.status = FetchStatus::NotAvailable;
            result.error = "Chunk " + std::to_string(chunk_index) + " not available at " + peer.to_string();
        } else if (reply->id == MessageId::Error) {
            result.status = FetchStatus::ProtocolFailure;
            result.error = "Peer error: " + std::string(reply->payload.begin(), reply->payload.end());
        } else {
            throw ProtocolError("Unexpected reply to chunk request: " + std::to_string(static_cast<int>(reply->id)));
        }
    } catch (const NetworkError& e) {
        result.status = FetchStatus::NetworkFailure;
        result.error = e.what();
    } catch (const ProtocolError& e) {
        result.status = FetchStatus::ProtocolFailure;
        result.error = e.what();
    }
    return result;
}

std::optional<FileDescriptor> PeerConnection::request_metadata(const PeerAddress& peer, const std::string& file_id,
                                                               std::chrono::milliseconds timeout) {
    try {
        SocketHandle sock = connect_to_peer(peer, timeout);
        send_message(sock.get(), MessageId::RequestMetadata, std::vector<uint8_t>(file_id.begin(), file_id.end()));

        std::optional<Message> reply = recv_message(sock.get(), timeout);
        if (!reply || reply->id != MessageId::Metadata) {
            return std::nullopt;
        }

        json j;
        try {
            j = json::parse(reply->payload.begin(), reply->payload.end());
        } catch (const json::exception& e) {
            throw ProtocolError(std::string("Malformed metadata: ") + e.what());
        }
        return FileDescriptor::from_json(j);
    } catch (const NetworkError& e) {
        std::cerr << "Metadata request to " << peer.to_string() << " failed: " << e.what() << std::endl;
    } catch (const ProtocolError& e) {
        std::cerr << "Metadata from " << peer.to_string() << " rejected: " << e.what() << std::endl;
    }
    return std::nullopt;
}

bool PeerConnection::ping(const PeerAddress& peer, std::chrono::milliseconds timeout) {
    try {
        SocketHandle sock = connect_to_peer(peer, timeout);
        send_message(sock.get(), MessageId::Ping);
        std::optional<Message> reply = recv_message(sock.get(), timeout);
        return reply && reply->id == MessageId::Pong;
    } catch (const NetworkError&) {
        return false;
    } catch (const ProtocolError&) {
        return false;
    }
}
