#pragma once
#include "../core/Config.hpp"
#include "../core/FileDescriptor.hpp"
#include "../core/PeerAddress.hpp"
#include "../download/ChunkSource.hpp"
#include "../utils/NetworkUtils.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Transfer protocol frames: 4-byte big-endian length, 1-byte id, payload.
enum class MessageId : uint8_t {
    RequestChunk = 1,      // u32 index, file id
    Chunk = 2,             // 32-byte digest, chunk bytes
    ChunkNotAvailable = 3, // u32 index
    RequestMetadata = 4,   // file id
    Metadata = 5,          // FileDescriptor JSON
    FileNotFound = 6,      // file id
    Ping = 7,
    Pong = 8,
    Error = 9              // text
};

struct Message {
    MessageId id;
    std::vector<uint8_t> payload;
};

class PeerConnection {
public:
    // Throws NetworkError on failure or when the connect timeout expires.
    static SocketHandle connect_to_peer(const PeerAddress& peer,
                                        std::chrono::milliseconds timeout = Config::CONNECT_TIMEOUT);

    // Message handling. Throw NetworkError on I/O failure or timeout and
    // ProtocolError on malformed frames.
    static void send_message(int sockfd, MessageId id, const std::vector<uint8_t>& payload = {});
    // Returns nullopt when the peer closed the connection between messages.
    static std::optional<Message> recv_message(int sockfd, std::chrono::milliseconds timeout);

    static std::vector<uint8_t> encode_chunk_request(int chunk_index, const std::string& file_id);
    static void decode_chunk_request(const std::vector<uint8_t>& payload, int& chunk_index, std::string& file_id);
    static std::vector<uint8_t> encode_u32(uint32_t value);
    static uint32_t decode_u32(const std::vector<uint8_t>& payload, size_t offset = 0);

    // Client side requests, one connection each.
    static FetchResult request_chunk(const PeerAddress& peer, const std::string& file_id, int chunk_index,
                                     std::chrono::milliseconds timeout);
    static std::optional<FileDescriptor> request_metadata(const PeerAddress& peer, const std::string& file_id,
                                                          std::chrono::milliseconds timeout);
    static bool ping(const PeerAddress& peer, std::chrono::milliseconds timeout);
};
