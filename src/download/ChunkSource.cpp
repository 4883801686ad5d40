#include "ChunkSource.hpp"
#include "../network/PeerConnection.hpp"

NetworkChunkSource::NetworkChunkSource(std::chrono::milliseconds timeout) : timeout(timeout) {}

FetchResult NetworkChunkSource::fetch_chunk(const PeerAddress& seeder, const FileDescriptor& descriptor,
                                            int chunk_index) {
    return PeerConnection::request_chunk(seeder, descriptor.file_id(), chunk_index, timeout);
}

std::optional<FileDescriptor> NetworkChunkSource::fetch_metadata(const PeerAddress& seeder, const std::string& file_id) {
    return PeerConnection::request_metadata(seeder, file_id, timeout);
}
