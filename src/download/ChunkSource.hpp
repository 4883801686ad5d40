#pragma once
#include "../core/ChunkCodec.hpp"
#include "../core/PeerAddress.hpp"
#include <chrono>
#include <optional>
#include <string>

enum class FetchStatus {
    Ok,
    NotAvailable,
    NetworkFailure,
    ProtocolFailure
};

struct FetchResult {
    FetchStatus status = FetchStatus::NetworkFailure;
    ChunkBytes data;
    Digest digest{}; // as claimed by the seeder
    std::string error;
};

// Fetches one chunk from one seeder. Failures are reported in the result,
// not thrown; implementations must be safe to call from several threads.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;
    virtual FetchResult fetch_chunk(const PeerAddress& seeder, const FileDescriptor& descriptor, int chunk_index) = 0;
    // Nullopt when the seeder does not answer or does not hold the file.
    virtual std::optional<FileDescriptor> fetch_metadata(const PeerAddress& seeder, const std::string& file_id) = 0;
};

// Speaks the transfer protocol, one connection per fetch.
class NetworkChunkSource : public ChunkSource {
public:
    explicit NetworkChunkSource(std::chrono::milliseconds timeout);
    FetchResult fetch_chunk(const PeerAddress& seeder, const FileDescriptor& descriptor, int chunk_index) override;
    std::optional<FileDescriptor> fetch_metadata(const PeerAddress& seeder, const std::string& file_id) override;

private:
    std::chrono::milliseconds timeout;
};
