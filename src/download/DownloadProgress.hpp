#pragma once
#include "../core/ChunkCodec.hpp"
#include "../core/FileDescriptor.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class ChunkStatus {
    Pending,
    InFlight,
    Verified,
    Failed
};

const char* to_string(ChunkStatus status);

struct ChunkState {
    int index = 0;
    Digest digest{};
    ChunkStatus status = ChunkStatus::Pending;
    int peer = -1;           // seeder index while InFlight
    int retries = 0;
    std::set<int> excluded;  // seeders that already failed this chunk in the current round
};

// Per-download chunk table and verified chunk buffers. Holds the ChunkState
// transitions; not synchronised, the owning scheduler serialises access.
class DownloadProgress {
private:
    std::vector<ChunkState> chunks;
    std::vector<std::optional<ChunkBytes>> chunk_data;
    int verified_count = 0;
    int total_chunks;

public:
    explicit DownloadProgress(const FileDescriptor& descriptor);

    // Pending chunk with the fewest retries, lowest index first. -1 if none.
    int next_pending() const;

    void mark_in_flight(int chunk_index, int peer);
    void mark_verified(int chunk_index, ChunkBytes data);
    // Back to Pending with one more retry and the peer excluded. Returns the
    // new retry count.
    int mark_attempt_failed(int chunk_index);
    void mark_failed(int chunk_index);
    void fail_pending();

    const ChunkState& state(int chunk_index) const { return chunks[chunk_index]; }
    ChunkState& state(int chunk_index) { return chunks[chunk_index]; }
    const std::vector<ChunkState>& states() const { return chunks; }

    bool is_download_complete() const;
    bool has_pending() const;
    int get_completed_count() const;
    int get_total_count() const;

    // Throws AssemblyError unless every chunk is verified.
    std::vector<uint8_t> assemble() const;
    void clear_data();
};
