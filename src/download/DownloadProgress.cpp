#include "DownloadProgress.hpp"
#include <stdexcept>

const char* to_string(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Pending: return "Pending";
        case ChunkStatus::InFlight: return "InFlight";
        case ChunkStatus::Verified: return "Verified";
        case ChunkStatus::Failed: return "Failed";
    }
    return "Unknown";
}

DownloadProgress::DownloadProgress(const FileDescriptor& descriptor)
    : chunks(descriptor.get_chunk_count()), chunk_data(descriptor.get_chunk_count()),
      total_chunks(descriptor.get_chunk_count()) {

    for (int i = 0; i < total_chunks; ++i) {
        chunks[i].index = i;
        chunks[i].digest = descriptor.chunk_digests[i];
    }
}

int DownloadProgress::next_pending() const {
    int best = -1;
    for (const auto& chunk : chunks) {
        if (chunk.status != ChunkStatus::Pending) {
            continue;
        }
        if (best < 0 || chunk.retries < chunks[best].retries) {
            best = chunk.index;
        }
    }
    return best;
}

void DownloadProgress::mark_in_flight(int chunk_index, int peer) {
    ChunkState& chunk = chunks.at(chunk_index);
    if (chunk.status != ChunkStatus::Pending) {
        throw std::logic_error("Chunk " + std::to_string(chunk_index) + " is not pending");
    }
    chunk.status = ChunkStatus::InFlight;
    chunk.peer = peer;
}

void DownloadProgress::mark_verified(int chunk_index, ChunkBytes data) {
    ChunkState& chunk = chunks.at(chunk_index);
    if (chunk.status != ChunkStatus::InFlight) {
        throw std::logic_error("Chunk " + std::to_string(chunk_index) + " is not in flight");
    }
    chunk.status = ChunkStatus::Verified;
    chunk.peer = -1;
    chunk_data[chunk_index] = std::move(data);
    verified_count++;
}

int DownloadProgress::mark_attempt_failed(int chunk_index) {
    ChunkState& chunk = chunks.at(chunk_index);
    if (chunk.status != ChunkStatus::InFlight) {
        throw std::logic_error("Chunk " + std::to_string(chunk_index) + " is not in flight");
    }
    chunk.excluded.insert(chunk.peer);
    chunk.peer = -1;
    chunk.status = ChunkStatus::Pending;
    return ++chunk.retries;
}

void DownloadProgress::mark_failed(int chunk_index) {
    ChunkState& chunk = chunks.at(chunk_index);
    chunk.status = ChunkStatus::Failed;
    chunk.peer = -1;
}

void DownloadProgress::fail_pending() {
    for (auto& chunk : chunks) {
        if (chunk.status == ChunkStatus::Pending) {
            chunk.status = ChunkStatus::Failed;
        }
    }
}

bool DownloadProgress::is_download_complete() const {
    return verified_count == total_chunks;
}

bool DownloadProgress::has_pending() const {
    return next_pending() >= 0;
}

int DownloadProgress::get_completed_count() const {
    return verified_count;
}

int DownloadProgress::get_total_count() const {
    return total_chunks;
}

std::vector<uint8_t> DownloadProgress::assemble() const {
    return ChunkCodec::assemble(chunk_data);
}

void DownloadProgress::clear_data() {
    for (auto& data : chunk_data) {
        data.reset();
    }
}
