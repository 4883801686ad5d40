#include "ChunkCodec.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

SplitResult ChunkCodec::split(const std::vector<uint8_t>& file_bytes, uint32_t chunk_size,
                              const std::string& name) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }

    SplitResult result;
    result.descriptor.name = name;
    result.descriptor.length = file_bytes.size();
    result.descriptor.chunk_size = chunk_size;
    result.descriptor.file_digest = CryptoUtils::sha256(file_bytes);

    for (size_t offset = 0; offset < file_bytes.size(); offset += chunk_size) {
        size_t end = std::min(file_bytes.size(), offset + chunk_size);
        ChunkBytes chunk(file_bytes.begin() + offset, file_bytes.begin() + end);
        result.descriptor.chunk_digests.push_back(CryptoUtils::sha256(chunk));
        result.chunks.push_back(std::move(chunk));
    }
    return result;
}

FileDescriptor ChunkCodec::describe_file(const std::string& path, uint32_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }

    FileDescriptor descriptor;
    descriptor.name = std::filesystem::path(path).filename().string();
    descriptor.chunk_size = chunk_size;

    Sha256Stream whole;
    ChunkBytes buffer(chunk_size);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), chunk_size);
        std::streamsize got = file.gcount();
        if (got <= 0) {
            break;
        }
        whole.update(buffer.data(), static_cast<size_t>(got));
        descriptor.chunk_digests.push_back(CryptoUtils::sha256(buffer.data(), static_cast<size_t>(got)));
        descriptor.length += static_cast<uint64_t>(got);
    }
    if (file.bad()) {
        throw std::runtime_error("Failed reading file: " + path);
    }

    descriptor.file_digest = whole.finish();
    return descriptor;
}

ChunkBytes ChunkCodec::read_chunk(const std::string& path, const FileDescriptor& descriptor, int chunk_index) {
    uint32_t size = descriptor.get_chunk_size(chunk_index);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }

    ChunkBytes chunk(size);
    file.seekg(static_cast<std::streamoff>(descriptor.get_chunk_offset(chunk_index)));
    file.read(reinterpret_cast<char*>(chunk.data()), size);
    if (file.gcount() != static_cast<std::streamsize>(size)) {
        throw std::runtime_error("Short read of chunk " + std::to_string(chunk_index) + " from " + path);
    }
    return chunk;
}

bool ChunkCodec::verify_chunk(const ChunkBytes& bytes, const Digest& expected_digest) {
    return CryptoUtils::sha256(bytes) == expected_digest;
}

bool ChunkCodec::verify_whole(const std::vector<uint8_t>& assembled_bytes, const Digest& expected_digest) {
    return CryptoUtils::sha256(assembled_bytes) == expected_digest;
}

std::vector<uint8_t> ChunkCodec::assemble(const std::vector<std::optional<ChunkBytes>>& ordered_chunks) {
    size_t total = 0;
    for (size_t i = 0; i < ordered_chunks.size(); ++i) {
        if (!ordered_chunks[i]) {
            throw AssemblyError("Cannot assemble file: chunk " + std::to_string(i) + " missing");
        }
        total += ordered_chunks[i]->size();
    }

    std::vector<uint8_t> assembled;
    assembled.reserve(total);
    for (const auto& chunk : ordered_chunks) {
        assembled.insert(assembled.end(), chunk->begin(), chunk->end());
    }
    return assembled;
}
