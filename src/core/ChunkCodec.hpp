#pragma once
#include "FileDescriptor.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

using ChunkBytes = std::vector<uint8_t>;

struct SplitResult {
    FileDescriptor descriptor;
    std::vector<ChunkBytes> chunks;
};

// Splits files into fixed-size SHA-256 addressed chunks and puts them back
// together. Chunk i always covers [i * chunk_size, min((i + 1) * chunk_size, size)).
class ChunkCodec {
public:
    static SplitResult split(const std::vector<uint8_t>& file_bytes, uint32_t chunk_size,
                             const std::string& name = "");

    // Streams a file from disk without loading it whole.
    static FileDescriptor describe_file(const std::string& path, uint32_t chunk_size);
    static ChunkBytes read_chunk(const std::string& path, const FileDescriptor& descriptor, int chunk_index);

    static bool verify_chunk(const ChunkBytes& bytes, const Digest& expected_digest);
    static bool verify_whole(const std::vector<uint8_t>& assembled_bytes, const Digest& expected_digest);

    // Throws AssemblyError if any chunk is missing.
    static std::vector<uint8_t> assemble(const std::vector<std::optional<ChunkBytes>>& ordered_chunks);
};
