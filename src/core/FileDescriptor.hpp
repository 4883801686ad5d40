#pragma once
#include "../utils/CryptoUtils.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

using json = nlohmann::json;

// Content description of one shareable file. Immutable once computed.
class FileDescriptor {
public:
    std::string name;
    uint64_t length = 0;
    uint32_t chunk_size = 0;
    Digest file_digest{};
    std::vector<Digest> chunk_digests;

    // Lowercase hex of the whole-file digest; the file's identity on the wire.
    std::string file_id() const;

    void print_info() const;
    int get_chunk_count() const;
    uint32_t get_chunk_size(int chunk_index) const;
    uint64_t get_chunk_offset(int chunk_index) const;

    json to_json() const;
    // Throws ProtocolError when the object is malformed or inconsistent.
    static FileDescriptor from_json(const json& j);

    bool operator==(const FileDescriptor& other) const;
};
