#include "FileDescriptor.hpp"
#include "Errors.hpp"
#include <iostream>
#include <stdexcept>

std::string FileDescriptor::file_id() const {
    return CryptoUtils::to_hex(file_digest);
}

void FileDescriptor::print_info() const {
    std::cout << "Name: " << name << std::endl;
    std::cout << "Length: " << length << std::endl;
    std::cout << "File ID: " << file_id() << std::endl;
    std::cout << "Chunk Length: " << chunk_size << std::endl;
    std::cout << "Chunk Hashes: " << std::endl;

    for (const auto& hash : chunk_digests) {
        std::cout << CryptoUtils::to_hex(hash) << std::endl;
    }
}

int FileDescriptor::get_chunk_count() const {
    return static_cast<int>(chunk_digests.size());
}

uint32_t FileDescriptor::get_chunk_size(int chunk_index) const {
    int total_chunks = get_chunk_count();
    if (chunk_index < 0 || chunk_index >= total_chunks) {
        throw std::out_of_range("Chunk index out of range: " + std::to_string(chunk_index));
    }
    if (chunk_index < total_chunks - 1) {
        return chunk_size;
    }
    // Last chunk might be smaller
    uint64_t last_chunk_size = length % chunk_size;
    return last_chunk_size == 0 ? chunk_size : static_cast<uint32_t>(last_chunk_size);
}

uint64_t FileDescriptor::get_chunk_offset(int chunk_index) const {
    return static_cast<uint64_t>(chunk_index) * chunk_size;
}

json FileDescriptor::to_json() const {
    json chunks = json::array();
    for (const auto& hash : chunk_digests) {
        chunks.push_back(CryptoUtils::to_hex(hash));
    }
    return json{
        {"name", name},
        {"size", length},
        {"chunk_size", chunk_size},
        {"digest", file_id()},
        {"chunks", chunks}
    };
}

FileDescriptor FileDescriptor::from_json(const json& j) {
    FileDescriptor descriptor;
    try {
        descriptor.name = j.at("name").get<std::string>();
        descriptor.length = j.at("size").get<uint64_t>();
        descriptor.chunk_size = j.at("chunk_size").get<uint32_t>();
        descriptor.file_digest = CryptoUtils::digest_from_hex(j.at("digest").get<std::string>());
        for (const auto& chunk : j.at("chunks")) {
            descriptor.chunk_digests.push_back(CryptoUtils::digest_from_hex(chunk.get<std::string>()));
        }
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("Malformed file descriptor: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(std::string("Malformed file descriptor: ") + e.what());
    }

    if (descriptor.chunk_size == 0) {
        throw ProtocolError("Malformed file descriptor: zero chunk size");
    }
    uint64_t expected_chunks = (descriptor.length + descriptor.chunk_size - 1) / descriptor.chunk_size;
    if (expected_chunks != descriptor.chunk_digests.size()) {
        throw ProtocolError("Malformed file descriptor: " + std::to_string(descriptor.chunk_digests.size())
                            + " chunk digests for " + std::to_string(expected_chunks) + " chunks");
    }
    return descriptor;
}

bool FileDescriptor::operator==(const FileDescriptor& other) const {
    return name == other.name && length == other.length && chunk_size == other.chunk_size
        && file_digest == other.file_digest && chunk_digests == other.chunk_digests;
}
