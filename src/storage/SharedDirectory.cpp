#include "SharedDirectory.hpp"
#include "../core/Config.hpp"
#include "../core/Errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

SharedDirectory::SharedDirectory(const std::string& shared, const std::string& downloads, uint32_t chunk_size)
    : shared_dir(shared), download_dir(downloads), staging_dir(fs::path(downloads) / ".tmp"),
      metadata_file(fs::path(shared) / Config::METADATA_FILE), chunk_size(chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    fs::create_directories(shared_dir);
    fs::create_directories(staging_dir);
    load_metadata();
}

std::vector<FileDescriptor> SharedDirectory::scan() {
    std::vector<fs::path> candidates;
    for (const auto& entry : fs::directory_iterator(shared_dir)) {
        if (entry.is_regular_file() && entry.path().filename() != Config::METADATA_FILE) {
            candidates.push_back(entry.path());
        }
    }

    std::vector<FileDescriptor> added;
    for (const auto& path : candidates) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            bool known = false;
            std::error_code ec;
            uintmax_t size = fs::file_size(path, ec);
            for (const auto& entry : index) {
                if (!ec && fs::path(entry.second.path) == path && entry.second.descriptor.length == size) {
                    known = true;
                    break;
                }
            }
            if (known) {
                continue;
            }
        }
        try {
            added.push_back(share(path.string()));
        } catch (const std::exception& e) {
            std::cerr << "Could not share " << path << ": " << e.what() << std::endl;
        }
    }
    return added;
}

std::vector<std::string> SharedDirectory::refresh() {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> removed;
    for (auto it = index.begin(); it != index.end();) {
        if (!fs::exists(it->second.path)) {
            std::cout << "Removed deleted file '" << it->second.descriptor.name << "' from shared files." << std::endl;
            removed.push_back(it->first);
            it = index.erase(it);
        } else {
            ++it;
        }
    }
    if (!removed.empty()) {
        save_metadata_locked();
    }
    return removed;
}

FileDescriptor SharedDirectory::share(const std::string& path) {
    FileDescriptor descriptor = ChunkCodec::describe_file(path, chunk_size);
    add_local_file(descriptor, path);
    return descriptor;
}

std::vector<FileDescriptor> SharedDirectory::list_local_files() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<FileDescriptor> files;
    for (const auto& entry : index) {
        files.push_back(entry.second.descriptor);
    }
    return files;
}

std::optional<FileDescriptor> SharedDirectory::find_file(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = index.find(file_id);
    if (it == index.end()) {
        return std::nullopt;
    }
    return it->second.descriptor;
}

std::optional<ChunkBytes> SharedDirectory::read_chunk(const std::string& file_id, int chunk_index) const {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = index.find(file_id);
        if (it == index.end()) {
            return std::nullopt;
        }
        entry = it->second;
    }
    if (chunk_index < 0 || chunk_index >= entry.descriptor.get_chunk_count()) {
        return std::nullopt;
    }

    // Read outside the lock; concurrent readers each open their own stream.
    try {
        ChunkBytes chunk = ChunkCodec::read_chunk(entry.path, entry.descriptor, chunk_index);
        if (!ChunkCodec::verify_chunk(chunk, entry.descriptor.chunk_digests[chunk_index])) {
            std::cerr << "Chunk " << chunk_index << " of " << entry.path
                      << " no longer matches its digest" << std::endl;
            return std::nullopt;
        }
        return chunk;
    } catch (const std::exception& e) {
        std::cerr << "Error reading chunk " << chunk_index << " of " << entry.path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

void SharedDirectory::write_chunk(const FileDescriptor& descriptor, int chunk_index, const ChunkBytes& bytes) {
    fs::path path = part_path(descriptor, chunk_index);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to create chunk file: " + path.string());
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("Failed to write chunk file: " + path.string());
    }
}

std::string SharedDirectory::commit(const FileDescriptor& descriptor) {
    fs::create_directories(download_dir);
    fs::create_directories(staging_dir);
    // Named by file id, so downloads of different files never share it.
    fs::path partial_path = staging_dir / (descriptor.file_id() + ".partial");

    {
        std::ofstream out(partial_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to create output file: " + partial_path.string());
        }
        for (int i = 0; i < descriptor.get_chunk_count(); ++i) {
            std::ifstream part(part_path(descriptor, i), std::ios::binary);
            if (!part) {
                out.close();
                fs::remove(partial_path);
                throw AssemblyError("Cannot commit " + descriptor.name + ": chunk " + std::to_string(i) + " missing");
            }
            out << part.rdbuf();
        }
        if (!out) {
            out.close();
            fs::remove(partial_path);
            throw std::runtime_error("Failed to write output file: " + partial_path.string());
        }
    }

    fs::path final_path;
    {
        // Path choice and rename happen together so two commits never pick the same name.
        std::lock_guard<std::mutex> lock(commit_mtx);
        final_path = unique_download_path(descriptor.name);
        fs::rename(partial_path, final_path);
    }
    discard(descriptor);
    std::cout << "File assembled and saved to: " << final_path.string() << std::endl;
    return final_path.string();
}

void SharedDirectory::discard(const FileDescriptor& descriptor) {
    std::error_code ec;
    for (int i = 0; i < descriptor.get_chunk_count(); ++i) {
        fs::remove(part_path(descriptor, i), ec);
    }
}

bool SharedDirectory::file_exists(const std::string& path) const {
    return fs::exists(path);
}

void SharedDirectory::add_local_file(const FileDescriptor& descriptor, const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx);
    index[descriptor.file_id()] = Entry{descriptor, path};
    save_metadata_locked();
}

bool SharedDirectory::remove_local_file(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mtx);
    if (index.erase(file_id) == 0) {
        return false;
    }
    save_metadata_locked();
    return true;
}

std::string SharedDirectory::path_of(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = index.find(file_id);
    return it == index.end() ? std::string() : it->second.path;
}

void SharedDirectory::load_metadata() {
    if (!fs::exists(metadata_file)) {
        return;
    }
    std::ifstream file(metadata_file);
    try {
        json j = json::parse(file);
        for (const auto& item : j.at("files")) {
            FileDescriptor descriptor = FileDescriptor::from_json(item.at("descriptor"));
            std::string path = item.at("path").get<std::string>();
            if (fs::exists(path) && descriptor.chunk_size == chunk_size) {
                index[descriptor.file_id()] = Entry{descriptor, path};
            }
        }
    } catch (const std::exception& e) {
        // A broken index only costs a rescan.
        std::cerr << "Ignoring unreadable metadata file " << metadata_file << ": " << e.what() << std::endl;
        index.clear();
    }
}

void SharedDirectory::save_metadata_locked() const {
    json files = json::array();
    for (const auto& entry : index) {
        files.push_back(json{{"descriptor", entry.second.descriptor.to_json()}, {"path", entry.second.path}});
    }
    std::ofstream file(metadata_file, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to write metadata file: " + metadata_file.string());
    }
    file << json{{"files", files}}.dump(2);
}

fs::path SharedDirectory::part_path(const FileDescriptor& descriptor, int chunk_index) const {
    return staging_dir / (descriptor.file_id() + ".part" + std::to_string(chunk_index));
}

fs::path SharedDirectory::unique_download_path(const std::string& name) const {
    std::string base = fs::path(name).filename().string();
    if (base.empty() || base == "." || base == "..") {
        base = "download";
    }
    fs::path candidate = download_dir / base;
    for (int n = 1; fs::exists(candidate); ++n) {
        candidate = download_dir / (base + "." + std::to_string(n));
    }
    return candidate;
}
