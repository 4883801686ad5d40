#pragma once
#include "FileStorage.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// FileStorage over a shared directory and a download directory. The shared
// directory holds shared_files.json, an index of every file this peer seeds;
// downloads are staged as part files under <download_dir>/.tmp.
class SharedDirectory : public FileStorage {
public:
    SharedDirectory(const std::string& shared_dir, const std::string& download_dir, uint32_t chunk_size);

    // Indexes new files in the shared directory. Returns the newly shared ones.
    std::vector<FileDescriptor> scan();
    // Drops index entries whose file was deleted. Returns their ids.
    std::vector<std::string> refresh();
    // Describes and indexes one file wherever it lives.
    FileDescriptor share(const std::string& path);

    std::vector<FileDescriptor> list_local_files() const override;
    std::optional<FileDescriptor> find_file(const std::string& file_id) const override;
    std::optional<ChunkBytes> read_chunk(const std::string& file_id, int chunk_index) const override;

    void write_chunk(const FileDescriptor& descriptor, int chunk_index, const ChunkBytes& bytes) override;
    std::string commit(const FileDescriptor& descriptor) override;
    void discard(const FileDescriptor& descriptor) override;

    bool file_exists(const std::string& path) const override;
    void add_local_file(const FileDescriptor& descriptor, const std::string& path) override;
    bool remove_local_file(const std::string& file_id) override;

    std::string path_of(const std::string& file_id) const;

private:
    struct Entry {
        FileDescriptor descriptor;
        std::string path;
    };

    void load_metadata();
    void save_metadata_locked() const;
    fs::path part_path(const FileDescriptor& descriptor, int chunk_index) const;
    fs::path unique_download_path(const std::string& name) const;

    fs::path shared_dir;
    fs::path download_dir;
    fs::path staging_dir;
    fs::path metadata_file;
    uint32_t chunk_size;

    std::map<std::string, Entry> index;
    mutable std::mutex mtx;
    std::mutex commit_mtx;
};
