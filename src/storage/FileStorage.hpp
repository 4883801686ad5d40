#pragma once
#include "../core/ChunkCodec.hpp"
#include "../core/FileDescriptor.hpp"
#include <optional>
#include <string>
#include <vector>

// Local storage capability used by the seeder and leecher roles. Reads may run
// concurrently; a download only ever writes its own staging area.
class FileStorage {
public:
    virtual ~FileStorage() = default;

    virtual std::vector<FileDescriptor> list_local_files() const = 0;
    virtual std::optional<FileDescriptor> find_file(const std::string& file_id) const = 0;
    // Nullopt when the file or chunk is not held (or no longer matches its digest).
    virtual std::optional<ChunkBytes> read_chunk(const std::string& file_id, int chunk_index) const = 0;

    // Staging for an in-progress download; nothing is visible until commit().
    virtual void write_chunk(const FileDescriptor& descriptor, int chunk_index, const ChunkBytes& bytes) = 0;
    // Moves a fully staged download into place and returns its path.
    virtual std::string commit(const FileDescriptor& descriptor) = 0;
    virtual void discard(const FileDescriptor& descriptor) = 0;

    virtual bool file_exists(const std::string& path) const = 0;
    virtual void add_local_file(const FileDescriptor& descriptor, const std::string& path) = 0;
    virtual bool remove_local_file(const std::string& file_id) = 0;
};
