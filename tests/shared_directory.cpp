#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "storage/SharedDirectory.hpp"
#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

void scan_indexes_new_files_once() {
    test::TempDir dir("shared_scan");
    fs::create_directories(dir / "shared");
    auto a = test::make_bytes(300, 1);
    auto b = test::make_bytes(64, 2);
    test::write_file(dir / "shared" / "a.bin", a);
    test::write_file(dir / "shared" / "b.bin", b);

    SharedDirectory storage((dir / "shared").string(), (dir / "downloads").string(), 64);
    assert(storage.scan().size() == 2);
    assert(storage.scan().empty());
    assert(fs::exists(dir / "shared" / Config::METADATA_FILE));

    SplitResult split = ChunkCodec::split(a, 64, "a.bin");
    const std::string id = split.descriptor.file_id();
    auto found = storage.find_file(id);
    assert(found && *found == split.descriptor);
    assert(storage.path_of(id) == (dir / "shared" / "a.bin").string());
    for (int i = 0; i < split.descriptor.get_chunk_count(); ++i) {
        assert(storage.read_chunk(id, i) == split.chunks[i]);
    }
    assert(!storage.read_chunk(id, 99));
    assert(!storage.read_chunk(std::string(64, '0'), 0));
}

void index_survives_restart() {
    test::TempDir dir("shared_reload");
    fs::create_directories(dir / "shared");
    test::write_file(dir / "shared" / "keep.txt", test::make_bytes(100, 3));
    std::string id;
    {
        SharedDirectory storage((dir / "shared").string(), (dir / "downloads").string(), 32);
        id = storage.scan().at(0).file_id();
    }

    SharedDirectory reopened((dir / "shared").string(), (dir / "downloads").string(), 32);
    assert(reopened.find_file(id));
    assert(reopened.list_local_files().size() == 1);
    assert(reopened.scan().empty());
}

void modified_file_stops_serving_bad_chunks() {
    test::TempDir dir("shared_modified");
    fs::create_directories(dir / "shared");
    auto bytes = test::make_bytes(128, 4);
    auto path = dir / "shared" / "data";
    test::write_file(path, bytes);

    SharedDirectory storage((dir / "shared").string(), (dir / "downloads").string(), 64);
    std::string id = storage.scan().at(0).file_id();

    bytes[70] ^= 0x55;
    test::write_file(path, bytes);
    assert(storage.read_chunk(id, 0));
    assert(!storage.read_chunk(id, 1));
}

void refresh_drops_deleted_files() {
    test::TempDir dir("shared_refresh");
    fs::create_directories(dir / "shared");
    test::write_file(dir / "shared" / "gone", test::make_bytes(10, 5));
    test::write_file(dir / "shared" / "stays", test::make_bytes(10, 6));

    SharedDirectory storage((dir / "shared").string(), (dir / "downloads").string(), 64);
    storage.scan();
    std::string gone_id = ChunkCodec::split(test::make_bytes(10, 5), 64).descriptor.file_id();

    fs::remove(dir / "shared" / "gone");
    auto removed = storage.refresh();
    assert(removed.size() == 1 && removed[0] == gone_id);
    assert(!storage.find_file(gone_id));
    assert(storage.list_local_files().size() == 1);
    assert(storage.refresh().empty());
}

void staged_download_commits_to_unique_paths() {
    test::TempDir dir("shared_commit");
    SharedDirectory storage((dir / "shared").string(), (dir / "downloads").string(), 64);

    auto bytes = test::make_bytes(200, 7);
    SplitResult split = ChunkCodec::split(bytes, 64, "report.pdf");
    for (int i = split.descriptor.get_chunk_count() - 1; i >= 0; --i) {
        storage.write_chunk(split.descriptor, i, split.chunks[i]);
    }
    assert(!fs::exists(dir / "downloads" / "report.pdf"));

    std::string first = storage.commit(split.descriptor);
    assert(first == (dir / "downloads" / "report.pdf").string());
    assert(test::read_file(first) == bytes);
    assert(fs::is_empty(dir / "downloads" / ".tmp"));

    for (int i = 0; i < split.descriptor.get_chunk_count(); ++i) {
        storage.write_chunk(split.descriptor, i, split.chunks[i]);
    }
    std::string second = storage.commit(split.descriptor);
    assert(second != first);
    assert(test::read_file(second) == bytes);

    assert(storage.file_exists(second));
    storage.add_local_file(split.descriptor, second);
    assert(storage.path_of(split.descriptor.file_id()) == second);
    assert(storage.remove_local_file(split.descriptor.file_id()));
    assert(!storage.remove_local_file(split.descriptor.file_id()));
}

void incomplete_staging_is_not_committed() {
    test::TempDir dir("shared_incomplete");
    SharedDirectory storage((dir / "shared").string(), (dir / "downloads").string(), 64);

    SplitResult split = ChunkCodec::split(test::make_bytes(200, 8), 64, "partial.bin");
    storage.write_chunk(split.descriptor, 0, split.chunks[0]);
    storage.write_chunk(split.descriptor, 2, split.chunks[2]);

    bool threw = false;
    try {
        storage.commit(split.descriptor);
    } catch (const AssemblyError&) {
        threw = true;
    }
    assert(threw);
    assert(!fs::exists(dir / "downloads" / "partial.bin"));
    assert(!fs::exists(dir / "downloads" / "partial.bin.partial"));

    storage.discard(split.descriptor);
    assert(fs::is_empty(dir / "downloads" / ".tmp"));
}

void same_named_downloads_commit_side_by_side() {
    test::TempDir dir("shared_same_name");
    SharedDirectory storage((dir / "shared").string(), (dir / "downloads").string(), 64 * 1024);

    std::set<std::string> paths;
    for (int round = 0; round < 10; ++round) {
        std::vector<std::vector<uint8_t>> contents;
        std::vector<SplitResult> splits;
        for (int k = 0; k < 2; ++k) {
            contents.push_back(test::make_bytes(512 * 1024, static_cast<uint32_t>(round * 2 + k + 100)));
            splits.push_back(ChunkCodec::split(contents.back(), 64 * 1024, "same.bin"));
        }

        std::string committed[2];
        std::string errors[2];
        std::vector<std::thread> threads;
        for (int k = 0; k < 2; ++k) {
            threads.emplace_back([&, k] {
                try {
                    const FileDescriptor& descriptor = splits[k].descriptor;
                    for (int i = 0; i < descriptor.get_chunk_count(); ++i) {
                        storage.write_chunk(descriptor, i, splits[k].chunks[i]);
                    }
                    committed[k] = storage.commit(descriptor);
                } catch (const std::exception& e) {
                    errors[k] = e.what();
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        for (int k = 0; k < 2; ++k) {
            assert(errors[k].empty());
            assert(test::read_file(committed[k]) == contents[k]);
            assert(paths.insert(committed[k]).second);
        }
    }
    assert(paths.size() == 20);
    assert(fs::is_empty(dir / "downloads" / ".tmp"));
}

void share_accepts_files_anywhere() {
    test::TempDir dir("shared_share");
    auto outside = dir / "outside.dat";
    test::write_file(outside, test::make_bytes(90, 9));
    SharedDirectory storage((dir / "shared").string(), (dir / "downloads").string(), 64);

    FileDescriptor descriptor = storage.share(outside.string());
    assert(descriptor.name == "outside.dat");
    assert(storage.find_file(descriptor.file_id()));
    assert(storage.read_chunk(descriptor.file_id(), 1)->size() == 26);
}

}  // namespace

int main() {
    scan_indexes_new_files_once();
    index_survives_restart();
    modified_file_stops_serving_bad_chunks();
    refresh_drops_deleted_files();
    staged_download_commits_to_unique_paths();
    incomplete_staging_is_not_committed();
    same_named_downloads_commit_side_by_side();
    share_accepts_files_anywhere();
    return 0;
}
