#include "Seeder.hpp"
#include "Errors.hpp"
#include <iostream>

Seeder::Seeder(SharedDirectory& storage, TrackerClient& tracker, std::string peer_id,
               std::chrono::milliseconds read_timeout)
    : storage(storage), tracker(tracker), peer_id(std::move(peer_id)), server(storage, read_timeout) {}

void Seeder::start(uint16_t port, const std::string& bind_host) {
    server.start(port, bind_host);
}

void Seeder::stop() {
    server.stop();
}

FileDescriptor Seeder::share_file(const std::string& path) {
    if (!storage.file_exists(path)) {
        throw std::runtime_error("File not found: " + path);
    }
    FileDescriptor descriptor = storage.share(path);
    tracker.announce_file(peer_id, descriptor);
    std::cout << "Sharing " << descriptor.name << " (" << descriptor.file_id() << ")" << std::endl;
    return descriptor;
}

std::vector<FileDescriptor> Seeder::scan() {
    std::vector<FileDescriptor> added = storage.scan();
    for (const auto& descriptor : added) {
        tracker.announce_file(peer_id, descriptor);
        std::cout << "Sharing " << descriptor.name << " (" << descriptor.file_id() << ")" << std::endl;
    }
    return added;
}

std::vector<std::string> Seeder::refresh() {
    std::vector<std::string> removed = storage.refresh();
    for (const auto& file_id : removed) {
        try {
            tracker.withdraw_file(peer_id, file_id);
        } catch (const NetworkError& e) {
            // The next registration carries the corrected file list.
            std::cerr << "Could not withdraw " << file_id << ": " << e.what() << std::endl;
        }
    }
    return removed;
}

std::vector<FileDescriptor> Seeder::shared_files() const {
    return storage.list_local_files();
}
