#include "ReseedPromoter.hpp"
#include <iostream>

ReseedPromoter::ReseedPromoter(TrackerClient& tracker, FileStorage& storage, std::string peer_id)
    : tracker(tracker), storage(storage), local_peer_id(std::move(peer_id)) {}

bool ReseedPromoter::promote(const FileDescriptor& descriptor, const std::string& local_path) {
    std::lock_guard<std::mutex> lock(mtx);
    std::string file_id = descriptor.file_id();

    if (storage.find_file(file_id)) {
        return false;
    }
    if (!storage.file_exists(local_path)) {
        throw std::runtime_error("Cannot seed " + descriptor.name + ": " + local_path + " does not exist");
    }

    storage.add_local_file(descriptor, local_path);
    try {
        tracker.announce_file(local_peer_id, descriptor);
    } catch (const std::exception&) {
        storage.remove_local_file(file_id);
        throw;
    }

    std::cout << "Now seeding " << descriptor.name << " (" << file_id << ")" << std::endl;
    return true;
}
