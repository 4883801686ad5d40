#pragma once
#include "../core/FileDescriptor.hpp"
#include "../network/TrackerClient.hpp"
#include "../storage/FileStorage.hpp"
#include <mutex>
#include <string>

// Turns a finished download into a shared file: records it in local storage
// and announces it for the local peer.
class ReseedPromoter {
public:
    ReseedPromoter(TrackerClient& tracker, FileStorage& storage, std::string peer_id);

    // False (and nothing sent) when the file is already held. Announce
    // failures are rethrown with the storage entry rolled back.
    bool promote(const FileDescriptor& descriptor, const std::string& local_path);

    const std::string& peer_id() const { return local_peer_id; }

private:
    TrackerClient& tracker;
    FileStorage& storage;
    std::string local_peer_id;
    std::mutex mtx;
};
