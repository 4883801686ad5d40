#pragma once
#include "FileDescriptor.hpp"
#include "../download/ChunkSource.hpp"
#include "../download/DownloadScheduler.hpp"
#include "../download/ReseedPromoter.hpp"
#include "../network/TrackerClient.hpp"
#include "../storage/FileStorage.hpp"
#include <map>
#include <mutex>
#include <string>

// Downloading role of a peer: finds seeders through the tracker, pulls the
// file with a DownloadScheduler, commits it and starts seeding it.
class Leecher {
private:
    TrackerClient& tracker;
    FileStorage& storage;
    ReseedPromoter& promoter;
    ChunkSource& source;
    std::string peer_id;
    SchedulerOptions options;
    DownloadObserver observer;

    struct ActiveDownload {
        DownloadScheduler* scheduler = nullptr; // set while the scheduler runs
        bool cancelled = false;
    };

    std::mutex mtx;
    std::map<std::string, ActiveDownload> active; // file id -> download in progress

    bool cancel_requested(const std::string& file_id);
    DownloadResult cancelled_result(const std::string& file_id);
    FileDescriptor fetch_descriptor(const std::string& file_id, const std::vector<PeerAddress>& seeders);
    void commit(const FileDescriptor& descriptor, DownloadResult& result);

public:
    Leecher(TrackerClient& tracker, FileStorage& storage, ReseedPromoter& promoter, ChunkSource& source,
            std::string peer_id, SchedulerOptions options = SchedulerOptions());

    void set_observer(DownloadObserver callback);

    // Throws ResourceExhaustedError when no seeder is known or can describe
    // the file, and std::runtime_error when the file is already downloading
    // or already held. Scheduler failures come back in the result.
    DownloadResult download(const std::string& file_id);

    // Also stops downloads still looking for seeders; they return Cancelled.
    void cancel_all();
    bool is_downloading(const std::string& file_id);
};
