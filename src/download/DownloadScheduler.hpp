#pragma once
#include "../core/Config.hpp"
#include "../core/Errors.hpp"
#include "../core/FileDescriptor.hpp"
#include "../core/PeerAddress.hpp"
#include "ChunkSource.hpp"
#include "DownloadProgress.hpp"
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

struct SchedulerOptions {
    int concurrency = Config::DEFAULT_CONCURRENCY;
    int max_retries = Config::DEFAULT_MAX_RETRIES;
    int seeder_failure_limit = Config::SEEDER_FAILURE_LIMIT;
};

enum class DownloadStatus {
    Completed,
    Failed,
    IntegrityFault,
    Cancelled
};

const char* to_string(DownloadStatus status);

struct DownloadResult {
    DownloadStatus status = DownloadStatus::Failed;
    ErrorKind error = ErrorKind::None;
    std::string message;
    std::vector<ChunkState> chunks;
    std::vector<uint8_t> data; // assembled file, only when Completed
    std::string path;          // set once the file is committed to storage
};

enum class DownloadEventType {
    ChunkVerified,
    ChunkRetrying,
    ChunkFailed,
    DownloadComplete,
    DownloadFailed
};

struct DownloadEvent {
    DownloadEventType type;
    int chunk_index = -1;
    PeerAddress peer;
    int retries = 0;
    int verified = 0;
    int total = 0;
    std::string message;
};

using DownloadObserver = std::function<void(const DownloadEvent&)>;

// Fetches every chunk of one file from a set of seeders with up to K
// concurrent workers. Failed fetches go back to Pending with the (seeder,
// chunk) pair excluded until all live seeders were tried; a chunk that
// exceeds max_retries fails the whole download.
class DownloadScheduler {
public:
    DownloadScheduler(const FileDescriptor& descriptor, std::vector<PeerAddress> seeders,
                      ChunkSource& source, SchedulerOptions options = SchedulerOptions());

    DownloadScheduler(const DownloadScheduler&) = delete;
    DownloadScheduler& operator=(const DownloadScheduler&) = delete;

    void set_observer(DownloadObserver observer);

    // Blocks until every worker has joined. Call once.
    DownloadResult run();

    // Stops issuing fetches; callable from any thread, including the observer.
    void cancel();

private:
    struct SeederState {
        PeerAddress address;
        uint64_t last_failure = 0; // failure sequence number, 0 = never failed
        int consecutive_network_failures = 0;
        bool dropped = false;
    };

    void download_worker();
    int pick_seeder_locked(ChunkState& chunk);
    bool has_live_seeder_locked() const;
    void fail_download_locked(ErrorKind kind, const std::string& message);
    std::vector<DownloadEvent> handle_fetch_locked(int chunk_index, int seeder_index,
                                                   FetchResult& result, bool verified);
    DownloadEvent make_event(DownloadEventType type, int chunk_index, int seeder_index) const;
    void emit(const std::vector<DownloadEvent>& events);

    const FileDescriptor descriptor;
    ChunkSource& source;
    SchedulerOptions options;
    DownloadObserver observer;

    std::mutex mtx;
    std::condition_variable cv;
    DownloadProgress progress;
    std::vector<SeederState> seeders;
    size_t next_seeder = 0;
    uint64_t failure_seq = 0;
    bool cancelled = false;
    bool failed = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
};
