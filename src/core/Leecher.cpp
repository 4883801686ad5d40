#include "Leecher.hpp"
#include "Errors.hpp"
#include "../utils/CryptoUtils.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

Leecher::Leecher(TrackerClient& tracker, FileStorage& storage, ReseedPromoter& promoter, ChunkSource& source,
                 std::string peer_id, SchedulerOptions options)
    : tracker(tracker), storage(storage), promoter(promoter), source(source),
      peer_id(std::move(peer_id)), options(options) {}

void Leecher::set_observer(DownloadObserver callback) {
    observer = std::move(callback);
}

bool Leecher::is_downloading(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mtx);
    return active.count(file_id) > 0;
}

void Leecher::cancel_all() {
    std::lock_guard<std::mutex> lock(mtx);
    for (auto& entry : active) {
        entry.second.cancelled = true;
        if (entry.second.scheduler) {
            entry.second.scheduler->cancel();
        }
    }
}

bool Leecher::cancel_requested(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = active.find(file_id);
    return it != active.end() && it->second.cancelled;
}

DownloadResult Leecher::cancelled_result(const std::string& file_id) {
    DownloadResult result;
    result.status = DownloadStatus::Cancelled;
    result.error = ErrorKind::Cancelled;
    result.message = "download cancelled";
    std::cerr << "Download of " << file_id << " cancelled before it started" << std::endl;
    if (observer) {
        DownloadEvent event;
        event.type = DownloadEventType::DownloadFailed;
        event.message = result.message;
        observer(event);
    }
    return result;
}

FileDescriptor Leecher::fetch_descriptor(const std::string& file_id, const std::vector<PeerAddress>& seeders) {
    for (const auto& seeder : seeders) {
        std::optional<FileDescriptor> descriptor = source.fetch_metadata(seeder, file_id);
        if (!descriptor) {
            continue;
        }
        if (descriptor->file_id() != file_id) {
            std::cerr << "Seeder " << seeder.to_string() << " described a different file, ignoring" << std::endl;
            continue;
        }
        return *descriptor;
    }
    throw ResourceExhaustedError("No seeder could describe file " + file_id);
}

void Leecher::commit(const FileDescriptor& descriptor, DownloadResult& result) {
    try {
        for (int i = 0; i < descriptor.get_chunk_count(); ++i) {
            auto begin = result.data.begin() + static_cast<std::ptrdiff_t>(descriptor.get_chunk_offset(i));
            ChunkBytes chunk(begin, begin + descriptor.get_chunk_size(i));
            storage.write_chunk(descriptor, i, chunk);
        }
        result.path = storage.commit(descriptor);
    } catch (const std::exception&) {
        storage.discard(descriptor);
        throw;
    }
}

DownloadResult Leecher::download(const std::string& requested_id) {
    std::string file_id = requested_id;
    std::transform(file_id.begin(), file_id.end(), file_id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!CryptoUtils::is_hex_digest(file_id)) {
        throw std::invalid_argument("Invalid file id: " + requested_id);
    }
    if (storage.find_file(file_id)) {
        throw std::runtime_error("File " + file_id + " is already shared locally");
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!active.emplace(file_id, ActiveDownload()).second) {
            throw std::runtime_error("File " + file_id + " is already being downloaded");
        }
    }
    struct ActiveGuard {
        Leecher& leecher;
        std::string id;
        ~ActiveGuard() {
            std::lock_guard<std::mutex> lock(leecher.mtx);
            leecher.active.erase(id);
        }
    } guard{*this, file_id};

    std::vector<PeerAddress> seeders;
    std::vector<PeerRecord> holders = tracker.query_peers(file_id);
    if (cancel_requested(file_id)) {
        return cancelled_result(file_id);
    }
    for (const auto& record : holders) {
        if (record.peer_id != peer_id) {
            seeders.push_back(record.address);
        }
    }
    if (seeders.empty()) {
        throw ResourceExhaustedError("No seeders available for " + file_id);
    }
    std::cout << "Found " << seeders.size() << " seeder(s) for " << file_id << std::endl;

    FileDescriptor descriptor = fetch_descriptor(file_id, seeders);
    if (cancel_requested(file_id)) {
        return cancelled_result(file_id);
    }
    std::cout << "Downloading " << descriptor.name << " (" << descriptor.length << " bytes, "
              << descriptor.get_chunk_count() << " chunks)" << std::endl;

    DownloadScheduler scheduler(descriptor, seeders, source, options);
    scheduler.set_observer(observer);
    {
        // A cancel that lands between the checks above and here is seen now.
        std::lock_guard<std::mutex> lock(mtx);
        ActiveDownload& entry = active[file_id];
        if (entry.cancelled) {
            scheduler.cancel();
        }
        entry.scheduler = &scheduler;
    }
    DownloadResult result = scheduler.run();
    {
        std::lock_guard<std::mutex> lock(mtx);
        active[file_id].scheduler = nullptr;
    }

    if (result.status != DownloadStatus::Completed) {
        std::cerr << "Download of " << descriptor.name << " " << to_string(result.status)
                  << ": " << result.message << std::endl;
        return result;
    }

    commit(descriptor, result);
    try {
        promoter.promote(descriptor, result.path);
    } catch (const std::exception& e) {
        std::cerr << "Downloaded " << descriptor.name << " but could not seed it: " << e.what() << std::endl;
    }
    return result;
}
