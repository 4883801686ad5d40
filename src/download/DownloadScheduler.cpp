#include "DownloadScheduler.hpp"
#include <algorithm>
#include <stdexcept>
#include <iostream>
#include <thread>

const char* to_string(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Completed: return "Completed";
        case DownloadStatus::Failed: return "Failed";
        case DownloadStatus::IntegrityFault: return "IntegrityFault";
        case DownloadStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

namespace {

const char* describe(FetchStatus status) {
    switch (status) {
        case FetchStatus::Ok: return "digest mismatch";
        case FetchStatus::NotAvailable: return "chunk not available";
        case FetchStatus::NetworkFailure: return "network failure";
        case FetchStatus::ProtocolFailure: return "protocol failure";
    }
    return "unknown failure";
}

}

DownloadScheduler::DownloadScheduler(const FileDescriptor& descriptor, std::vector<PeerAddress> seeder_addresses,
                                     ChunkSource& source, SchedulerOptions options)
    : descriptor(descriptor), source(source), options(options), progress(descriptor) {

    if (options.concurrency < 1) {
        throw std::invalid_argument("Concurrency must be at least 1");
    }
    if (options.max_retries < 0) {
        throw std::invalid_argument("Retry maximum must not be negative");
    }
    for (auto& address : seeder_addresses) {
        SeederState state;
        state.address = std::move(address);
        seeders.push_back(std::move(state));
    }
}

void DownloadScheduler::set_observer(DownloadObserver callback) {
    observer = std::move(callback);
}

void DownloadScheduler::cancel() {
    std::lock_guard<std::mutex> lock(mtx);
    cancelled = true;
    cv.notify_all();
}

bool DownloadScheduler::has_live_seeder_locked() const {
    return std::any_of(seeders.begin(), seeders.end(),
                       [](const SeederState& s) { return !s.dropped; });
}

int DownloadScheduler::pick_seeder_locked(ChunkState& chunk) {
    auto candidate = [&](size_t i) {
        return !seeders[i].dropped && chunk.excluded.count(static_cast<int>(i)) == 0;
    };

    bool any = false;
    for (size_t i = 0; i < seeders.size() && !any; ++i) {
        any = candidate(i);
    }
    if (!any) {
        if (!has_live_seeder_locked()) {
            return -1;
        }
        // Every live seeder failed this chunk once; start a new round.
        chunk.excluded.clear();
    }

    // Least recently failed first, round-robin among equals.
    int best = -1;
    for (size_t step = 0; step < seeders.size(); ++step) {
        size_t i = (next_seeder + step) % seeders.size();
        if (!candidate(i)) {
            continue;
        }
        if (best < 0 || seeders[i].last_failure < seeders[best].last_failure) {
            best = static_cast<int>(i);
        }
    }
    if (best >= 0) {
        next_seeder = (best + 1) % seeders.size();
    }
    return best;
}

void DownloadScheduler::fail_download_locked(ErrorKind kind, const std::string& message) {
    if (failed) {
        return;
    }
    failed = true;
    error = kind;
    error_message = message;
    progress.fail_pending();
    cv.notify_all();
}

DownloadEvent DownloadScheduler::make_event(DownloadEventType type, int chunk_index, int seeder_index) const {
    DownloadEvent event;
    event.type = type;
    event.chunk_index = chunk_index;
    if (seeder_index >= 0) {
        event.peer = seeders[seeder_index].address;
    }
    if (chunk_index >= 0) {
        event.retries = progress.state(chunk_index).retries;
    }
    event.verified = progress.get_completed_count();
    event.total = progress.get_total_count();
    return event;
}

void DownloadScheduler::emit(const std::vector<DownloadEvent>& events) {
    if (!observer) {
        return;
    }
    for (const auto& event : events) {
        observer(event);
    }
}

std::vector<DownloadEvent> DownloadScheduler::handle_fetch_locked(int chunk_index, int seeder_index,
                                                                  FetchResult& result, bool verified) {
    std::vector<DownloadEvent> events;
    SeederState& seeder = seeders[seeder_index];

    if (verified) {
        seeder.consecutive_network_failures = 0;
        progress.mark_verified(chunk_index, std::move(result.data));
        events.push_back(make_event(DownloadEventType::ChunkVerified, chunk_index, seeder_index));
        return events;
    }

    std::string reason = result.error.empty() ? describe(result.status) : result.error;
    seeder.last_failure = ++failure_seq;
    if (result.status == FetchStatus::NetworkFailure) {
        if (++seeder.consecutive_network_failures >= options.seeder_failure_limit && !seeder.dropped) {
            seeder.dropped = true;
            std::cerr << "Dropping seeder " << seeder.address.to_string() << " after "
                      << seeder.consecutive_network_failures << " network failures" << std::endl;
        }
    } else {
        seeder.consecutive_network_failures = 0;
    }

    int retries = progress.mark_attempt_failed(chunk_index);
    if (failed || cancelled) {
        // Late result of an abandoned download: record it, issue nothing.
        progress.mark_failed(chunk_index);
        return events;
    }

    if (retries > options.max_retries) {
        progress.mark_failed(chunk_index);
        DownloadEvent event = make_event(DownloadEventType::ChunkFailed, chunk_index, seeder_index);
        event.message = reason;
        events.push_back(event);
        fail_download_locked(ErrorKind::ResourceExhausted,
                             "chunk " + std::to_string(chunk_index) + " failed after " +
                             std::to_string(retries) + " attempts: " + reason);
        return events;
    }

    DownloadEvent event = make_event(DownloadEventType::ChunkRetrying, chunk_index, seeder_index);
    event.message = reason;
    events.push_back(event);

    if (!has_live_seeder_locked()) {
        progress.mark_failed(chunk_index);
        fail_download_locked(ErrorKind::ResourceExhausted, "no seeders left for " + descriptor.name);
    }
    return events;
}

void DownloadScheduler::download_worker() {
    while (true) {
        int chunk_index = -1;
        int seeder_index = -1;
        {
            std::unique_lock<std::mutex> lock(mtx);
            while (true) {
                if (cancelled || failed || progress.is_download_complete()) {
                    return;
                }
                chunk_index = progress.next_pending();
                if (chunk_index >= 0) {
                    seeder_index = pick_seeder_locked(progress.state(chunk_index));
                    if (seeder_index < 0) {
                        fail_download_locked(ErrorKind::ResourceExhausted,
                                             "no seeders left for " + descriptor.name);
                        return;
                    }
                    break;
                }
                // Everything left is in flight elsewhere.
                cv.wait(lock);
            }
            progress.mark_in_flight(chunk_index, seeder_index);
        }

        FetchResult result = source.fetch_chunk(seeders[seeder_index].address, descriptor, chunk_index);
        bool verified = result.status == FetchStatus::Ok &&
                        ChunkCodec::verify_chunk(result.data, descriptor.chunk_digests[chunk_index]);
        if (result.status == FetchStatus::Ok && !verified) {
            result.data.clear();
            result.error = "digest mismatch from " + seeders[seeder_index].address.to_string();
        }

        std::vector<DownloadEvent> events;
        {
            std::lock_guard<std::mutex> lock(mtx);
            events = handle_fetch_locked(chunk_index, seeder_index, result, verified);
            cv.notify_all();
        }
        emit(events);
    }
}

DownloadResult DownloadScheduler::run() {
    int chunk_count = descriptor.get_chunk_count();

    if (chunk_count > 0 && seeders.empty()) {
        std::lock_guard<std::mutex> lock(mtx);
        fail_download_locked(ErrorKind::ResourceExhausted, "no seeders for " + descriptor.name);
    }

    std::vector<std::thread> workers;
    int num_workers = std::min(options.concurrency, chunk_count);
    for (int i = 0; i < num_workers; ++i) {
        workers.emplace_back(&DownloadScheduler::download_worker, this);
    }
    for (auto& t : workers) {
        t.join();
    }

    DownloadResult result;
    std::vector<DownloadEvent> events;
    {
        std::lock_guard<std::mutex> lock(mtx);
        result.chunks = progress.states();

        if (failed) {
            result.status = DownloadStatus::Failed;
            result.error = error;
            result.message = error_message;
        } else if (cancelled && !progress.is_download_complete()) {
            result.status = DownloadStatus::Cancelled;
            result.error = ErrorKind::Cancelled;
            result.message = "download cancelled";
        } else {
            std::vector<uint8_t> assembled = progress.assemble();
            if (ChunkCodec::verify_whole(assembled, descriptor.file_digest)) {
                result.status = DownloadStatus::Completed;
                result.data = std::move(assembled);
            } else {
                result.status = DownloadStatus::IntegrityFault;
                result.error = ErrorKind::Integrity;
                result.message = "whole-file digest mismatch for " + descriptor.name;
            }
        }
        progress.clear_data();

        DownloadEvent event = make_event(result.status == DownloadStatus::Completed
                                             ? DownloadEventType::DownloadComplete
                                             : DownloadEventType::DownloadFailed,
                                         -1, -1);
        event.message = result.message;
        events.push_back(event);
    }
    emit(events);
    return result;
}
