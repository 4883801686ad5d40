#include "CommandHandler.hpp"
#include "../core/ChunkCodec.hpp"
#include "../core/Errors.hpp"
#include "../core/SwarmPeer.hpp"
#include "../network/TrackerClient.hpp"
#include "../tracker/PeerRegistry.hpp"
#include "../tracker/TrackerServer.hpp"
#include "../utils/CryptoUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {

std::string flag_value(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + args[i]);
    }
    return args[++i];
}

unsigned long parse_number(const std::string& flag, const std::string& value,
                           unsigned long max = std::numeric_limits<unsigned long>::max()) {
    // stoul would accept a sign or leading blanks.
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value);
    }
    size_t used = 0;
    unsigned long number = 0;
    try {
        number = std::stoul(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value);
    }
    if (used != value.size()) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value);
    }
    if (number > max) {
        throw std::invalid_argument("Value for " + flag + " out of range: " + value);
    }
    return number;
}

uint16_t parse_port(const std::string& flag, const std::string& value) {
    return static_cast<uint16_t>(parse_number(flag, value, std::numeric_limits<uint16_t>::max()));
}

void print_peers(const std::vector<PeerRecord>& peers) {
    if (peers.empty()) {
        std::cout << "No active peers." << std::endl;
        return;
    }
    for (const auto& peer : peers) {
        std::cout << peer.peer_id << "  " << std::left << std::setw(16) << peer.username
                  << std::right << "  " << peer.address.to_string() << "  files: " << peer.file_count << std::endl;
    }
}

void print_files(const std::vector<FileListing>& files) {
    if (files.empty()) {
        std::cout << "No files available." << std::endl;
        return;
    }
    for (const auto& file : files) {
        std::cout << file.file_id << "  " << file.name << "  " << file.size << " bytes  seeders: "
                  << file.seeders << std::endl;
    }
}

void print_local_files(const std::vector<FileDescriptor>& files) {
    if (files.empty()) {
        std::cout << "No shared files." << std::endl;
        return;
    }
    for (const auto& file : files) {
        std::cout << file.file_id() << "  " << file.name << "  " << file.length << " bytes" << std::endl;
    }
}

int report(const DownloadResult& result, std::chrono::steady_clock::duration elapsed) {
    if (result.status != DownloadStatus::Completed) {
        std::cerr << "Download " << to_string(result.status) << " (" << to_string(result.error) << "): "
                  << result.message << std::endl;
        return 1;
    }
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    double seconds = std::max<double>(millis, 1) / 1000.0;
    double speed_mbps = (result.data.size() / (1024.0 * 1024.0)) / seconds;
    std::cout << "Download completed in " << std::fixed << std::setprecision(2) << seconds << " seconds ("
              << speed_mbps << " MB/s)" << std::endl;
    std::cout << "Saved to " << result.path << std::endl;
    return 0;
}

}

// ============================================================================
// COMMAND EXECUTOR
// ============================================================================

int CommandHandler::execute(const std::string& command, const std::vector<std::string>& args) {
    try {
        if (command == "tracker") {
            return handle_tracker(args);
        } else if (command == "describe") {
            return handle_describe(args);
        } else if (command == "ping") {
            return handle_ping(args);
        } else if (command == "peers") {
            return handle_peers(args);
        } else if (command == "files") {
            return handle_files(args);
        } else if (command == "seed") {
            return handle_seed(args);
        } else if (command == "download") {
            return handle_download(args);
        }
        std::cerr << "Unknown command: " << command << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}

std::vector<std::string> CommandHandler::parse_settings(const std::vector<std::string>& args, Settings& settings,
                                                        bool tracker_mode) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            settings.load_file(flag_value(args, i));
        }
    }

    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (flag == "--config") {
            ++i;
        } else if (flag == "--tracker") {
            PeerAddress tracker = PeerAddress::parse(flag_value(args, i));
            settings.tracker_host = tracker.ip;
            settings.tracker_port = tracker.port;
        } else if (flag == "--port") {
            uint16_t port = parse_port(flag, flag_value(args, i));
            if (tracker_mode) {
                settings.tracker_port = port;
            } else {
                settings.transfer_port = port;
            }
        } else if (flag == "--advertise") {
            settings.advertise_host = flag_value(args, i);
        } else if (flag == "--shared-dir") {
            settings.shared_dir = flag_value(args, i);
        } else if (flag == "--download-dir") {
            settings.download_dir = flag_value(args, i);
        } else if (flag == "--username") {
            settings.username = flag_value(args, i);
        } else if (flag == "--chunk-size") {
            settings.chunk_size = static_cast<uint32_t>(
                parse_number(flag, flag_value(args, i), std::numeric_limits<uint32_t>::max()));
        } else if (flag == "--concurrency") {
            settings.concurrency = static_cast<int>(
                parse_number(flag, flag_value(args, i), std::numeric_limits<int>::max()));
        } else if (flag == "--retries") {
            settings.max_retries = static_cast<int>(
                parse_number(flag, flag_value(args, i), std::numeric_limits<int>::max()));
        } else if (flag == "--liveness-ms") {
            settings.liveness_window = std::chrono::milliseconds(
                parse_number(flag, flag_value(args, i), std::numeric_limits<int32_t>::max()));
        } else if (flag == "--peer-limit") {
            settings.peer_limit = parse_number(flag, flag_value(args, i));
        } else if (flag.rfind("--", 0) == 0) {
            throw std::invalid_argument("Unknown option: " + flag);
        } else {
            positional.push_back(flag);
        }
    }

    if (tracker_mode && settings.heartbeat_interval >= settings.liveness_window) {
        // Only the liveness window matters to a tracker.
        settings.heartbeat_interval = settings.liveness_window / 3;
    }
    settings.validate();
    return positional;
}

// ============================================================================
// TRACKER COMMANDS
// ============================================================================

int CommandHandler::handle_tracker(const std::vector<std::string>& args) {
    Settings settings;
    parse_settings(args, settings, true);

    PeerRegistry registry(settings.liveness_window, settings.peer_limit);
    TrackerServer server(registry);
    server.start(settings.tracker_port);
    std::cout << "Liveness window " << settings.liveness_window.count() << " ms, peer limit "
              << settings.peer_limit << std::endl;
    server.wait();
    return 0;
}

int CommandHandler::handle_ping(const std::vector<std::string>& args) {
    Settings settings;
    parse_settings(args, settings);

    TrackerClient client(PeerAddress(settings.tracker_host, settings.tracker_port),
                         settings.request_timeout, settings.tracker_retries);
    if (!client.ping()) {
        std::cerr << "Tracker at " << client.tracker_address().to_string() << " is not responding" << std::endl;
        return 1;
    }
    std::cout << "Tracker at " << client.tracker_address().to_string() << " is alive" << std::endl;
    return 0;
}

int CommandHandler::handle_peers(const std::vector<std::string>& args) {
    Settings settings;
    parse_settings(args, settings);

    TrackerClient client(PeerAddress(settings.tracker_host, settings.tracker_port),
                         settings.request_timeout, settings.tracker_retries);
    print_peers(client.list_peers());
    return 0;
}

int CommandHandler::handle_files(const std::vector<std::string>& args) {
    Settings settings;
    parse_settings(args, settings);

    TrackerClient client(PeerAddress(settings.tracker_host, settings.tracker_port),
                         settings.request_timeout, settings.tracker_retries);
    print_files(client.list_files());
    return 0;
}

// ============================================================================
// FILE COMMANDS
// ============================================================================

int CommandHandler::handle_describe(const std::vector<std::string>& args) {
    Settings settings;
    std::vector<std::string> positional = parse_settings(args, settings);
    if (positional.empty()) {
        std::cerr << "Usage: describe <file> [--chunk-size <bytes>]" << std::endl;
        return 1;
    }

    FileDescriptor descriptor = ChunkCodec::describe_file(positional[0], settings.chunk_size);
    descriptor.print_info();
    return 0;
}

// ============================================================================
// PEER COMMANDS
// ============================================================================

void CommandHandler::print_event(const DownloadEvent& event) {
    switch (event.type) {
        case DownloadEventType::ChunkVerified:
            std::cout << "Chunk " << event.chunk_index << " verified from " << event.peer.to_string()
                      << " (" << event.verified << "/" << event.total << ")" << std::endl;
            break;
        case DownloadEventType::ChunkRetrying:
            std::cerr << "Chunk " << event.chunk_index << " failed from " << event.peer.to_string() << ": "
                      << event.message << " (retry " << event.retries << ")" << std::endl;
            break;
        case DownloadEventType::ChunkFailed:
            std::cerr << "Chunk " << event.chunk_index << " failed after " << event.retries
                      << " attempts: " << event.message << std::endl;
            break;
        case DownloadEventType::DownloadComplete:
            std::cout << "All " << event.total << " chunks verified" << std::endl;
            break;
        case DownloadEventType::DownloadFailed:
            std::cerr << "Download failed: " << event.message << std::endl;
            break;
    }
}

int CommandHandler::handle_download(const std::vector<std::string>& args) {
    Settings settings;
    std::vector<std::string> positional = parse_settings(args, settings);
    if (positional.empty()) {
        std::cerr << "Usage: download <file_id> [flags]" << std::endl;
        return 1;
    }

    SwarmPeer peer(settings);
    peer.leecher().set_observer(print_event);
    peer.start();

    auto start_time = std::chrono::steady_clock::now();
    DownloadResult result = peer.download(positional[0]);
    int status = report(result, std::chrono::steady_clock::now() - start_time);

    peer.stop();
    return status;
}

int CommandHandler::handle_seed(const std::vector<std::string>& args) {
    Settings settings;
    parse_settings(args, settings);

    SwarmPeer peer(settings);
    peer.leecher().set_observer(print_event);
    peer.start();
    std::cout << "Peer " << peer.peer_id() << " seeding on port " << peer.transfer_port() << std::endl;
    std::cout << "Commands: files, peers, shared, download <id>, share <path>, rename <name>, refresh, quit"
              << std::endl;

    std::vector<std::thread> downloads;
    std::string line;
    while (std::getline(std::cin, line)) {
        std::istringstream iss(line);
        std::string command;
        std::string argument;
        iss >> command;
        std::getline(iss >> std::ws, argument);

        if (command.empty()) {
            continue;
        }
        if (command == "quit" || command == "exit") {
            break;
        }

        try {
            if (command == "files") {
                print_files(peer.list_files());
            } else if (command == "peers") {
                print_peers(peer.list_peers());
            } else if (command == "shared") {
                print_local_files(peer.seeder().shared_files());
            } else if (command == "download" && !argument.empty()) {
                downloads.emplace_back([&peer, argument] {
                    try {
                        auto start_time = std::chrono::steady_clock::now();
                        DownloadResult result = peer.download(argument);
                        report(result, std::chrono::steady_clock::now() - start_time);
                    } catch (const std::exception& e) {
                        std::cerr << "Error: " << e.what() << std::endl;
                    }
                });
            } else if (command == "share" && !argument.empty()) {
                peer.share(argument);
            } else if (command == "rename" && !argument.empty()) {
                peer.rename(argument);
                std::cout << "Username changed to " << argument << std::endl;
            } else if (command == "refresh") {
                std::vector<std::string> removed = peer.refresh();
                std::cout << "Refreshed shared files, " << removed.size() << " removed" << std::endl;
            } else {
                std::cerr << "Unknown command: " << line << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
        }
    }

    peer.leecher().cancel_all();
    for (auto& t : downloads) {
        t.join();
    }
    peer.stop();
    return 0;
}
