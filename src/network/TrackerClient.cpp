#include "TrackerClient.hpp"
#include "../core/Errors.hpp"
#include "../tracker/TrackerProtocol.hpp"
#include <sys/socket.h>
#include <cerrno>
#include <iostream>
#include <random>
#include <stdexcept>
#include <thread>

TrackerClient::TrackerClient(const PeerAddress& tracker, std::chrono::milliseconds timeout, int retries)
    : tracker(tracker), timeout(timeout), retries(retries < 1 ? 1 : retries) {
    sock.reset(socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) {
        throw NetworkError("Socket creation failed: " + NetworkUtils::last_error());
    }

    // A connected UDP socket only sees datagrams from the tracker.
    sockaddr_in addr = NetworkUtils::to_sockaddr(tracker);
    if (connect(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw NetworkError("Failed to set tracker address " + tracker.to_string() + ": "
                           + NetworkUtils::last_error());
    }

    // Start ids at a random point so a restarted client never matches a stale answer.
    std::random_device rd;
    next_request_id = (static_cast<uint64_t>(rd()) << 20);
}

PeerRecord TrackerClient::register_peer(const std::string& peer_id, const std::string& username,
                                        const PeerAddress& advertised, const std::vector<FileDescriptor>& files) {
    json request = TrackerProtocol::make_request(TrackerProtocol::OP_REGISTER, 0, peer_id);
    request["host"] = advertised.ip;
    request["port"] = advertised.port;
    request["username"] = username;

    // The first batch registers atomically with the peer; a large library
    // follows in announce batches.
    std::vector<json> batches = file_batches(files, request.dump().size());
    request["files"] = batches.empty() ? json::array() : batches.front();

    json response = send_request(request);
    PeerRecord record = TrackerProtocol::peer_from_json(response.at("result"));
    for (size_t i = 1; i < batches.size(); ++i) {
        json announce = TrackerProtocol::make_request(TrackerProtocol::OP_ANNOUNCE, 0, peer_id);
        announce["files"] = batches[i];
        record.file_count = send_request(announce).at("result").value("file_count", record.file_count);
    }
    return record;
}

void TrackerClient::heartbeat(const std::string& peer_id) {
    send_request(TrackerProtocol::make_request(TrackerProtocol::OP_HEARTBEAT, 0, peer_id));
}

void TrackerClient::announce_file(const std::string& peer_id, const FileDescriptor& descriptor) {
    json request = TrackerProtocol::make_request(TrackerProtocol::OP_ANNOUNCE, 0, peer_id);
    request["digest"] = descriptor.file_id();
    request["name"] = descriptor.name;
    request["size"] = descriptor.length;
    send_request(request);
}

bool TrackerClient::withdraw_file(const std::string& peer_id, const std::string& file_id) {
    json request = TrackerProtocol::make_request(TrackerProtocol::OP_WITHDRAW, 0, peer_id);
    request["digest"] = file_id;
    json response = send_request(request);
    return response.at("result").value("removed", false);
}

std::vector<PeerRecord> TrackerClient::query_peers(const std::string& file_id) {
    json request = TrackerProtocol::make_request(TrackerProtocol::OP_QUERY, 0);
    request["digest"] = file_id;
    return parse_peers(send_request(request).at("result"));
}

bool TrackerClient::deregister(const std::string& peer_id) {
    json response = send_request(TrackerProtocol::make_request(TrackerProtocol::OP_DEREGISTER, 0, peer_id));
    return response.at("result").value("removed", false);
}

void TrackerClient::rename(const std::string& peer_id, const std::string& username) {
    json request = TrackerProtocol::make_request(TrackerProtocol::OP_RENAME, 0, peer_id);
    request["username"] = username;
    send_request(request);
}

bool TrackerClient::ping() {
    try {
        send_request(TrackerProtocol::make_request(TrackerProtocol::OP_PING, 0));
        return true;
    } catch (const NetworkError& e) {
        std::cerr << "Tracker " << tracker.to_string() << " unreachable: " << e.what() << std::endl;
        return false;
    }
}

std::vector<PeerRecord> TrackerClient::list_peers() {
    return parse_peers(send_request(TrackerProtocol::make_request(TrackerProtocol::OP_LIST_PEERS, 0)).at("result"));
}

std::vector<FileListing> TrackerClient::list_files() {
    json result = send_request(TrackerProtocol::make_request(TrackerProtocol::OP_LIST_FILES, 0)).at("result");
    std::vector<FileListing> files;
    if (!result.contains("files") || !result.at("files").is_array()) {
        throw ProtocolError("Tracker response does not contain a file list");
    }
    for (const auto& entry : result.at("files")) {
        files.push_back(TrackerProtocol::listing_from_json(entry));
    }
    if (result.value("truncated", false)) {
        std::cerr << "Tracker truncated the file list to " << files.size() << " entries" << std::endl;
    }
    return files;
}

json TrackerClient::send_request(json request) {
    std::lock_guard<std::mutex> lock(mtx);
    uint64_t request_id = ++next_request_id;
    request["request_id"] = request_id;
    std::string payload = request.dump();
    if (payload.size() > Config::MAX_DATAGRAM_SIZE) {
        throw std::invalid_argument("Tracker request too large for one datagram");
    }

    std::vector<char> buffer(Config::MAX_DATAGRAM_SIZE);
    for (int attempt = 1; attempt <= retries; ++attempt) {
        if (send(sock.get(), payload.data(), payload.size(), 0) < 0) {
            std::cerr << "Failed to send to tracker (attempt " << attempt << "): "
                      << NetworkUtils::last_error() << std::endl;
            continue;
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0 || !NetworkUtils::wait_readable(sock.get(), remaining)) {
                break; // Timed out, resend
            }

            ssize_t n = recv(sock.get(), buffer.data(), buffer.size(), 0);
            if (n < 0) {
                // ICMP port unreachable shows up here as ECONNREFUSED
                if (errno != EINTR) {
                    std::this_thread::sleep_until(deadline);
                    break;
                }
                continue;
            }

            json response;
            try {
                response = TrackerProtocol::parse_response(std::string(buffer.data(), static_cast<size_t>(n)));
            } catch (const ProtocolError& e) {
                std::cerr << "Ignoring malformed tracker datagram: " << e.what() << std::endl;
                continue;
            }
            if (response.at("request_id").get<uint64_t>() != request_id) {
                continue; // Stale answer to an earlier attempt
            }

            TrackerProtocol::raise_for_status(response);
            return response;
        }
    }

    throw NetworkError("Tracker " + tracker.to_string() + " did not respond after "
                       + std::to_string(retries) + " attempt(s)");
}

std::vector<json> TrackerClient::file_batches(const std::vector<FileDescriptor>& files, size_t request_size) {
    std::vector<json> entries;
    for (const auto& descriptor : files) {
        entries.push_back(json{
            {"digest", descriptor.file_id()},
            {"name", descriptor.name},
            {"size", descriptor.length}
        });
    }
    size_t reserved = request_size + Config::DATAGRAM_HEADROOM;
    if (reserved >= Config::MAX_DATAGRAM_SIZE) {
        throw std::invalid_argument("Tracker request too large for one datagram");
    }
    return TrackerProtocol::split_entries(entries, Config::MAX_DATAGRAM_SIZE - reserved);
}

std::vector<PeerRecord> TrackerClient::parse_peers(const json& result) {
    if (!result.contains("peers") || !result.at("peers").is_array()) {
        throw ProtocolError("Tracker response does not contain valid peers");
    }
    if (result.value("truncated", false)) {
        std::cerr << "Tracker truncated the peer list to " << result.at("peers").size() << " entries" << std::endl;
    }
    std::vector<PeerRecord> peers;
    for (const auto& entry : result.at("peers")) {
        peers.push_back(TrackerProtocol::peer_from_json(entry));
    }
    return peers;
}
