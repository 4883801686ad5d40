#include "TrackerProtocol.hpp"
#include "../core/Errors.hpp"
#include "../utils/CryptoUtils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

namespace {

std::string require_string(const json& request, const char* key) {
    if (!request.contains(key) || !request.at(key).is_string()) {
        throw ProtocolError(std::string("Missing or invalid field: ") + key);
    }
    std::string value = request.at(key).get<std::string>();
    if (value.empty()) {
        throw ProtocolError(std::string("Empty field: ") + key);
    }
    return value;
}

std::string optional_string(const json& request, const char* key, const std::string& fallback) {
    if (!request.contains(key)) {
        return fallback;
    }
    if (!request.at(key).is_string()) {
        throw ProtocolError(std::string("Invalid field: ") + key);
    }
    return request.at(key).get<std::string>();
}

uint64_t optional_uint(const json& request, const char* key, uint64_t fallback) {
    if (!request.contains(key)) {
        return fallback;
    }
    if (!request.at(key).is_number_unsigned()) {
        throw ProtocolError(std::string("Invalid field: ") + key);
    }
    return request.at(key).get<uint64_t>();
}

bool is_wildcard_host(const std::string& host) {
    return host.empty() || host == "0.0.0.0";
}

// Validates the whole list before anything touches the registry.
std::vector<FileListing> parse_file_list(const json& list) {
    if (!list.is_array()) {
        throw ProtocolError("Invalid field: files");
    }
    std::vector<FileListing> files;
    for (const auto& entry : list) {
        if (!entry.is_object()) {
            throw ProtocolError("Invalid entry in files");
        }
        FileListing listing;
        listing.file_id = TrackerProtocol::normalize_file_id(require_string(entry, "digest"));
        listing.name = optional_string(entry, "name", "");
        listing.size = optional_uint(entry, "size", 0);
        files.push_back(listing);
    }
    return files;
}

// Keeps as many entries as fit in one datagram; the rest are dropped and
// the result says so.
json fit_entries(const char* key, const std::vector<json>& entries) {
    auto batches = TrackerProtocol::split_entries(entries, Config::MAX_DATAGRAM_SIZE - Config::DATAGRAM_HEADROOM);
    json result{{key, batches.empty() ? json::array() : batches.front()}, {"truncated", batches.size() > 1}};
    if (batches.size() > 1) {
        std::cerr << "Truncated " << key << " list to " << batches.front().size() << " of "
                  << entries.size() << " entries" << std::endl;
    }
    return result;
}

}

std::string TrackerProtocol::handle(PeerRegistry& registry, const std::string& datagram,
                                    const std::string& source_ip) {
    uint64_t request_id = 0;
    json response;
    try {
        json request = json::parse(datagram);
        if (!request.is_object()) {
            throw ProtocolError("Request is not a JSON object");
        }
        request_id = optional_uint(request, "request_id", 0);
        response = dispatch(registry, request, source_ip);
        response["request_id"] = request_id;
    } catch (const RegistryError& e) {
        response = make_response(request_id, e.status(), e.what());
    } catch (const ProtocolError& e) {
        response = make_response(request_id, STATUS_PROTOCOL_ERROR, e.what());
    } catch (const json::exception& e) {
        response = make_response(request_id, STATUS_PROTOCOL_ERROR, std::string("Malformed request: ") + e.what());
    } catch (const std::invalid_argument& e) {
        response = make_response(request_id, STATUS_PROTOCOL_ERROR, e.what());
    } catch (const std::exception& e) {
        std::cerr << "Error handling tracker request: " << e.what() << std::endl;
        response = make_response(request_id, STATUS_PROTOCOL_ERROR, std::string("Request failed: ") + e.what());
    }

    std::string payload = response.dump();
    if (payload.size() > Config::MAX_DATAGRAM_SIZE) {
        payload = make_response(request_id, STATUS_PROTOCOL_ERROR,
                                "Response of " + std::to_string(payload.size())
                                    + " bytes exceeds the datagram limit").dump();
    }
    return payload;
}

json TrackerProtocol::dispatch(PeerRegistry& registry, const json& request, const std::string& source_ip) {
    std::string op = require_string(request, "op");

    if (op == OP_PING) {
        return make_response(0, STATUS_OK, "PONG");
    }

    if (op == OP_LIST_PEERS) {
        std::vector<json> peers;
        for (const auto& record : registry.list_peers()) {
            peers.push_back(peer_to_json(record));
        }
        return make_response(0, STATUS_OK, "", fit_entries("peers", peers));
    }

    if (op == OP_LIST_FILES) {
        std::vector<json> files;
        for (const auto& listing : registry.list_files()) {
            files.push_back(listing_to_json(listing));
        }
        return make_response(0, STATUS_OK, "", fit_entries("files", files));
    }

    if (op == OP_QUERY) {
        std::string file_id = normalize_file_id(require_string(request, "digest"));
        std::vector<json> peers;
        for (const auto& record : registry.query_peers(file_id)) {
            peers.push_back(peer_to_json(record));
        }
        return make_response(0, STATUS_OK, "", fit_entries("peers", peers));
    }

    // Everything below acts on behalf of one peer.
    std::string peer_id = require_string(request, "peer_id");

    if (op == OP_REGISTER) {
        std::string host = optional_string(request, "host", "");
        if (is_wildcard_host(host)) {
            host = source_ip;
        }
        uint64_t port = optional_uint(request, "port", 0);
        if (port == 0 || port > 65535) {
            throw ProtocolError("Missing or invalid field: port");
        }
        std::string username = optional_string(request, "username", "unknown");

        std::vector<FileListing> files;
        if (request.contains("files")) {
            files = parse_file_list(request.at("files"));
        }

        PeerRecord record = registry.register_peer(peer_id, PeerAddress(host, static_cast<uint16_t>(port)),
                                                   username, files);
        std::cout << "Peer registered: " << peer_id << " (" << username << ") at "
                  << record.address.to_string() << " with " << files.size() << " file(s)" << std::endl;
        return make_response(0, STATUS_OK, "Peer registered", peer_to_json(record));
    }

    if (op == OP_HEARTBEAT) {
        registry.heartbeat(peer_id);
        return make_response(0, STATUS_OK, "");
    }

    if (op == OP_ANNOUNCE) {
        std::vector<FileListing> files;
        if (request.contains("files")) {
            files = parse_file_list(request.at("files"));
        } else {
            FileListing listing;
            listing.file_id = normalize_file_id(require_string(request, "digest"));
            listing.name = optional_string(request, "name", "");
            listing.size = optional_uint(request, "size", 0);
            files.push_back(listing);
        }
        size_t held = registry.announce_files(peer_id, files);
        return make_response(0, STATUS_OK, "", json{{"file_count", held}});
    }

    if (op == OP_WITHDRAW) {
        std::string file_id = normalize_file_id(require_string(request, "digest"));
        bool removed = registry.withdraw_file(peer_id, file_id);
        return make_response(0, STATUS_OK, "", json{{"removed", removed}});
    }

    if (op == OP_DEREGISTER) {
        bool removed = registry.deregister(peer_id);
        if (removed) {
            std::cout << "Peer disconnected: " << peer_id << std::endl;
        }
        return make_response(0, STATUS_OK, "", json{{"removed", removed}});
    }

    if (op == OP_RENAME) {
        registry.rename(peer_id, require_string(request, "username"));
        return make_response(0, STATUS_OK, "");
    }

    throw ProtocolError("Unknown operation: " + op);
}

json TrackerProtocol::make_request(const std::string& op, uint64_t request_id, const std::string& peer_id) {
    json request{{"op", op}, {"request_id", request_id}};
    if (!peer_id.empty()) {
        request["peer_id"] = peer_id;
    }
    return request;
}

json TrackerProtocol::parse_response(const std::string& datagram) {
    json response;
    try {
        response = json::parse(datagram);
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("Malformed tracker response: ") + e.what());
    }
    if (!response.is_object() || !response.contains("status") || !response.at("status").is_string()
        || !response.contains("request_id") || !response.at("request_id").is_number_unsigned()) {
        throw ProtocolError("Malformed tracker response: missing status or request_id");
    }
    if (!response.contains("result") || !response.at("result").is_object()) {
        response["result"] = json::object();
    }
    return response;
}

void TrackerProtocol::raise_for_status(const json& response) {
    std::string status = response.at("status").get<std::string>();
    std::string message = response.value("message", std::string());
    if (status == STATUS_OK) {
        return;
    }
    if (status == "UnknownPeerError") {
        throw UnknownPeerError(message);
    }
    if (status == "DuplicateAddressConflict") {
        throw DuplicateAddressConflict(message);
    }
    if (status == "PeerLimitReached") {
        throw PeerLimitReached(message);
    }
    throw ProtocolError("Tracker rejected request (" + status + "): " + message);
}

json TrackerProtocol::peer_to_json(const PeerRecord& record) {
    auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - record.last_heartbeat);
    return json{
        {"peer_id", record.peer_id},
        {"username", record.username},
        {"host", record.address.ip},
        {"port", record.address.port},
        {"last_seen_ms", std::max<int64_t>(0, age.count())},
        {"file_count", record.files.size()}
    };
}

PeerRecord TrackerProtocol::peer_from_json(const json& j) {
    PeerRecord record;
    try {
        record.peer_id = j.at("peer_id").get<std::string>();
        record.username = j.value("username", std::string());
        record.address = PeerAddress(j.at("host").get<std::string>(), j.at("port").get<uint16_t>());
        auto age = std::chrono::milliseconds(j.value("last_seen_ms", int64_t(0)));
        record.last_heartbeat = std::chrono::steady_clock::now() - age;
        record.file_count = j.value("file_count", size_t(0));
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("Malformed peer entry: ") + e.what());
    }
    return record;
}

json TrackerProtocol::listing_to_json(const FileListing& listing) {
    return json{
        {"digest", listing.file_id},
        {"name", listing.name},
        {"size", listing.size},
        {"seeders", listing.seeders}
    };
}

FileListing TrackerProtocol::listing_from_json(const json& j) {
    FileListing listing;
    try {
        listing.file_id = j.at("digest").get<std::string>();
        listing.name = j.value("name", std::string());
        listing.size = j.value("size", uint64_t(0));
        listing.seeders = j.value("seeders", size_t(0));
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("Malformed file entry: ") + e.what());
    }
    return listing;
}

std::vector<json> TrackerProtocol::split_entries(const std::vector<json>& entries, size_t budget) {
    std::vector<json> batches;
    json batch = json::array();
    size_t used = 0;
    for (const auto& entry : entries) {
        size_t size = entry.dump().size() + 1;
        if (!batch.empty() && used + size > budget) {
            batches.push_back(std::move(batch));
            batch = json::array();
            used = 0;
        }
        batch.push_back(entry);
        used += size;
    }
    if (!batch.empty()) {
        batches.push_back(std::move(batch));
    }
    return batches;
}

std::string TrackerProtocol::normalize_file_id(const std::string& file_id) {
    std::string lowered = file_id;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!CryptoUtils::is_hex_digest(lowered)) {
        throw ProtocolError("Invalid file digest: " + file_id);
    }
    return lowered;
}

json TrackerProtocol::make_response(uint64_t request_id, const std::string& status, const std::string& message,
                                    const json& result) {
    return json{
        {"request_id", request_id},
        {"status", status},
        {"message", message},
        {"result", result}
    };
}
