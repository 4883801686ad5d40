#pragma once
#include "PeerRegistry.hpp"
#include "../core/PeerRecord.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

using json = nlohmann::json;

// JSON datagrams exchanged with the tracker.
//   request:  {"op", "request_id", "peer_id", ...operation fields}
//   response: {"request_id", "status", "message", "result"}
class TrackerProtocol {
public:
    static constexpr const char* OP_REGISTER = "register";
    static constexpr const char* OP_HEARTBEAT = "heartbeat";
    static constexpr const char* OP_ANNOUNCE = "announce";
    static constexpr const char* OP_WITHDRAW = "withdraw";
    static constexpr const char* OP_QUERY = "query";
    static constexpr const char* OP_DEREGISTER = "deregister";
    static constexpr const char* OP_PING = "ping";
    static constexpr const char* OP_LIST_PEERS = "list_peers";
    static constexpr const char* OP_LIST_FILES = "list_files";
    static constexpr const char* OP_RENAME = "rename";

    static constexpr const char* STATUS_OK = "OK";
    static constexpr const char* STATUS_PROTOCOL_ERROR = "ProtocolError";

    // Server side. Never throws: malformed input becomes a ProtocolError response.
    static std::string handle(PeerRegistry& registry, const std::string& datagram, const std::string& source_ip);

    // Client side.
    static json make_request(const std::string& op, uint64_t request_id, const std::string& peer_id = "");
    // Throws ProtocolError if the datagram is not a well-formed response.
    static json parse_response(const std::string& datagram);
    // Raises the typed exception matching a non-OK status.
    static void raise_for_status(const json& response);

    static json peer_to_json(const PeerRecord& record);
    static PeerRecord peer_from_json(const json& j);
    static json listing_to_json(const FileListing& listing);
    static FileListing listing_from_json(const json& j);

    // Groups entries into JSON arrays whose serialised size stays within
    // `budget`. An entry larger than the budget gets a batch of its own.
    static std::vector<json> split_entries(const std::vector<json>& entries, size_t budget);

    // Lowercases and checks a hex file id. Throws ProtocolError.
    static std::string normalize_file_id(const std::string& file_id);

private:
    static json dispatch(PeerRegistry& registry, const json& request, const std::string& source_ip);
    static json make_response(uint64_t request_id, const std::string& status, const std::string& message,
                              const json& result = json::object());
};
