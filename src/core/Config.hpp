#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace Config {
    // Network defaults
    constexpr uint16_t DEFAULT_TRACKER_PORT = 55555;
    constexpr uint16_t DEFAULT_TRANSFER_PORT = 12000;
    constexpr const char* DEFAULT_TRACKER_HOST = "127.0.0.1";

    // Chunking
    constexpr uint32_t DEFAULT_CHUNK_SIZE = 1024 * 1024;
    constexpr size_t DIGEST_SIZE = 32; // SHA-256

    // Download scheduling
    constexpr int DEFAULT_CONCURRENCY = 4;
    constexpr int DEFAULT_MAX_RETRIES = 5;
    constexpr int SEEDER_FAILURE_LIMIT = 3; // consecutive network failures before a seeder is dropped

    // Tracker liveness. A peer not heard from within this window is gone,
    // whether or not it disconnected. Heartbeats must be well inside it.
    constexpr std::chrono::milliseconds DEFAULT_LIVENESS_WINDOW{30000};
    constexpr std::chrono::milliseconds DEFAULT_HEARTBEAT_INTERVAL{10000};
    constexpr std::chrono::milliseconds SWEEP_INTERVAL{5000};
    constexpr size_t DEFAULT_PEER_LIMIT = 128;

    // Timeouts
    constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{2000};
    constexpr int DEFAULT_TRACKER_RETRIES = 3;
    constexpr std::chrono::milliseconds CONNECT_TIMEOUT{3000};
    constexpr std::chrono::milliseconds TRANSFER_READ_TIMEOUT{5000};

    // Limits
    constexpr size_t MAX_DATAGRAM_SIZE = 65507;
    constexpr size_t DATAGRAM_HEADROOM = 1024; // envelope around a list of entries
    constexpr uint32_t MAX_FRAME_LENGTH = 64 * 1024 * 1024;
    constexpr size_t MAX_TRANSFER_CONNECTIONS = 64;
    constexpr int TRACKER_WORKERS = 4;

    // Local layout
    constexpr const char* DEFAULT_SHARED_DIR = "user/shared_files";
    constexpr const char* DEFAULT_DOWNLOAD_DIR = "user/downloads";
    constexpr const char* METADATA_FILE = "shared_files.json";
}

// Runtime configuration, consumed once when a tracker or peer session starts.
struct Settings {
    std::string tracker_host = Config::DEFAULT_TRACKER_HOST;
    uint16_t tracker_port = Config::DEFAULT_TRACKER_PORT;
    uint16_t transfer_port = Config::DEFAULT_TRANSFER_PORT;
    std::string advertise_host;
    std::string username = "unknown";

    uint32_t chunk_size = Config::DEFAULT_CHUNK_SIZE;
    int concurrency = Config::DEFAULT_CONCURRENCY;
    int max_retries = Config::DEFAULT_MAX_RETRIES;

    std::chrono::milliseconds liveness_window = Config::DEFAULT_LIVENESS_WINDOW;
    std::chrono::milliseconds heartbeat_interval = Config::DEFAULT_HEARTBEAT_INTERVAL;
    std::chrono::milliseconds request_timeout = Config::DEFAULT_REQUEST_TIMEOUT;
    int tracker_retries = Config::DEFAULT_TRACKER_RETRIES;
    size_t peer_limit = Config::DEFAULT_PEER_LIMIT;

    std::string shared_dir = Config::DEFAULT_SHARED_DIR;
    std::string download_dir = Config::DEFAULT_DOWNLOAD_DIR;

    // Overrides the fields present in a JSON object file. Throws std::runtime_error.
    void load_file(const std::string& path);
    void validate() const;
};

#endif // CONFIG_HPP
