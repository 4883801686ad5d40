#include "Config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <type_traits>

using json = nlohmann::json;

namespace {

template <typename T>
void read_field(const json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

// Integers are range-checked before they are narrowed into the field.
template <typename T>
void read_number(const json& j, const char* key, T& out) {
    if (!j.contains(key)) {
        return;
    }
    const json& value = j.at(key);
    if (!value.is_number_integer()) {
        throw std::runtime_error(std::string(key) + " must be an integer");
    }
    bool fits;
    if (value.is_number_unsigned()) {
        fits = value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<T>::max());
    } else {
        int64_t n = value.get<int64_t>();
        fits = std::is_unsigned<T>::value ? n >= 0 : n >= static_cast<int64_t>(std::numeric_limits<T>::min());
    }
    if (!fits) {
        throw std::runtime_error(std::string(key) + " is out of range: " + value.dump());
    }
    out = value.get<T>();
}

void read_millis(const json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key)) {
        out = std::chrono::milliseconds(j.at(key).get<int64_t>());
    }
}

}

void Settings::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    json j;
    try {
        file >> j;
        if (!j.is_object()) {
            throw std::runtime_error("top level value is not an object");
        }
        read_field(j, "tracker_host", tracker_host);
        read_number(j, "tracker_port", tracker_port);
        read_number(j, "transfer_port", transfer_port);
        read_field(j, "advertise_host", advertise_host);
        read_field(j, "username", username);
        read_number(j, "chunk_size", chunk_size);
        read_number(j, "concurrency", concurrency);
        read_number(j, "max_retries", max_retries);
        read_millis(j, "liveness_window_ms", liveness_window);
        read_millis(j, "heartbeat_interval_ms", heartbeat_interval);
        read_millis(j, "request_timeout_ms", request_timeout);
        read_number(j, "tracker_retries", tracker_retries);
        read_number(j, "peer_limit", peer_limit);
        read_field(j, "shared_dir", shared_dir);
        read_field(j, "download_dir", download_dir);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }

    validate();
}

void Settings::validate() const {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (chunk_size > Config::MAX_FRAME_LENGTH - 64) {
        throw std::invalid_argument("chunk_size exceeds the transfer frame limit");
    }
    if (concurrency < 1) {
        throw std::invalid_argument("concurrency must be at least 1");
    }
    if (max_retries < 0) {
        throw std::invalid_argument("max_retries must not be negative");
    }
    if (tracker_retries < 1) {
        throw std::invalid_argument("tracker_retries must be at least 1");
    }
    if (liveness_window.count() <= 0 || request_timeout.count() <= 0) {
        throw std::invalid_argument("timeouts must be positive");
    }
    if (heartbeat_interval >= liveness_window) {
        throw std::invalid_argument("heartbeat_interval must be shorter than liveness_window");
    }
}
