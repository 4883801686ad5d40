#pragma once
#include "../core/Config.hpp"
#include "../download/DownloadScheduler.hpp"
#include <string>
#include <vector>

class CommandHandler {
public:
    static int execute(const std::string& command, const std::vector<std::string>& args);

    // Applies --config first, then the remaining flags, and returns the
    // positional arguments. In tracker mode --port is the tracker's port.
    static std::vector<std::string> parse_settings(const std::vector<std::string>& args, Settings& settings,
                                                   bool tracker_mode = false);

private:
    static int handle_tracker(const std::vector<std::string>& args);
    static int handle_describe(const std::vector<std::string>& args);
    static int handle_ping(const std::vector<std::string>& args);
    static int handle_peers(const std::vector<std::string>& args);
    static int handle_files(const std::vector<std::string>& args);
    static int handle_seed(const std::vector<std::string>& args);
    static int handle_download(const std::vector<std::string>& args);

    static void print_event(const DownloadEvent& event);
};
