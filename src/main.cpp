#include "commands/CommandHandler.hpp"
#include <iostream>
#include <vector>

int main(int argc, char* argv[]) {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <command> <args>" << std::endl;
        std::cerr << "\nAvailable commands:" << std::endl;
        std::cerr << "  Tracker:" << std::endl;
        std::cerr << "    tracker [--port <port>] [--liveness-ms <ms>] [--peer-limit <n>]" << std::endl;
        std::cerr << "    ping | peers | files" << std::endl;
        std::cerr << "\n  Files:" << std::endl;
        std::cerr << "    describe <file> [--chunk-size <bytes>]" << std::endl;
        std::cerr << "\n  Peer:" << std::endl;
        std::cerr << "    seed" << std::endl;
        std::cerr << "    download <file_id>" << std::endl;
        std::cerr << "\n  Common flags:" << std::endl;
        std::cerr << "    --config <file.json> --tracker <host:port> --port <port> --advertise <host>" << std::endl;
        std::cerr << "    --shared-dir <dir> --download-dir <dir> --username <name>" << std::endl;
        std::cerr << "    --chunk-size <bytes> --concurrency <n> --retries <n>" << std::endl;
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    return CommandHandler::execute(command, args);
}
