#include "relay_api.hpp"
#include <curl/curl.h>
#include <iostream>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config <path>] [--upload <file> [--name <name>] | --status]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile;
    std::string uploadFile;
    std::string remoteName;
    bool statusMode = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--upload" && i + 1 < argc) {
            uploadFile = argv[++i];
        } else if (arg == "--name" && i + 1 < argc) {
            remoteName = argv[++i];
        } else if (arg == "--status") {
            statusMode = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (statusMode && !uploadFile.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    if (statusMode) {
        auto result = RelayAPI::checkStatus(configFile);
        if (!result) {
            std::cerr << "Error: " << result.error() << std::endl;
            return 1;
        }
        std::cout << *result << std::endl;
        return 0;
    }

    if (!uploadFile.empty()) {
        auto result = RelayAPI::backupFile(configFile, uploadFile, remoteName);
        if (!result) {
            std::cerr << "Error: " << result.error() << std::endl;
            return 1;
        }
        std::cout << "Backed up to " << *result << std::endl;
        return 0;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    auto result = RelayAPI::runBot(configFile);
    curl_global_cleanup();
    if (!result) {
        std::cerr << "Error: " << result.error() << std::endl;
        return 1;
    }
    return 0;
}
