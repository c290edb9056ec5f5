#include "main/backup_main.hpp"
#include "backup/backup_cli.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

const char* kVersion = "1.0.0";
const char* kDefaultLogPath = "/tmp/discvault.log";

void printUsage() {
    printBackupUsage();
    std::cout << "\n"
              << "Global options:\n"
              << "  -h, --help           Show this help message\n"
              << "  --version            Show version information\n"
              << "  --verbose            Log debug messages\n"
              << "  --log-file           Log file (default " << kDefaultLogPath << ")\n";
}

}

int main(int argc, char** argv) {
    // Strip global options wherever they appear
    std::vector<char*> args;
    std::string logPath = kDefaultLogPath;
    LogLevel level = LogLevel::INFO;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose") {
            level = LogLevel::DEBUG;
        } else if (arg == "--log-file") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --log-file requires a path" << std::endl;
                return kExitInvalidInvocation;
            }
            logPath = argv[++i];
        } else {
            args.push_back(argv[i]);
        }
    }

    if (args.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        printUsage();
        return kExitInvalidInvocation;
    }

    std::string command = args[0];
    if (command == "--help" || command == "-h" || command == "help") {
        printUsage();
        return kExitVerified;
    }
    if (command == "--version") {
        std::cout << "DiscVault version " << kVersion << "\n";
        return kExitVerified;
    }

    if (!Logger::initialize(logPath, level, level == LogLevel::DEBUG)) {
        std::cerr << "Failed to initialize logger at " << logPath << std::endl;
        return kExitInvalidInvocation;
    }

    int status = kExitFailed;
    try {
        status = backupMain(static_cast<int>(args.size()), args.data());
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        Logger::error("Error in main: " + std::string(e.what()));
    }
    Logger::shutdown();
    return status;
}
