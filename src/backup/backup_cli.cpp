#include "backup/backup_cli.hpp"
#include "backup/media_probe.hpp"
#include "common/job.hpp"
#include "common/logger.hpp"
#include "main/backup_main.hpp"
#include "common/backup_status.hpp"
#include <atomic>
#include <cmath>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::atomic<bool> g_interrupted{false};

void handleInterrupt(int) {
    g_interrupted = true;
}

bool parseDouble(const std::string& text, double& value) {
    try {
        size_t used = 0;
        value = std::stod(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool parseUnsigned(const std::string& text, uint64_t& value) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        return false;
    }
    try {
        size_t used = 0;
        value = std::stoull(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

// Seconds as a finite, non-negative number no larger than limit
bool parseSeconds(const std::string& text, std::chrono::milliseconds limit, std::chrono::milliseconds& value) {
    double seconds = 0;
    if (!parseDouble(text, seconds) || !std::isfinite(seconds) || seconds < 0 ||
        seconds * 1000.0 > static_cast<double>(limit.count())) {
        return false;
    }
    value = std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
    return true;
}

std::vector<std::string> splitCommand(const std::string& command) {
    std::vector<std::string> words;
    std::istringstream stream(command);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

}

BackupCLI::BackupCLI() {
}

BackupCLI::~BackupCLI() {
}

int BackupCLI::run(int argc, char* argv[]) {
    if (argc < 1) {
        printUsage();
        return kExitInvalidInvocation;
    }

    std::string command = argv[0];
    std::vector<std::string> args(argv + 1, argv + argc);

    if (command == "-h" || command == "--help" || command == "help") {
        printUsage();
        return kExitVerified;
    }

    try {
        if (command == "start") {
            return handleStartCommand(args);
        } else if (command == "resume") {
            return handleResumeCommand(args);
        } else if (command == "verify") {
            return handleVerifyCommand(args);
        } else if (command == "report") {
            return handleReportCommand(args);
        } else if (command == "list") {
            return handleListCommand(args);
        }
    } catch (const BackupError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        Logger::error(std::string("Command failed with ") + errorKindToString(e.kind()) + ": " + e.what());
        return kExitFailed;
    }

    std::cerr << "Error: Unknown command: " << command << std::endl;
    printUsage();
    return kExitInvalidInvocation;
}

void BackupCLI::printUsage() const {
    printBackupUsage();
}

bool BackupCLI::parseStartOptions(const std::vector<std::string>& args, BackupConfig& config,
                                  int& waitSeconds, std::string& error) {
    // Config files first so that flags override them
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                error = "--config requires a file";
                return false;
            }
            if (!loadBackupConfig(args[++i], config, error)) {
                return false;
            }
        }
    }

    bool explicitExtractor = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool hasValue = i + 1 < args.size();
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (arg == "--no-eject") {
            config.ejectWhenDone = false;
            continue;
        }
        if (!hasValue) {
            error = "Missing value for option " + arg;
            return false;
        }
        const std::string& value = args[++i];

        if (arg == "-i" || arg == "--input") {
            config.sourcePath = value;
            Logger::debug("Parsed source: " + config.sourcePath);
        } else if (arg == "-o" || arg == "--output") {
            config.stagingRoot = value;
            Logger::debug("Parsed destination: " + config.stagingRoot);
        } else if (arg == "--kind") {
            if (!parseMediumKind(value, config.kind)) {
                error = "Unknown medium kind: " + value;
                return false;
            }
        } else if (arg == "--ratio") {
            if (!parseDouble(value, config.redundancyRatio)) {
                error = "Invalid redundancy ratio: " + value;
                return false;
            }
        } else if (arg == "--algorithm") {
            if (!parseHashAlgorithm(value, config.algorithm)) {
                error = "Unknown checksum algorithm: " + value;
                return false;
            }
        } else if (arg == "--codec") {
            config.codec = value;
        } else if (arg == "--extractor") {
            config.extractor = value;
            explicitExtractor = true;
        } else if (arg == "--command") {
            config.commandTemplate = splitCommand(value);
        } else if (arg == "--recovery-pass") {
            config.recoveryPass = splitCommand(value);
        } else if (arg == "--unit-size") {
            if (!parseUnsigned(value, config.unitSize)) {
                error = "Invalid unit size: " + value;
                return false;
            }
        } else if (arg == "--retries") {
            uint64_t attempts = 0;
            if (!parseUnsigned(value, attempts) || attempts > static_cast<uint64_t>(kMaxExtractionAttempts)) {
                error = "Invalid number of extraction attempts: " + value;
                return false;
            }
            config.maxExtractionAttempts = static_cast<int>(attempts);
        } else if (arg == "--retry-delay") {
            if (!parseSeconds(value, kMaxRetryDelay, config.retryBaseDelay)) {
                error = "Invalid retry delay: " + value;
                return false;
            }
        } else if (arg == "--stall-timeout") {
            if (!parseSeconds(value, kMaxStallTimeout, config.stallTimeout) || config.stallTimeout.count() == 0) {
                error = "Invalid stall timeout: " + value;
                return false;
            }
        } else if (arg == "--threads") {
            uint64_t threads = 0;
            if (!parseUnsigned(value, threads)) {
                error = "Invalid thread count: " + value;
                return false;
            }
            config.workerThreads = static_cast<size_t>(threads);
        } else if (arg == "--name") {
            config.name = value;
        } else if (arg == "--label") {
            config.label = value;
        } else if (arg == "--wait") {
            uint64_t seconds = 0;
            if (!parseUnsigned(value, seconds)) {
                error = "Invalid wait time: " + value;
                return false;
            }
            waitSeconds = static_cast<int>(seconds);
        } else {
            error = "Unknown option: " + arg;
            return false;
        }
    }

    if (!config.commandTemplate.empty() && !explicitExtractor) {
        config.extractor = "process";
    }
    return true;
}

bool BackupCLI::prepareDestination(const BackupConfig& config) const {
    std::error_code ec;
    std::filesystem::create_directories(config.stagingRoot, ec);
    if (ec || !isWritableDirectory(config.stagingRoot)) {
        std::cerr << "Error: Destination is not a writable directory: " << config.stagingRoot << std::endl;
        return false;
    }
    return true;
}

bool BackupCLI::prepareSource(BackupConfig& config, int waitSeconds) const {
    std::string error;
    if (!loadMedium(config.sourcePath, error)) {
        // Slot-loading drives have no tray to close
        Logger::debug("Could not load " + config.sourcePath + ": " + error);
    }

    if (!waitForReady(config.sourcePath, std::chrono::seconds(waitSeconds))) {
        // The job records the device error itself
        Logger::warning("Source " + config.sourcePath + " is not readable yet");
        return true;
    }

    if (!unmountSource(config.sourcePath, error)) {
        std::cerr << "Error: Could not get exclusive access to " << config.sourcePath << ": " << error << std::endl;
        return false;
    }

    if (config.label.empty() && config.kind != MediumKind::OpticalAudio) {
        std::string label;
        if (readVolumeLabel(config.sourcePath, label, error)) {
            config.label = label;
            Logger::info("Volume label: " + label);
        } else {
            Logger::debug("No volume label: " + error);
        }
    }
    return true;
}

void BackupCLI::releaseSource(const BackupConfig& config) const {
    if (!config.ejectWhenDone) {
        return;
    }
    std::string error;
    if (!ejectMedium(config.sourcePath, error)) {
        Logger::warning("Could not eject " + config.sourcePath + ": " + error);
    }
}

int BackupCLI::handleStartCommand(const std::vector<std::string>& args) {
    BackupConfig config;
    int waitSeconds = 0;
    std::string error;
    if (!parseStartOptions(args, config, waitSeconds, error) || !validateBackupConfig(config, error)) {
        std::cerr << "Error: " << error << std::endl;
        printUsage();
        return kExitInvalidInvocation;
    }
    if (!prepareDestination(config)) {
        return kExitInvalidInvocation;
    }
    if (!prepareSource(config, waitSeconds)) {
        return kExitFailed;
    }

    jobManager_ = std::make_shared<JobManager>(config.stagingRoot, config.workerThreads);
    auto job = jobManager_->createJob(config);
    if (!job) {
        std::cerr << "Error: Failed to create job: " << jobManager_->getLastError() << std::endl;
        return kExitFailed;
    }

    std::cout << "Job " << job->getId() << " created in " << job->getJobDirectory() << std::endl;
    int status = runJob(job);
    releaseSource(config);
    return status;
}

int BackupCLI::handleResumeCommand(const std::vector<std::string>& args) {
    std::string jobId;
    std::string stagingRoot;
    if (!parseJobArguments(args, jobId, stagingRoot)) {
        return kExitInvalidInvocation;
    }

    jobManager_ = std::make_shared<JobManager>(stagingRoot);
    auto job = jobManager_->resumeJob(jobId);
    if (!job) {
        std::cerr << "Error: " << jobManager_->getLastError() << std::endl;
        return kExitFailed;
    }
    if (job->isTerminal()) {
        std::cout << "Job " << jobId << " already finished" << std::endl;
        return runJob(job);
    }

    BackupConfig config = job->getConfig();
    std::string error;
    if (!unmountSource(config.sourcePath, error)) {
        std::cerr << "Error: Could not get exclusive access to " << config.sourcePath << ": " << error << std::endl;
        return kExitFailed;
    }
    int status = runJob(job);
    releaseSource(config);
    return status;
}

int BackupCLI::handleVerifyCommand(const std::vector<std::string>& args) {
    std::string parentJobId;
    std::string stagingRoot;
    if (!parseJobArguments(args, parentJobId, stagingRoot)) {
        return kExitInvalidInvocation;
    }

    jobManager_ = std::make_shared<JobManager>(stagingRoot);
    auto job = jobManager_->createVerifyJob(parentJobId);
    if (!job) {
        std::cerr << "Error: " << jobManager_->getLastError() << std::endl;
        return kExitInvalidInvocation;
    }

    std::cout << "Verify job " << job->getId() << " created for " << parentJobId << std::endl;
    return runJob(job);
}

int BackupCLI::handleReportCommand(const std::vector<std::string>& args) {
    std::string jobId;
    std::string stagingRoot;
    if (!parseJobArguments(args, jobId, stagingRoot)) {
        return kExitInvalidInvocation;
    }

    jobManager_ = std::make_shared<JobManager>(stagingRoot);
    VerificationReport report;
    if (!jobManager_->report(jobId, report)) {
        std::cerr << "Error: " << jobManager_->getLastError() << std::endl;
        return kExitInvalidInvocation;
    }
    return printReport(report);
}

int BackupCLI::handleListCommand(const std::vector<std::string>& args) {
    std::string stagingRoot;
    for (size_t i = 0; i < args.size(); ++i) {
        if ((args[i] == "-o" || args[i] == "--output") && i + 1 < args.size()) {
            stagingRoot = args[++i];
        } else {
            std::cerr << "Error: Unexpected argument: " << args[i] << std::endl;
            return kExitInvalidInvocation;
        }
    }
    if (stagingRoot.empty()) {
        std::cerr << "Error: list requires -o <destination>" << std::endl;
        return kExitInvalidInvocation;
    }

    jobManager_ = std::make_shared<JobManager>(stagingRoot);
    auto jobs = jobManager_->listJobs();
    if (jobs.empty()) {
        std::cout << "No jobs in " << stagingRoot << std::endl;
        return kExitVerified;
    }

    std::cout << std::left << std::setw(24) << "JOB" << std::setw(14) << "STATE" << std::setw(8) << "UNITS"
              << "SOURCE" << std::endl;
    for (const auto& job : jobs) {
        std::string source = job.sourcePath;
        if (!job.parentJobId.empty()) {
            source = "verify of " + job.parentJobId;
        } else if (!job.name.empty()) {
            source += " (" + job.name + ")";
        }
        std::string state = Job::stateToString(job.state);
        if (job.failureKind != ErrorKind::None) {
            state += ":" + errorKindToString(job.failureKind);
        }
        std::cout << std::left << std::setw(24) << job.id << std::setw(14) << state << std::setw(8) << job.units
                  << source << std::endl;
    }
    return kExitVerified;
}

bool BackupCLI::parseJobArguments(const std::vector<std::string>& args, std::string& jobId,
                                  std::string& stagingRoot) const {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-o" || args[i] == "--output") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: Missing value for " << args[i] << std::endl;
                return false;
            }
            stagingRoot = args[++i];
        } else if (jobId.empty() && !args[i].empty() && args[i][0] != '-') {
            jobId = args[i];
        } else {
            std::cerr << "Error: Unexpected argument: " << args[i] << std::endl;
            return false;
        }
    }

    if (jobId.empty() || stagingRoot.empty()) {
        std::cerr << "Error: Expected <jobId> -o <destination>" << std::endl;
        printUsage();
        return false;
    }
    if (!isPortableName(jobId)) {
        std::cerr << "Error: Invalid job id: " << jobId << std::endl;
        return false;
    }
    return true;
}

int BackupCLI::runJob(const std::shared_ptr<BackupJob>& job) {
    const std::string id = job->getId();
    job->setStatusCallback([id](const std::string& status) {
        std::cout << "[" << id << "] " << status << std::endl;
    });

    g_interrupted = false;
    auto previousInt = std::signal(SIGINT, handleInterrupt);
    auto previousTerm = std::signal(SIGTERM, handleInterrupt);

    bool finished = jobManager_->runToCompletion(id, std::chrono::milliseconds(200), &g_interrupted);

    std::signal(SIGINT, previousInt);
    std::signal(SIGTERM, previousTerm);

    if (!finished) {
        std::cerr << "Error: " << jobManager_->getLastError() << std::endl;
        return kExitFailed;
    }

    auto report = job->report();
    if (!report) {
        std::cerr << "Error: Job " << id << " did not reach a final state" << std::endl;
        return kExitFailed;
    }
    return printReport(*report);
}

int BackupCLI::printReport(const VerificationReport& report) const {
    std::cout << renderReport(report);
    return verdictExitCode(report.verdict);
}
