#pragma once

#include "common/job_manager.hpp"
#include "backup/backup_config.hpp"
#include "common/logger.hpp"
#include <memory>
#include <string>
#include <vector>

// Process exit statuses
constexpr int kExitVerified = 0;
constexpr int kExitDegraded = 1;
constexpr int kExitFailed = 2;
constexpr int kExitInvalidInvocation = 3;

class BackupCLI {
public:
    BackupCLI();
    ~BackupCLI();

    // argv[0] is the subcommand. Returns the process exit status.
    int run(int argc, char* argv[]);
    void printUsage() const;

    // Parse `start` options into config; --config files are applied before
    // the other flags regardless of their position
    static bool parseStartOptions(const std::vector<std::string>& args, BackupConfig& config,
                                  int& waitSeconds, std::string& error);

private:
    int handleStartCommand(const std::vector<std::string>& args);
    int handleResumeCommand(const std::vector<std::string>& args);
    int handleVerifyCommand(const std::vector<std::string>& args);
    int handleReportCommand(const std::vector<std::string>& args);
    int handleListCommand(const std::vector<std::string>& args);

    // Parse "<jobId> -o <root>"
    bool parseJobArguments(const std::vector<std::string>& args, std::string& jobId,
                           std::string& stagingRoot) const;
    bool prepareDestination(const BackupConfig& config) const;
    // Load the tray, wait for the medium, unmount it and probe its label
    bool prepareSource(BackupConfig& config, int waitSeconds) const;
    void releaseSource(const BackupConfig& config) const;
    int runJob(const std::shared_ptr<BackupJob>& job);
    int printReport(const VerificationReport& report) const;

    std::shared_ptr<JobManager> jobManager_;
};
