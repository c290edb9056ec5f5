#pragma once

#include "common/job.hpp"
#include "backup/backup_config.hpp"
#include "backup/backup_job.hpp"
#include "backup/extractor.hpp"
#include "backup/staging_area.hpp"
#include "backup/verification_report.hpp"
#include "common/logger.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>

// One line of `discvault list`, read from a job record without reopening it
struct JobSummary {
    std::string id;
    Job::State state{Job::State::CREATED};
    std::string parentJobId;
    std::string sourcePath;
    MediumKind kind{MediumKind::OpticalData};
    std::string name;
    size_t units{0};
    ErrorKind failureKind{ErrorKind::None};
};

// Owns the jobs of one staging root. Each job gets its own worker pool.
class JobManager {
public:
    explicit JobManager(std::string stagingRoot, size_t workerThreads = 4);
    ~JobManager();

    // Job creation
    std::shared_ptr<BackupJob> createJob(const BackupConfig& config,
                                         std::shared_ptr<Extractor> extractor = nullptr);
    std::shared_ptr<BackupJob> resumeJob(const std::string& jobId,
                                         std::shared_ptr<Extractor> extractor = nullptr);
    std::shared_ptr<BackupJob> createVerifyJob(const std::string& parentJobId);

    // Job control
    bool advance(const std::string& jobId, StageResult& result);
    bool cancel(const std::string& jobId);
    bool report(const std::string& jobId, VerificationReport& report);

    // Advance until terminal, sleeping between polls that have nothing to do.
    // The job is cancelled once interrupt becomes true.
    bool runToCompletion(const std::string& jobId,
                         std::chrono::milliseconds pollInterval = std::chrono::milliseconds(200),
                         const std::atomic<bool>* interrupt = nullptr);

    // Job registry and lookup
    std::shared_ptr<BackupJob> getJob(const std::string& jobId) const;
    std::vector<JobSummary> listJobs();
    bool removeJob(const std::string& jobId);
    void stopAllJobs();

    const std::string& getStagingRoot() const { return staging_.getRoot(); }

    // Error handling
    std::string getLastError() const;
    void clearLastError();

private:
    bool addJob(const std::shared_ptr<BackupJob>& job);
    void setLastError(const std::string& error);
    std::shared_ptr<ParallelTaskManager> makeTaskManager() const;

    StagingArea staging_;
    size_t workerThreads_;

    // Job registry
    std::unordered_map<std::string, std::shared_ptr<BackupJob>> jobs_;

    // Both guarded by mutex_
    std::string lastError_;
    mutable std::mutex mutex_;
};
