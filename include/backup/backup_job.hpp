#pragma once

#include "common/job.hpp"
#include "common/backup_status.hpp"
#include "common/parallel_task_manager.hpp"
#include "common/logger.hpp"
#include "backup/backup_config.hpp"
#include "backup/backup_types.hpp"
#include "backup/checksum_ledger.hpp"
#include "backup/extractor.hpp"
#include "backup/redundancy_encoder.hpp"
#include "backup/staging_area.hpp"
#include "backup/verification_report.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Drives stall detection and retry backoff
using JobClock = std::chrono::steady_clock;
using ClockFunction = std::function<JobClock::time_point()>;
// Persisted creation and finish times
using WallClock = std::chrono::system_clock;

// Outcome of one advance() call
struct StageResult {
    Job::State state{Job::State::CREATED};
    bool transitioned{false};   // State changed during this call
    bool waiting{false};        // Nothing more to do until time passes
};

// Drives one source through extraction, checksumming, redundancy encoding
// and verification. Each advance() performs at most one stage step and
// returns; the caller decides how often to call it. The job record is
// rewritten at every transition so a crashed run can be resumed with load().
class BackupJob : public Job {
public:
    // extractor may be null for verify-only jobs, which never extract
    BackupJob(const BackupConfig& config,
              std::shared_ptr<Extractor> extractor,
              std::shared_ptr<ParallelTaskManager> taskManager);
    ~BackupJob() override;

    // New job with its own staging directory. Throws BackupError.
    static std::shared_ptr<BackupJob> create(const BackupConfig& config,
                                             std::shared_ptr<Extractor> extractor,
                                             std::shared_ptr<ParallelTaskManager> taskManager);

    // Reopen a job from its record and reconcile it with what is on disk.
    // A null extractor is resolved from the stored configuration.
    static std::shared_ptr<BackupJob> load(const std::string& stagingRoot,
                                           const std::string& jobId,
                                           std::shared_ptr<Extractor> extractor,
                                           std::shared_ptr<ParallelTaskManager> taskManager);

    // New job that re-verifies a previous job's units and redundancy data.
    // The parent directory is only read.
    static std::shared_ptr<BackupJob> createVerifyOnly(const std::string& stagingRoot,
                                                       const std::string& parentJobId,
                                                       std::shared_ptr<ParallelTaskManager> taskManager);

    // Job interface implementation
    bool start() override;
    bool cancel() override;

    StageResult advance();

    // Available once the job is terminal
    std::optional<VerificationReport> report() const;

    void setClock(ClockFunction clock);

    BackupConfig getConfig() const { return config_; }
    std::string getParentJobId() const;
    std::vector<Unit> getUnits() const;
    std::vector<RedundancyBlock> getBlocks() const;
    int getExtractionAttempts() const;
    ErrorKind getFailureKind() const;
    std::string getFailureDetail() const;
    std::string getJobDirectory() const;

private:
    void initializeNew();
    void restore(const nlohmann::json& record);
    void reconcile();
    void persist() const;
    nlohmann::json toJson() const;

    void beginExtraction();
    bool pollExtraction();
    void runChecksumming();
    void runEncoding();
    void runVerification();

    void transition(State state);
    void finish(State state);
    void fail(ErrorKind kind, const std::string& detail);
    void stopExtraction();
    void writeReport() const;
    VerificationReport buildCurrentReport() const;

    std::string unitPath(const Unit& unit) const;
    std::string blockPath(size_t index) const;
    std::vector<bool> loadBlocks(std::vector<RedundancyBlock>& blocks) const;

    BackupConfig config_;
    Source source_;
    std::string parentJobId_;
    std::shared_ptr<Extractor> extractor_;
    std::shared_ptr<RedundancyEncoder> encoder_;
    std::shared_ptr<ParallelTaskManager> taskManager_;
    StagingArea staging_;
    std::unique_ptr<ChecksumLedger> ledger_;
    JobLogger log_;
    ClockFunction clock_;

    std::vector<Unit> units_;
    std::vector<RedundancyBlock> blocks_;   // Metadata only; bytes live in redundancy/
    std::vector<bool> blockTrusted_;

    int attempts_{0};
    WallClock::time_point createdAt_;
    WallClock::time_point finishedAt_;
    JobClock::time_point lastProgressAt_;
    std::optional<JobClock::time_point> nextRetryAt_;
    uint64_t lastBytes_{0};
    bool sawProgress_{false};
    ErrorKind failureKind_{ErrorKind::None};
    std::string failureDetail_;

    ExtractionHandle handle_{0};
    bool extractionActive_{false};
    std::mutex handleMutex_;
    std::atomic<bool> cancelRequested_{false};

    mutable std::mutex mutex_;
};
