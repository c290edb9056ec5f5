#include <gtest/gtest.h>
#include "backup/backup_job.hpp"
#include "backup/checksum_ledger.hpp"
#include "backup/staging_area.hpp"
#include "test_utils.hpp"
#include <ctime>
#include <fstream>

namespace fs = std::filesystem;

class BackupJobTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.sourcePath = dir_.file("disc.iso");
        config_.stagingRoot = dir_.file("staging");
        config_.retryBaseDelay = std::chrono::milliseconds(1000);
        config_.stallTimeout = std::chrono::milliseconds(5000);
        config_.workerThreads = 2;

        for (uint8_t i = 0; i < 3; ++i) {
            units_.push_back(patternBytes(1000, i + 1));
        }
        extractor_ = std::make_shared<FakeExtractor>(units_);
        taskManager_ = std::make_shared<ParallelTaskManager>(2);
    }

    std::shared_ptr<BackupJob> createJob() {
        auto job = BackupJob::create(config_, extractor_, taskManager_);
        job->setClock(clock_.function());
        return job;
    }

    std::shared_ptr<BackupJob> reload(const std::string& jobId, std::shared_ptr<Extractor> extractor) {
        auto job = BackupJob::load(config_.stagingRoot, jobId, std::move(extractor), taskManager_);
        job->setClock(clock_.function());
        return job;
    }

    // Advance until the job reaches state or finishes
    Job::State advanceUntil(BackupJob& job, Job::State state, int maxSteps = 50) {
        StageResult result;
        result.state = job.getState();
        for (int i = 0; i < maxSteps && result.state != state && !Job::isTerminalState(result.state); ++i) {
            result = job.advance();
        }
        return result.state;
    }

    Job::State runToEnd(BackupJob& job) {
        return advanceUntil(job, Job::State::FAILED);
    }

    std::string unitFile(const BackupJob& job, size_t index) const {
        return job.getJobDirectory() + "/units/unit_" + std::to_string(index) + ".bin";
    }

    static void corrupt(const std::string& path) {
        auto bytes = readBytes(path);
        bytes[bytes.size() / 2] ^= 0x5a;
        writeBytes(path, bytes);
    }

    static size_t lineCount(const std::string& path) {
        std::ifstream in(path);
        std::string line;
        size_t count = 0;
        while (std::getline(in, line)) {
            ++count;
        }
        return count;
    }

    TempDir dir_;
    FakeClock clock_;
    BackupConfig config_;
    std::vector<std::vector<uint8_t>> units_;
    std::shared_ptr<FakeExtractor> extractor_;
    std::shared_ptr<ParallelTaskManager> taskManager_;
};

TEST_F(BackupJobTest, CleanRunIsVerified) {
    auto job = createJob();
    std::vector<std::string> statuses;
    job->setStatusCallback([&statuses](const std::string& status) { statuses.push_back(status); });

    EXPECT_EQ(job->getState(), Job::State::CREATED);
    EXPECT_EQ(runToEnd(*job), Job::State::VERIFIED);
    EXPECT_EQ(statuses, (std::vector<std::string>{"extracting", "checksumming", "encoding", "verifying",
                                                  "verified"}));

    auto units = job->getUnits();
    ASSERT_EQ(units.size(), 3u);
    for (const auto& unit : units) {
        EXPECT_EQ(unit.status, UnitStatus::Verified);
        ASSERT_TRUE(unit.digest.has_value());
        EXPECT_EQ(*unit.digest, toHex(ChecksumLedger::digestOf(units_[unit.index], HashAlgorithm::SHA256)));
        EXPECT_TRUE(unit.redundancyBlock.has_value());
    }
    EXPECT_EQ(job->getBlocks().size(), 1u);
    EXPECT_EQ(lineCount(job->getJobDirectory() + "/ledger.jsonl"), 3u);
    EXPECT_TRUE(fs::exists(job->getJobDirectory() + "/redundancy/block_00000.par"));
    EXPECT_FALSE(fs::exists(job->getJobDirectory() + "/extract.partial"));

    auto report = job->report();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->verdict, Verdict::Verified);
    EXPECT_TRUE(fs::exists(job->getJobDirectory() + "/report.json"));
}

TEST_F(BackupJobTest, NoReportBeforeFinishing) {
    auto job = createJob();
    EXPECT_FALSE(job->report().has_value());
    job->advance();
    EXPECT_FALSE(job->report().has_value());
}

TEST_F(BackupJobTest, CorruptedUnitIsRepaired) {
    auto job = createJob();
    ASSERT_EQ(advanceUntil(*job, Job::State::VERIFYING), Job::State::VERIFYING);
    corrupt(unitFile(*job, 2));

    EXPECT_EQ(runToEnd(*job), Job::State::DEGRADED);
    auto units = job->getUnits();
    EXPECT_EQ(units[0].status, UnitStatus::Verified);
    EXPECT_EQ(units[1].status, UnitStatus::Verified);
    EXPECT_EQ(units[2].status, UnitStatus::Repaired);
    EXPECT_EQ(readBytes(unitFile(*job, 2)), units_[2]);

    auto report = job->report();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->verdict, Verdict::Degraded);
    ASSERT_FALSE(report->findings.empty());
    EXPECT_EQ(report->findings[0], "Unit 2 (unit_2.bin) was repaired from redundancy data");
}

TEST_F(BackupJobTest, MissingUnitIsRepaired) {
    auto job = createJob();
    ASSERT_EQ(advanceUntil(*job, Job::State::VERIFYING), Job::State::VERIFYING);
    fs::remove(unitFile(*job, 0));

    EXPECT_EQ(runToEnd(*job), Job::State::DEGRADED);
    EXPECT_EQ(job->getUnits()[0].status, UnitStatus::Repaired);
    EXPECT_EQ(readBytes(unitFile(*job, 0)), units_[0]);
}

TEST_F(BackupJobTest, TwoCorruptUnitsInOneGroupFail) {
    auto job = createJob();
    ASSERT_EQ(advanceUntil(*job, Job::State::VERIFYING), Job::State::VERIFYING);
    corrupt(unitFile(*job, 0));
    corrupt(unitFile(*job, 1));

    EXPECT_EQ(runToEnd(*job), Job::State::FAILED);
    EXPECT_EQ(job->getFailureKind(), ErrorKind::Unrecoverable);
    auto units = job->getUnits();
    EXPECT_EQ(units[0].status, UnitStatus::Unrepairable);
    EXPECT_EQ(units[1].status, UnitStatus::Unrepairable);
    EXPECT_EQ(units[2].status, UnitStatus::Verified);
    EXPECT_EQ(job->report()->verdict, Verdict::Failed);
}

TEST_F(BackupJobTest, DamagedBlockDegrades) {
    auto job = createJob();
    ASSERT_EQ(advanceUntil(*job, Job::State::VERIFYING), Job::State::VERIFYING);
    corrupt(job->getJobDirectory() + "/redundancy/block_00000.par");

    EXPECT_EQ(runToEnd(*job), Job::State::DEGRADED);
    auto report = job->report();
    ASSERT_EQ(report->blocks.size(), 1u);
    EXPECT_FALSE(report->blocks[0].trusted);
}

TEST_F(BackupJobTest, TransientFailuresBackOffAndRetry) {
    extractor_->setFailures(2);
    auto job = createJob();

    StageResult result = job->advance();
    EXPECT_EQ(result.state, Job::State::EXTRACTING);
    EXPECT_TRUE(result.transitioned);

    // First failure: retry after the base delay
    result = job->advance();
    EXPECT_EQ(result.state, Job::State::EXTRACTING);
    EXPECT_TRUE(result.waiting);
    result = job->advance();
    EXPECT_TRUE(result.waiting);
    EXPECT_EQ(extractor_->beginCount(), 1);

    clock_.advance(std::chrono::milliseconds(1000));
    job->advance();
    EXPECT_EQ(extractor_->beginCount(), 2);

    // Second failure: the delay doubles
    job->advance();
    clock_.advance(std::chrono::milliseconds(1999));
    job->advance();
    EXPECT_EQ(extractor_->beginCount(), 2);
    clock_.advance(std::chrono::milliseconds(1));
    job->advance();
    EXPECT_EQ(extractor_->beginCount(), 3);

    result = job->advance();
    EXPECT_EQ(result.state, Job::State::CHECKSUMMING);
    EXPECT_EQ(job->getExtractionAttempts(), 3);
    EXPECT_EQ(runToEnd(*job), Job::State::VERIFIED);
}

TEST_F(BackupJobTest, RetriesAreBounded) {
    extractor_->setFailures(10);
    config_.retryBaseDelay = std::chrono::milliseconds(0);
    auto job = createJob();

    EXPECT_EQ(runToEnd(*job), Job::State::FAILED);
    EXPECT_EQ(job->getFailureKind(), ErrorKind::TransientExtractionFailure);
    EXPECT_EQ(extractor_->beginCount(), 3);
    EXPECT_EQ(job->getExtractionAttempts(), 3);
}

TEST_F(BackupJobTest, RetryDelayStopsGrowingAtOneHour) {
    config_.maxExtractionAttempts = kMaxExtractionAttempts;
    config_.retryBaseDelay = std::chrono::milliseconds(1000);
    extractor_->setFailures(kMaxExtractionAttempts - 1);
    auto job = createJob();

    job->advance();
    for (int attempt = 1; attempt < kMaxExtractionAttempts; ++attempt) {
        StageResult result = job->advance();
        ASSERT_EQ(result.state, Job::State::EXTRACTING);
        ASSERT_TRUE(result.waiting);

        std::chrono::milliseconds delay = retryDelayFor(config_.retryBaseDelay, attempt);
        ASSERT_GT(delay.count(), 0);
        ASSERT_LE(delay, kMaxRetryDelay);
        if (attempt >= 13) {
            ASSERT_EQ(delay, kMaxRetryDelay);
        }

        clock_.advance(delay - std::chrono::milliseconds(1));
        job->advance();
        ASSERT_EQ(extractor_->beginCount(), attempt);
        clock_.advance(std::chrono::milliseconds(1));
        job->advance();
        ASSERT_EQ(extractor_->beginCount(), attempt + 1);
    }

    EXPECT_EQ(job->advance().state, Job::State::CHECKSUMMING);
    EXPECT_EQ(job->getExtractionAttempts(), kMaxExtractionAttempts);
}

TEST_F(BackupJobTest, ReportTimestampUsesWallClock) {
    static_assert(JobClock::is_steady, "stall and backoff timing must not follow wall clock changes");
    auto job = createJob();
    clock_.advance(std::chrono::hours(24 * 365 * 30));
    ASSERT_EQ(runToEnd(*job), Job::State::VERIFIED);

    std::time_t now = WallClock::to_time_t(WallClock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    const std::string year = std::to_string(utc.tm_year + 1900);

    auto report = job->report();
    ASSERT_TRUE(report);
    EXPECT_EQ(report->attemptedAt.substr(0, 4), year);

    // Reloaded records keep the persisted wall-clock times
    auto reloaded = reload(job->getId(), extractor_);
    EXPECT_EQ(reloaded->report()->attemptedAt, report->attemptedAt);
}

TEST_F(BackupJobTest, DeviceErrorIsNotRetried) {
    extractor_->setDeviceMissing(true);
    auto job = createJob();

    StageResult result = job->advance();
    EXPECT_EQ(result.state, Job::State::FAILED);
    EXPECT_EQ(job->getFailureKind(), ErrorKind::DeviceError);
    EXPECT_EQ(extractor_->beginCount(), 0);
    EXPECT_EQ(job->report()->failureKind, ErrorKind::DeviceError);
}

TEST_F(BackupJobTest, StalledExtractionFails) {
    extractor_->setHang(true);
    auto job = createJob();

    job->advance();
    EXPECT_TRUE(job->advance().waiting);
    clock_.advance(std::chrono::milliseconds(5000));
    EXPECT_EQ(job->advance().state, Job::State::EXTRACTING);
    clock_.advance(std::chrono::milliseconds(1));

    EXPECT_EQ(job->advance().state, Job::State::FAILED);
    EXPECT_EQ(job->getFailureKind(), ErrorKind::StalledExtraction);
    EXPECT_GE(extractor_->cancelCount(), 1);
}

TEST_F(BackupJobTest, ProgressResetsStallTimer) {
    extractor_->setRunningPolls(4);
    auto job = createJob();

    job->advance();
    for (int i = 0; i < 4; ++i) {
        clock_.advance(std::chrono::milliseconds(4000));
        EXPECT_EQ(job->advance().state, Job::State::EXTRACTING);
    }
    EXPECT_EQ(job->advance().state, Job::State::CHECKSUMMING);
}

TEST_F(BackupJobTest, CancelDuringExtraction) {
    extractor_->setRunningPolls(1000);
    auto job = createJob();

    job->advance();
    job->advance();
    EXPECT_TRUE(job->cancel());
    EXPECT_GE(extractor_->cancelCount(), 1);

    EXPECT_EQ(job->advance().state, Job::State::FAILED);
    EXPECT_EQ(job->getFailureKind(), ErrorKind::UserCancelled);
    EXPECT_TRUE(job->getUnits().empty());
    EXPECT_FALSE(job->cancel());
    EXPECT_EQ(job->report()->verdict, Verdict::Failed);
}

TEST_F(BackupJobTest, CancelBeforeStart) {
    auto job = createJob();
    EXPECT_TRUE(job->cancel());
    EXPECT_EQ(job->advance().state, Job::State::FAILED);
    EXPECT_EQ(job->getFailureKind(), ErrorKind::UserCancelled);
    EXPECT_EQ(extractor_->beginCount(), 0);
}

TEST_F(BackupJobTest, CancelBetweenStages) {
    auto job = createJob();
    ASSERT_EQ(advanceUntil(*job, Job::State::ENCODING), Job::State::ENCODING);
    job->cancel();
    EXPECT_EQ(job->advance().state, Job::State::FAILED);
    EXPECT_EQ(job->getFailureKind(), ErrorKind::UserCancelled);
    EXPECT_TRUE(job->getBlocks().empty());
}

TEST_F(BackupJobTest, ResumeInChecksummingKeepsRecordedDigests) {
    std::string jobId;
    {
        auto job = createJob();
        jobId = job->getId();
        ASSERT_EQ(advanceUntil(*job, Job::State::CHECKSUMMING), Job::State::CHECKSUMMING);
    }

    // Interrupted after the first unit was hashed
    StagingArea staging(config_.stagingRoot);
    {
        ChecksumLedger ledger(staging.ledgerPath(jobId));
        ledger.load();
        ledger.record(0, HashAlgorithm::SHA256, ChecksumLedger::digestOf(units_[0], HashAlgorithm::SHA256));
    }

    auto job = reload(jobId, std::make_shared<FakeExtractor>(units_));
    EXPECT_EQ(job->getState(), Job::State::CHECKSUMMING);
    EXPECT_EQ(job->advance().state, Job::State::ENCODING);
    EXPECT_EQ(lineCount(staging.ledgerPath(jobId)), 3u);
    EXPECT_EQ(runToEnd(*job), Job::State::VERIFIED);
}

TEST_F(BackupJobTest, ResumeDuringExtractionStartsOver) {
    extractor_->setRunningPolls(3);
    std::string jobId;
    {
        auto job = createJob();
        jobId = job->getId();
        job->advance();
        job->advance();
        ASSERT_EQ(job->getState(), Job::State::EXTRACTING);
    }

    auto fresh = std::make_shared<FakeExtractor>(units_);
    auto job = reload(jobId, fresh);
    EXPECT_EQ(job->getState(), Job::State::CREATED);
    EXPECT_EQ(job->getExtractionAttempts(), 0);
    EXPECT_TRUE(job->getUnits().empty());
    EXPECT_EQ(runToEnd(*job), Job::State::VERIFIED);
    EXPECT_EQ(fresh->beginCount(), 1);
}

TEST_F(BackupJobTest, ResumeDuringVerificationRepairs) {
    std::string jobId;
    {
        auto job = createJob();
        jobId = job->getId();
        ASSERT_EQ(advanceUntil(*job, Job::State::VERIFYING), Job::State::VERIFYING);
        corrupt(unitFile(*job, 1));
    }

    auto job = reload(jobId, nullptr);
    EXPECT_EQ(runToEnd(*job), Job::State::DEGRADED);
    EXPECT_EQ(job->getUnits()[1].status, UnitStatus::Repaired);
}

TEST_F(BackupJobTest, FinishedJobReloadsReadOnly) {
    auto job = createJob();
    ASSERT_EQ(runToEnd(*job), Job::State::VERIFIED);
    auto first = job->report();

    auto reloaded = reload(job->getId(), nullptr);
    EXPECT_EQ(reloaded->getState(), Job::State::VERIFIED);
    StageResult result = reloaded->advance();
    EXPECT_EQ(result.state, Job::State::VERIFIED);
    EXPECT_FALSE(result.transitioned);
    EXPECT_EQ(reportToJson(*reloaded->report()), reportToJson(*first));
}

TEST_F(BackupJobTest, LoadUnknownJobThrows) {
    try {
        BackupJob::load(config_.stagingRoot, "nope", nullptr, taskManager_);
        FAIL() << "Expected NoEntry";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NoEntry);
    }
}

TEST_F(BackupJobTest, VerifyOnlyLeavesParentUntouched) {
    auto parent = createJob();
    ASSERT_EQ(runToEnd(*parent), Job::State::VERIFIED);

    // Bit rot after the backup was written
    corrupt(unitFile(*parent, 1));
    auto parentUnit = readBytes(unitFile(*parent, 1));
    std::string parentRecord = StagingArea::readTextFile(parent->getJobDirectory() + "/job.json");

    auto child = BackupJob::createVerifyOnly(config_.stagingRoot, parent->getId(), taskManager_);
    EXPECT_NE(child->getId(), parent->getId());
    EXPECT_EQ(child->getParentJobId(), parent->getId());
    EXPECT_EQ(child->getState(), Job::State::VERIFYING);

    EXPECT_EQ(runToEnd(*child), Job::State::DEGRADED);
    EXPECT_EQ(child->getUnits()[1].status, UnitStatus::Repaired);
    EXPECT_EQ(readBytes(unitFile(*child, 1)), units_[1]);
    EXPECT_EQ(child->report()->parentJobId, parent->getId());

    EXPECT_EQ(readBytes(unitFile(*parent, 1)), parentUnit);
    EXPECT_EQ(StagingArea::readTextFile(parent->getJobDirectory() + "/job.json"), parentRecord);
}

TEST_F(BackupJobTest, VerifyOnlyNeedsFinishedParent) {
    auto parent = createJob();
    advanceUntil(*parent, Job::State::ENCODING);

    try {
        BackupJob::createVerifyOnly(config_.stagingRoot, parent->getId(), taskManager_);
        FAIL() << "Expected InvalidConfiguration";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration);
    }
}

TEST_F(BackupJobTest, InvalidConfigurationIsRejected) {
    config_.redundancyRatio = 2.0;
    try {
        createJob();
        FAIL() << "Expected InvalidConfiguration";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration);
    }
}
