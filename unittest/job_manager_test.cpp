#include <gtest/gtest.h>
#include "common/job_manager.hpp"
#include "test_utils.hpp"
#include <atomic>
#include <thread>

class JobManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        jobManager_ = std::make_shared<JobManager>(dir_.path(), 2);
        config_.sourcePath = dir_.file("disc.iso");
        config_.name = "holiday-2011";
        config_.retryBaseDelay = std::chrono::milliseconds(0);
        for (uint8_t i = 0; i < 5; ++i) {
            units_.push_back(patternBytes(512, i));
        }
    }

    std::shared_ptr<FakeExtractor> makeExtractor() {
        return std::make_shared<FakeExtractor>(units_);
    }

    TempDir dir_;
    BackupConfig config_;
    std::vector<std::vector<uint8_t>> units_;
    std::shared_ptr<JobManager> jobManager_;
};

TEST_F(JobManagerTest, RunsJobToCompletion) {
    auto job = jobManager_->createJob(config_, makeExtractor());
    ASSERT_NE(job, nullptr) << jobManager_->getLastError();
    EXPECT_EQ(job->getConfig().stagingRoot, dir_.path());
    EXPECT_EQ(jobManager_->getJob(job->getId()), job);

    ASSERT_TRUE(jobManager_->runToCompletion(job->getId(), std::chrono::milliseconds(1)));
    EXPECT_EQ(job->getState(), Job::State::VERIFIED);

    VerificationReport report;
    ASSERT_TRUE(jobManager_->report(job->getId(), report));
    EXPECT_EQ(report.verdict, Verdict::Verified);
    EXPECT_EQ(report.units.size(), 5u);
}

TEST_F(JobManagerTest, AdvanceStepsThroughStages) {
    auto job = jobManager_->createJob(config_, makeExtractor());
    ASSERT_NE(job, nullptr);

    StageResult result;
    ASSERT_TRUE(jobManager_->advance(job->getId(), result));
    EXPECT_EQ(result.state, Job::State::EXTRACTING);
    ASSERT_TRUE(jobManager_->advance(job->getId(), result));
    EXPECT_EQ(result.state, Job::State::CHECKSUMMING);

    EXPECT_FALSE(jobManager_->advance("missing", result));
    EXPECT_FALSE(jobManager_->getLastError().empty());
}

TEST_F(JobManagerTest, ReportIsReadFromDiskByAnotherManager) {
    auto job = jobManager_->createJob(config_, makeExtractor());
    ASSERT_TRUE(jobManager_->runToCompletion(job->getId(), std::chrono::milliseconds(1)));

    JobManager other(dir_.path());
    VerificationReport report;
    ASSERT_TRUE(other.report(job->getId(), report)) << other.getLastError();
    EXPECT_EQ(report.jobId, job->getId());
    EXPECT_EQ(report.verdict, Verdict::Verified);

    EXPECT_FALSE(other.report("unknown", report));
}

TEST_F(JobManagerTest, ReportOfUnfinishedJobFails) {
    auto job = jobManager_->createJob(config_, makeExtractor());
    VerificationReport report;
    EXPECT_FALSE(jobManager_->report(job->getId(), report));
    EXPECT_NE(jobManager_->getLastError().find("has not finished"), std::string::npos);
}

TEST_F(JobManagerTest, ListJobsSummarizesRecords) {
    auto first = jobManager_->createJob(config_, makeExtractor());
    ASSERT_TRUE(jobManager_->runToCompletion(first->getId(), std::chrono::milliseconds(1)));
    auto verify = jobManager_->createVerifyJob(first->getId());
    ASSERT_NE(verify, nullptr) << jobManager_->getLastError();
    ASSERT_TRUE(jobManager_->runToCompletion(verify->getId(), std::chrono::milliseconds(1)));

    auto jobs = jobManager_->listJobs();
    ASSERT_EQ(jobs.size(), 2u);
    for (const auto& summary : jobs) {
        EXPECT_EQ(summary.state, Job::State::VERIFIED);
        EXPECT_EQ(summary.units, 5u);
        EXPECT_EQ(summary.name, "holiday-2011");
        if (summary.id == verify->getId()) {
            EXPECT_EQ(summary.parentJobId, first->getId());
        } else {
            EXPECT_TRUE(summary.parentJobId.empty());
        }
    }
}

TEST_F(JobManagerTest, ResumeUnknownJobFails) {
    EXPECT_EQ(jobManager_->resumeJob("unknown"), nullptr);
    EXPECT_FALSE(jobManager_->getLastError().empty());
    EXPECT_EQ(jobManager_->createVerifyJob("unknown"), nullptr);
}

TEST_F(JobManagerTest, ResumeFromAnotherManager) {
    auto job = jobManager_->createJob(config_, makeExtractor());
    StageResult result;
    jobManager_->advance(job->getId(), result);
    jobManager_->advance(job->getId(), result);
    ASSERT_EQ(result.state, Job::State::CHECKSUMMING);

    JobManager other(dir_.path());
    auto resumed = other.resumeJob(job->getId(), makeExtractor());
    ASSERT_NE(resumed, nullptr) << other.getLastError();
    EXPECT_EQ(resumed->getState(), Job::State::CHECKSUMMING);
    ASSERT_TRUE(other.runToCompletion(resumed->getId(), std::chrono::milliseconds(1)));
    EXPECT_EQ(resumed->getState(), Job::State::VERIFIED);
}

TEST_F(JobManagerTest, InterruptCancelsJob) {
    auto extractor = makeExtractor();
    extractor->setRunningPolls(1000000);
    auto job = jobManager_->createJob(config_, extractor);

    std::atomic<bool> interrupted{true};
    ASSERT_TRUE(jobManager_->runToCompletion(job->getId(), std::chrono::milliseconds(1), &interrupted));
    EXPECT_EQ(job->getState(), Job::State::FAILED);
    EXPECT_EQ(job->getFailureKind(), ErrorKind::UserCancelled);
}

TEST_F(JobManagerTest, CancelAndRemove) {
    auto job = jobManager_->createJob(config_, makeExtractor());
    EXPECT_TRUE(jobManager_->cancel(job->getId()));
    StageResult result;
    jobManager_->advance(job->getId(), result);
    EXPECT_EQ(result.state, Job::State::FAILED);
    EXPECT_FALSE(jobManager_->cancel(job->getId()));

    EXPECT_TRUE(jobManager_->removeJob(job->getId()));
    EXPECT_EQ(jobManager_->getJob(job->getId()), nullptr);
    EXPECT_FALSE(jobManager_->removeJob(job->getId()));
}

TEST_F(JobManagerTest, InvalidConfigIsReported) {
    config_.redundancyRatio = -1;
    EXPECT_EQ(jobManager_->createJob(config_, makeExtractor()), nullptr);
    EXPECT_NE(jobManager_->getLastError().find("ratio"), std::string::npos);
}

TEST_F(JobManagerTest, LastErrorIsSafeAcrossThreads) {
    std::atomic<bool> done{false};
    std::vector<std::thread> callers;
    for (int t = 0; t < 4; ++t) {
        callers.emplace_back([this, t]() {
            StageResult result;
            for (int i = 0; i < 200; ++i) {
                const std::string id = "missing-" + std::to_string(t) + "-" + std::to_string(i);
                EXPECT_FALSE(jobManager_->cancel(id));
                EXPECT_FALSE(jobManager_->advance(id, result));
            }
        });
    }
    std::thread reader([this, &done]() {
        while (!done) {
            std::string error = jobManager_->getLastError();
            EXPECT_TRUE(error.empty() || error.find("Unknown job: missing-") == 0) << error;
            jobManager_->clearLastError();
        }
    });

    for (auto& caller : callers) {
        caller.join();
    }
    done = true;
    reader.join();

    EXPECT_FALSE(jobManager_->cancel("missing-last"));
    EXPECT_EQ(jobManager_->getLastError(), "Unknown job: missing-last");
}
