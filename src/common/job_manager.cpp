#include "common/job_manager.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <thread>
#include <nlohmann/json.hpp>

JobManager::JobManager(std::string stagingRoot, size_t workerThreads)
    : staging_(std::move(stagingRoot))
    , workerThreads_(workerThreads == 0 ? 1 : workerThreads) {
}

JobManager::~JobManager() {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.clear();
}

std::shared_ptr<ParallelTaskManager> JobManager::makeTaskManager() const {
    return std::make_shared<ParallelTaskManager>(workerThreads_);
}

std::shared_ptr<BackupJob> JobManager::createJob(const BackupConfig& config, std::shared_ptr<Extractor> extractor) {
    BackupConfig jobConfig = config;
    if (jobConfig.stagingRoot.empty()) {
        jobConfig.stagingRoot = staging_.getRoot();
    }

    try {
        auto job = BackupJob::create(jobConfig, std::move(extractor), makeTaskManager());
        addJob(job);
        return job;
    } catch (const BackupError& e) {
        setLastError(e.what());
        Logger::error(std::string("Failed to create backup job: ") + e.what());
        return nullptr;
    }
}

std::shared_ptr<BackupJob> JobManager::resumeJob(const std::string& jobId, std::shared_ptr<Extractor> extractor) {
    if (auto existing = getJob(jobId)) {
        return existing;
    }

    try {
        auto job = BackupJob::load(staging_.getRoot(), jobId, std::move(extractor), makeTaskManager());
        addJob(job);
        Logger::info("Resumed job " + jobId + " in state " + Job::stateToString(job->getState()));
        return job;
    } catch (const BackupError& e) {
        setLastError(e.what());
        Logger::error("Failed to resume job " + jobId + ": " + e.what());
        return nullptr;
    }
}

std::shared_ptr<BackupJob> JobManager::createVerifyJob(const std::string& parentJobId) {
    try {
        auto job = BackupJob::createVerifyOnly(staging_.getRoot(), parentJobId, makeTaskManager());
        addJob(job);
        return job;
    } catch (const BackupError& e) {
        setLastError(e.what());
        Logger::error("Failed to create verify job for " + parentJobId + ": " + e.what());
        return nullptr;
    }
}

bool JobManager::advance(const std::string& jobId, StageResult& result) {
    auto job = getJob(jobId);
    if (!job) {
        setLastError("Unknown job: " + jobId);
        return false;
    }
    result = job->advance();
    return true;
}

bool JobManager::cancel(const std::string& jobId) {
    auto job = getJob(jobId);
    if (!job) {
        setLastError("Unknown job: " + jobId);
        return false;
    }
    if (!job->cancel()) {
        setLastError("Job " + jobId + " has already finished");
        return false;
    }
    return true;
}

bool JobManager::report(const std::string& jobId, VerificationReport& report) {
    if (auto job = getJob(jobId)) {
        auto built = job->report();
        if (!built) {
            setLastError("Job " + jobId + " has not finished");
            return false;
        }
        report = *built;
        return true;
    }

    // Not opened in this process; the report on disk is authoritative
    if (!staging_.jobExists(jobId)) {
        setLastError("Unknown job: " + jobId);
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::exists(staging_.reportPath(jobId), ec)) {
        setLastError("Job " + jobId + " has not finished");
        return false;
    }
    try {
        report = reportFromJson(nlohmann::json::parse(StagingArea::readTextFile(staging_.reportPath(jobId))));
        return true;
    } catch (const nlohmann::json::exception& e) {
        setLastError("Malformed report for " + jobId + ": " + e.what());
    } catch (const BackupError& e) {
        setLastError(e.what());
    }
    return false;
}

bool JobManager::runToCompletion(const std::string& jobId, std::chrono::milliseconds pollInterval,
                                 const std::atomic<bool>* interrupt) {
    auto job = getJob(jobId);
    if (!job) {
        setLastError("Unknown job: " + jobId);
        return false;
    }

    bool cancelled = false;
    while (true) {
        if (interrupt && *interrupt && !cancelled) {
            Logger::warning("Interrupted, cancelling job " + jobId);
            job->cancel();
            cancelled = true;
        }
        StageResult result = job->advance();
        if (Job::isTerminalState(result.state)) {
            return true;
        }
        if (result.waiting) {
            std::this_thread::sleep_for(pollInterval);
        }
    }
}

std::shared_ptr<BackupJob> JobManager::getJob(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(jobId);
    return it != jobs_.end() ? it->second : nullptr;
}

std::vector<JobSummary> JobManager::listJobs() {
    std::vector<JobSummary> summaries;
    std::vector<std::string> ids;
    try {
        ids = staging_.listJobs();
    } catch (const BackupError& e) {
        setLastError(e.what());
        Logger::error(e.what());
        return summaries;
    }

    for (const auto& id : ids) {
        try {
            auto record = nlohmann::json::parse(StagingArea::readTextFile(staging_.jobRecordPath(id)));
            JobSummary summary;
            summary.id = id;
            summary.state = Job::parseState(record.at("state").get<std::string>());
            summary.parentJobId = record.value("parentJobId", std::string());
            summary.units = record.at("units").size();
            summary.failureKind = parseErrorKind(record.value("failureKind", std::string("None")));
            const auto& config = record.at("config");
            summary.sourcePath = config.value("source", std::string());
            summary.name = config.value("name", std::string());
            parseMediumKind(config.value("kind", std::string("optical-data")), summary.kind);
            summaries.push_back(summary);
        } catch (const std::exception& e) {
            Logger::warning("Skipping unreadable job record " + id + ": " + e.what());
        }
    }
    return summaries;
}

bool JobManager::removeJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.erase(jobId) > 0;
}

void JobManager::stopAllJobs() {
    std::vector<std::shared_ptr<BackupJob>> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& pair : jobs_) {
            jobs.push_back(pair.second);
        }
    }
    for (auto& job : jobs) {
        if (!job->isTerminal()) {
            job->cancel();
        }
    }
}

bool JobManager::addJob(const std::shared_ptr<BackupJob>& job) {
    if (!job) {
        setLastError("Invalid job pointer");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    jobs_[job->getId()] = job;
    return true;
}

std::string JobManager::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

void JobManager::clearLastError() {
    std::lock_guard<std::mutex> lock(mutex_);
    lastError_.clear();
}

void JobManager::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastError_ = error;
}
