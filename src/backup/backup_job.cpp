#include "backup/backup_job.hpp"
#include "backup/extractor_factory.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <future>
#include <map>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

int64_t toMillis(WallClock::time_point timePoint) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch()).count();
}

WallClock::time_point fromMillis(int64_t millis) {
    return WallClock::time_point(std::chrono::duration_cast<WallClock::duration>(std::chrono::milliseconds(millis)));
}

std::string formatTimestamp(WallClock::time_point timePoint) {
    std::time_t seconds = WallClock::to_time_t(timePoint);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    char millis[8];
    std::snprintf(millis, sizeof(millis), ".%03dZ", static_cast<int>(toMillis(timePoint) % 1000));
    return std::string(buffer) + millis;
}

int progressFor(Job::State state) {
    switch (state) {
        case Job::State::CREATED:      return 0;
        case Job::State::EXTRACTING:   return 5;
        case Job::State::CHECKSUMMING: return 40;
        case Job::State::ENCODING:     return 60;
        case Job::State::VERIFYING:    return 80;
        default:                       return 100;
    }
}

json readJobRecord(const StagingArea& staging, const std::string& jobId) {
    if (!staging.jobExists(jobId)) {
        throw BackupError(ErrorKind::NoEntry, "No job " + jobId + " under " + staging.getRoot());
    }
    try {
        return json::parse(StagingArea::readTextFile(staging.jobRecordPath(jobId)));
    } catch (const json::parse_error& e) {
        throw BackupError(ErrorKind::StorageIOError, "Malformed job record for " + jobId + ": " + e.what());
    }
}

BackupConfig configFromRecord(const json& record, const std::string& stagingRoot) {
    BackupConfig config;
    std::string error;
    if (!record.contains("config") || !backupConfigFromJson(record.at("config"), config, error)) {
        throw BackupError(ErrorKind::StorageIOError, "Job record has no usable configuration: " + error);
    }
    // The staging root may have been moved since the job was created
    config.stagingRoot = stagingRoot;
    return config;
}

// Results of parallel work are joined before any error is acted upon
template<typename T>
std::vector<T> joinAll(std::vector<std::future<T>>& futures) {
    std::vector<T> results(futures.size());
    std::optional<BackupError> firstError;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results[i] = futures[i].get();
        } catch (const BackupError& e) {
            if (!firstError) {
                firstError = e;
            }
        } catch (const std::exception& e) {
            if (!firstError) {
                firstError = BackupError(ErrorKind::StorageIOError, e.what());
            }
        }
    }
    if (firstError) {
        throw *firstError;
    }
    return results;
}

struct Rehash {
    bool present{false};
    std::vector<uint8_t> digest;
};

}

BackupJob::BackupJob(const BackupConfig& config,
                     std::shared_ptr<Extractor> extractor,
                     std::shared_ptr<ParallelTaskManager> taskManager)
    : config_(config)
    , extractor_(std::move(extractor))
    , encoder_(createRedundancyEncoder(config.codec))
    , taskManager_(std::move(taskManager))
    , staging_(config.stagingRoot)
    , clock_([]() { return JobClock::now(); }) {
    source_.path = config_.sourcePath;
    source_.kind = config_.kind;
    source_.label = config_.label;
    if (!taskManager_) {
        taskManager_ = std::make_shared<ParallelTaskManager>(config_.workerThreads);
    }
}

BackupJob::~BackupJob() {
    stopExtraction();
}

std::shared_ptr<BackupJob> BackupJob::create(const BackupConfig& config,
                                             std::shared_ptr<Extractor> extractor,
                                             std::shared_ptr<ParallelTaskManager> taskManager) {
    std::string error;
    if (!validateBackupConfig(config, error)) {
        throw BackupError(ErrorKind::InvalidConfiguration, error);
    }
    if (!extractor) {
        extractor = createExtractor(config);
    }

    auto job = std::make_shared<BackupJob>(config, std::move(extractor), std::move(taskManager));
    job->initializeNew();
    return job;
}

std::shared_ptr<BackupJob> BackupJob::load(const std::string& stagingRoot,
                                           const std::string& jobId,
                                           std::shared_ptr<Extractor> extractor,
                                           std::shared_ptr<ParallelTaskManager> taskManager) {
    StagingArea staging(stagingRoot);
    json record = readJobRecord(staging, jobId);
    BackupConfig config = configFromRecord(record, stagingRoot);

    if (!extractor && record.value("parentJobId", std::string()).empty()) {
        extractor = createExtractor(config);
    }

    auto job = std::make_shared<BackupJob>(config, std::move(extractor), std::move(taskManager));
    job->restore(record);
    job->ledger_ = std::make_unique<ChecksumLedger>(staging.ledgerPath(jobId));
    job->ledger_->load();
    job->reconcile();
    return job;
}

std::shared_ptr<BackupJob> BackupJob::createVerifyOnly(const std::string& stagingRoot,
                                                       const std::string& parentJobId,
                                                       std::shared_ptr<ParallelTaskManager> taskManager) {
    StagingArea staging(stagingRoot);
    json record = readJobRecord(staging, parentJobId);
    BackupConfig config = configFromRecord(record, stagingRoot);

    auto job = std::make_shared<BackupJob>(config, nullptr, std::move(taskManager));
    job->restore(record);
    if (!isTerminalState(job->getState())) {
        throw BackupError(ErrorKind::InvalidConfiguration, "Job " + parentJobId + " has not finished yet");
    }
    if (job->units_.empty() || job->blocks_.empty()) {
        throw BackupError(ErrorKind::InvalidConfiguration,
                          "Job " + parentJobId + " has no redundancy data to verify against");
    }

    job->setId(job->generateId());
    job->log_.setJobId(job->getId());
    job->parentJobId_ = parentJobId;
    job->attempts_ = 0;
    job->failureKind_ = ErrorKind::None;
    job->failureDetail_.clear();
    job->setError("");
    job->createdAt_ = WallClock::now();
    job->finishedAt_ = WallClock::time_point();
    job->blockTrusted_.clear();
    for (auto& unit : job->units_) {
        unit.status = UnitStatus::Unverified;
    }

    staging.createJobDirectory(job->getId());
    staging.linkArtifacts(parentJobId, job->getId());
    job->ledger_ = std::make_unique<ChecksumLedger>(staging.ledgerPath(job->getId()));
    job->ledger_->load();

    job->log_.info("Verify-only job over " + parentJobId + " with " + std::to_string(job->units_.size()) + " units");
    job->transition(State::VERIFYING);
    return job;
}

void BackupJob::initializeNew() {
    setId(generateId());
    log_.setJobId(getId());
    staging_.createJobDirectory(getId());
    ledger_ = std::make_unique<ChecksumLedger>(staging_.ledgerPath(getId()));
    createdAt_ = WallClock::now();
    lastProgressAt_ = clock_();
    persist();
    log_.info("Created backup job for " + source_.path + " (" + mediumKindToString(source_.kind) + ")");
}

bool BackupJob::start() {
    if (getState() != State::CREATED) {
        setError("Job has already been started");
        return false;
    }
    StageResult result = advance();
    return result.state != State::FAILED;
}

bool BackupJob::cancel() {
    if (isTerminal()) {
        log_.warning("Cancel ignored, job already " + stateToString(getState()));
        return false;
    }
    cancelRequested_ = true;
    {
        std::lock_guard<std::mutex> lock(handleMutex_);
        if (extractionActive_ && extractor_) {
            extractor_->cancel(handle_);
        }
    }
    log_.info("Cancellation requested");
    return true;
}

void BackupJob::setClock(ClockFunction clock) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = std::move(clock);
}

StageResult BackupJob::advance() {
    std::lock_guard<std::mutex> lock(mutex_);

    StageResult result;
    State before = getState();
    if (isTerminalState(before)) {
        result.state = before;
        return result;
    }

    try {
        switch (before) {
            case State::CREATED:
                if (cancelRequested_) {
                    fail(ErrorKind::UserCancelled, "Cancelled before extraction started");
                } else {
                    beginExtraction();
                }
                break;
            case State::EXTRACTING:
                result.waiting = pollExtraction();
                break;
            case State::CHECKSUMMING:
                runChecksumming();
                break;
            case State::ENCODING:
                runEncoding();
                break;
            case State::VERIFYING:
                runVerification();
                break;
            default:
                break;
        }
    } catch (const BackupError& e) {
        fail(e.kind(), e.what());
    } catch (const std::exception& e) {
        fail(ErrorKind::StorageIOError, e.what());
    }

    result.state = getState();
    result.transitioned = result.state != before;
    if (result.transitioned) {
        result.waiting = false;
    }
    return result;
}

void BackupJob::beginExtraction() {
    if (!extractor_) {
        throw BackupError(ErrorKind::InvalidConfiguration, "No extractor configured for this job");
    }

    staging_.clearPartial(getId());
    ++attempts_;
    log_.info("Extraction attempt " + std::to_string(attempts_) + " of " +
              std::to_string(config_.maxExtractionAttempts) + " with " + extractor_->name() +
              " extractor from " + source_.path);

    ExtractionHandle handle = extractor_->begin(source_, staging_.partialDir(getId()));
    {
        std::lock_guard<std::mutex> lock(handleMutex_);
        handle_ = handle;
        extractionActive_ = true;
    }

    nextRetryAt_.reset();
    lastProgressAt_ = clock_();
    lastBytes_ = 0;
    sawProgress_ = false;

    if (getState() == State::CREATED) {
        transition(State::EXTRACTING);
    } else {
        persist();
    }
}

bool BackupJob::pollExtraction() {
    if (cancelRequested_) {
        stopExtraction();
        units_.clear();
        fail(ErrorKind::UserCancelled, "Cancelled during extraction");
        return false;
    }

    bool active;
    {
        std::lock_guard<std::mutex> lock(handleMutex_);
        active = extractionActive_;
    }
    if (!active) {
        // Waiting out the backoff before the next attempt
        if (nextRetryAt_ && clock_() < *nextRetryAt_) {
            return true;
        }
        beginExtraction();
        return false;
    }

    ExtractionStatus status = extractor_->poll(handle_);
    JobClock::time_point now = clock_();

    switch (status.kind) {
        case ExtractionStatus::Kind::Running: {
            if (!sawProgress_ || status.bytesSoFar > lastBytes_) {
                sawProgress_ = true;
                lastBytes_ = status.bytesSoFar;
                lastProgressAt_ = now;
                return true;
            }
            auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastProgressAt_);
            if (idle > config_.stallTimeout) {
                stopExtraction();
                fail(ErrorKind::StalledExtraction,
                     "No extraction progress for " + std::to_string(idle.count()) + " ms at " +
                     std::to_string(lastBytes_) + " bytes");
                return false;
            }
            return true;
        }

        case ExtractionStatus::Kind::Done: {
            {
                std::lock_guard<std::mutex> lock(handleMutex_);
                extractionActive_ = false;
            }
            for (size_t i = 0; i < status.manifest.size(); ++i) {
                if (status.manifest[i].index != i) {
                    throw BackupError(ErrorKind::StorageIOError,
                                      "Extractor manifest is out of order at entry " + std::to_string(i));
                }
            }
            staging_.promoteExtraction(getId());

            units_.clear();
            for (const auto& descriptor : status.manifest) {
                Unit unit;
                unit.index = descriptor.index;
                unit.fileName = descriptor.fileName;
                unit.offset = descriptor.offset;
                unit.size = descriptor.size;
                units_.push_back(unit);
            }
            log_.info("Extraction finished: " + std::to_string(units_.size()) + " units, " +
                      std::to_string(status.bytesSoFar) + " bytes");
            transition(State::CHECKSUMMING);
            return false;
        }

        case ExtractionStatus::Kind::Failed:
        default: {
            {
                std::lock_guard<std::mutex> lock(handleMutex_);
                extractionActive_ = false;
            }
            if (attempts_ >= config_.maxExtractionAttempts) {
                fail(ErrorKind::TransientExtractionFailure,
                     "Extraction failed after " + std::to_string(attempts_) + " attempts: " + status.reason);
                return false;
            }

            std::chrono::milliseconds delay = retryDelayFor(config_.retryBaseDelay, attempts_);
            nextRetryAt_ = now + delay;
            log_.warning("Extraction attempt " + std::to_string(attempts_) + " failed: " + status.reason +
                         "; retrying in " + std::to_string(delay.count()) + " ms");
            persist();
            return true;
        }
    }
}

void BackupJob::runChecksumming() {
    if (cancelRequested_) {
        fail(ErrorKind::UserCancelled, "Cancelled before checksumming");
        return;
    }

    const HashAlgorithm algorithm = config_.algorithm;
    std::vector<size_t> positions;
    std::vector<std::future<std::vector<uint8_t>>> futures;
    size_t reused = 0;

    for (size_t i = 0; i < units_.size(); ++i) {
        // Units hashed before an interruption are already in the ledger
        if (auto existing = ledger_->entry(units_[i].index, algorithm)) {
            units_[i].digest = toHex(existing->digest);
            ++reused;
            continue;
        }
        std::string path = unitPath(units_[i]);
        positions.push_back(i);
        futures.push_back(taskManager_->addTask([path, algorithm]() {
            return ChecksumLedger::digestOfFile(path, algorithm);
        }));
    }

    std::vector<std::vector<uint8_t>> digests = joinAll(futures);

    // Single writer: the ledger is appended only after the join
    for (size_t k = 0; k < positions.size(); ++k) {
        Unit& unit = units_[positions[k]];
        ledger_->record(unit.index, algorithm, digests[k]);
        unit.digest = toHex(digests[k]);
    }

    log_.info("Checksummed " + std::to_string(positions.size()) + " units with " +
              hashAlgorithmToString(algorithm) +
              (reused > 0 ? " (" + std::to_string(reused) + " taken from the ledger)" : std::string()));

    if (cancelRequested_) {
        fail(ErrorKind::UserCancelled, "Cancelled after checksumming");
        return;
    }
    transition(State::ENCODING);
}

void BackupJob::runEncoding() {
    if (cancelRequested_) {
        fail(ErrorKind::UserCancelled, "Cancelled before encoding");
        return;
    }

    std::vector<UnitData> data;
    data.reserve(units_.size());
    for (const auto& unit : units_) {
        UnitData item;
        item.index = unit.index;
        item.bytes = StagingArea::readFile(unitPath(unit));
        data.push_back(std::move(item));
    }

    std::vector<RedundancyBlock> blocks = encoder_->encode(data, config_.redundancyRatio);
    data.clear();

    std::error_code ec;
    fs::create_directories(staging_.redundancyDir(getId()), ec);
    if (ec) {
        throw BackupError(ErrorKind::StorageIOError, "Failed to create redundancy directory: " + ec.message());
    }

    std::map<size_t, size_t> positionOf;
    for (size_t i = 0; i < units_.size(); ++i) {
        units_[i].redundancyBlock.reset();
        positionOf[units_[i].index] = i;
    }
    for (auto& block : blocks) {
        StagingArea::writeFileAtomic(blockPath(block.index), block.bytes);
        for (size_t unitIndex : block.unitIndices) {
            auto it = positionOf.find(unitIndex);
            if (it != positionOf.end()) {
                units_[it->second].redundancyBlock = block.index;
            }
        }
        block.bytes.clear();
        block.bytes.shrink_to_fit();
    }
    blocks_ = std::move(blocks);
    blockTrusted_.clear();

    log_.info("Wrote " + std::to_string(blocks_.size()) + " " + encoder_->name() +
              " redundancy blocks at ratio " + std::to_string(config_.redundancyRatio));

    if (cancelRequested_) {
        fail(ErrorKind::UserCancelled, "Cancelled after encoding");
        return;
    }
    transition(State::VERIFYING);
}

void BackupJob::runVerification() {
    if (cancelRequested_) {
        fail(ErrorKind::UserCancelled, "Cancelled before verification");
        return;
    }

    const HashAlgorithm algorithm = config_.algorithm;

    // Only blocks that pass their own checksum may take part in repair
    std::vector<RedundancyBlock> blocks = blocks_;
    blockTrusted_ = loadBlocks(blocks);

    std::vector<std::future<Rehash>> futures;
    for (const auto& unit : units_) {
        std::string path = unitPath(unit);
        futures.push_back(taskManager_->addTask([path, algorithm]() {
            Rehash result;
            std::error_code ec;
            if (!fs::is_regular_file(path, ec)) {
                return result;
            }
            result.present = true;
            result.digest = ChecksumLedger::digestOfFile(path, algorithm);
            return result;
        }));
    }
    std::vector<Rehash> rehashed = joinAll(futures);

    std::map<size_t, size_t> positionOf;
    size_t damaged = 0;
    for (size_t i = 0; i < units_.size(); ++i) {
        Unit& unit = units_[i];
        positionOf[unit.index] = i;
        bool matches = rehashed[i].present && ledger_->verify(unit.index, algorithm, rehashed[i].digest);
        if (matches) {
            // A unit repaired before an interruption keeps that status
            unit.status = unit.status == UnitStatus::Repaired ? UnitStatus::Repaired : UnitStatus::Verified;
        } else {
            unit.status = UnitStatus::Mismatched;
            ++damaged;
            log_.warning(errorKindToString(ErrorKind::ChecksumMismatch) + ": unit " + std::to_string(unit.index) +
                         (rehashed[i].present ? " does not match the ledger" : " is missing"));
        }
    }

    std::vector<std::pair<size_t, std::vector<uint8_t>>> rebuilt;
    if (damaged > 0) {
        for (size_t i = 0; i < units_.size(); ++i) {
            if (units_[i].status != UnitStatus::Mismatched) {
                continue;
            }

            for (size_t b = 0; b < blocks.size() && units_[i].status == UnitStatus::Mismatched; ++b) {
                const RedundancyBlock& block = blocks[b];
                if (!blockTrusted_[b] ||
                    std::find(block.unitIndices.begin(), block.unitIndices.end(), units_[i].index) ==
                        block.unitIndices.end()) {
                    continue;
                }

                std::vector<UnitData> group;
                bool complete = true;
                for (size_t unitIndex : block.unitIndices) {
                    auto it = positionOf.find(unitIndex);
                    if (it == positionOf.end()) {
                        complete = false;
                        break;
                    }
                    const Unit& member = units_[it->second];
                    UnitData item;
                    item.index = unitIndex;
                    if (member.status == UnitStatus::Mismatched) {
                        item.present = false;
                    } else {
                        item.bytes = StagingArea::readFile(unitPath(member));
                    }
                    group.push_back(std::move(item));
                }
                if (!complete) {
                    continue;
                }

                RepairResult repair = encoder_->repair(group, {block});
                if (!repair.recovered) {
                    log_.warning("Redundancy block " + std::to_string(block.index) + " cannot rebuild " +
                                 std::to_string(repair.missingUnits.size()) + " missing units");
                    continue;
                }

                for (auto& item : repair.units) {
                    Unit& member = units_[positionOf[item.index]];
                    if (member.status != UnitStatus::Mismatched) {
                        continue;
                    }
                    if (ledger_->verify(member.index, algorithm, ChecksumLedger::digestOf(item.bytes, algorithm))) {
                        member.status = UnitStatus::Repaired;
                        rebuilt.emplace_back(positionOf[item.index], std::move(item.bytes));
                    } else {
                        log_.warning("Rebuilt unit " + std::to_string(member.index) + " does not match the ledger");
                    }
                }
            }

            if (units_[i].status == UnitStatus::Mismatched) {
                units_[i].status = UnitStatus::Unrepairable;
            }
        }

        // Record the outcome before rewriting units so an interrupted
        // write-back is redone on resume
        persist();
        for (const auto& item : rebuilt) {
            StagingArea::writeFileAtomic(unitPath(units_[item.first]), item.second);
            log_.info("Repaired unit " + std::to_string(units_[item.first].index));
        }
    }

    if (cancelRequested_) {
        fail(ErrorKind::UserCancelled, "Cancelled during verification");
        return;
    }

    Verdict verdict = decideVerdict(units_, blockTrusted_, ErrorKind::None);
    if (verdict == Verdict::Failed) {
        size_t lost = 0;
        for (const auto& unit : units_) {
            if (unit.status != UnitStatus::Verified && unit.status != UnitStatus::Repaired) {
                ++lost;
            }
        }
        fail(ErrorKind::Unrecoverable, std::to_string(lost) + " units could not be repaired");
    } else {
        finish(verdict == Verdict::Verified ? State::VERIFIED : State::DEGRADED);
    }
}

std::vector<bool> BackupJob::loadBlocks(std::vector<RedundancyBlock>& blocks) const {
    std::vector<bool> trusted(blocks.size(), false);
    for (size_t i = 0; i < blocks.size(); ++i) {
        std::string path = blockPath(blocks[i].index);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            log_.warning("Redundancy block " + std::to_string(blocks[i].index) + " is missing");
            continue;
        }
        blocks[i].bytes = StagingArea::readFile(path);
        trusted[i] = blockSelfCheck(blocks[i]) && blocks[i].bytes.size() == blocks[i].parameters.shardSize;
        if (!trusted[i]) {
            log_.warning("Redundancy block " + std::to_string(blocks[i].index) + " failed its self-check");
        }
    }
    return trusted;
}

void BackupJob::transition(State state) {
    setState(state);
    persist();
    setStatus(stateToString(state));
    updateProgress(progressFor(state));
    log_.info("Now " + stateToString(state));
}

void BackupJob::finish(State state) {
    finishedAt_ = WallClock::now();
    setState(state);
    persist();
    writeReport();
    setStatus(stateToString(state));
    updateProgress(100);
    log_.info("Finished: " + stateToString(state));
}

void BackupJob::fail(ErrorKind kind, const std::string& detail) {
    stopExtraction();
    failureKind_ = kind;
    failureDetail_ = detail;
    setError(errorKindToString(kind) + ": " + detail);
    log_.error("Job failed with " + errorKindToString(kind) + ": " + detail);

    try {
        finish(State::FAILED);
    } catch (const BackupError& e) {
        // The in-memory state is already terminal
        log_.error(std::string("Could not record the failure on disk: ") + e.what());
    }
}

void BackupJob::stopExtraction() {
    std::lock_guard<std::mutex> lock(handleMutex_);
    if (extractionActive_ && extractor_) {
        extractor_->cancel(handle_);
    }
    extractionActive_ = false;
}

void BackupJob::writeReport() const {
    StagingArea::writeFileAtomic(staging_.reportPath(getId()), reportToJson(buildCurrentReport()).dump(4));
}

VerificationReport BackupJob::buildCurrentReport() const {
    return buildReport(getId(), parentJobId_, formatTimestamp(finishedAt_), units_, blockTrusted_,
                       failureKind_, failureDetail_);
}

std::optional<VerificationReport> BackupJob::report() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isTerminal()) {
        return std::nullopt;
    }
    return buildCurrentReport();
}

std::string BackupJob::unitPath(const Unit& unit) const {
    return (fs::path(staging_.unitsDir(getId())) / unit.fileName).string();
}

std::string BackupJob::blockPath(size_t index) const {
    return (fs::path(staging_.redundancyDir(getId())) / StagingArea::blockFileName(index)).string();
}

void BackupJob::persist() const {
    StagingArea::writeFileAtomic(staging_.jobRecordPath(getId()), toJson().dump(4));
}

json BackupJob::toJson() const {
    json units = json::array();
    for (const auto& unit : units_) {
        units.push_back({
            {"index", unit.index},
            {"file", unit.fileName},
            {"offset", unit.offset},
            {"size", unit.size},
            {"digest", unit.digest ? json(*unit.digest) : json(nullptr)},
            {"block", unit.redundancyBlock ? json(*unit.redundancyBlock) : json(nullptr)},
            {"status", unitStatusToString(unit.status)}
        });
    }

    json blocks = json::array();
    for (size_t i = 0; i < blocks_.size(); ++i) {
        const RedundancyBlock& block = blocks_[i];
        json entry = {
            {"index", block.index},
            {"file", StagingArea::blockFileName(block.index)},
            {"units", block.unitIndices},
            {"sizes", block.unitSizes},
            {"codec", block.parameters.codec},
            {"groupSize", block.parameters.groupSize},
            {"shardSize", block.parameters.shardSize},
            {"checksum", block.checksum}
        };
        if (i < blockTrusted_.size()) {
            entry["trusted"] = static_cast<bool>(blockTrusted_[i]);
        }
        blocks.push_back(entry);
    }

    json record = {
        {"id", getId()},
        {"state", stateToString(getState())},
        {"config", backupConfigToJson(config_)},
        {"createdAt", toMillis(createdAt_)},
        {"finishedAt", isTerminal() ? json(toMillis(finishedAt_)) : json(nullptr)},
        {"attempts", attempts_},
        {"failureKind", errorKindToString(failureKind_)},
        {"failureDetail", failureDetail_},
        {"units", units},
        {"blocks", blocks}
    };
    if (!parentJobId_.empty()) {
        record["parentJobId"] = parentJobId_;
    }
    return record;
}

void BackupJob::restore(const json& record) {
    try {
        setId(record.at("id").get<std::string>());
        parentJobId_ = record.value("parentJobId", std::string());
        setState(parseState(record.at("state").get<std::string>()));
        createdAt_ = fromMillis(record.at("createdAt").get<int64_t>());
        if (record.contains("finishedAt") && !record.at("finishedAt").is_null()) {
            finishedAt_ = fromMillis(record.at("finishedAt").get<int64_t>());
        }
        attempts_ = record.value("attempts", 0);
        failureKind_ = parseErrorKind(record.value("failureKind", std::string("None")));
        failureDetail_ = record.value("failureDetail", std::string());

        units_.clear();
        for (const auto& entry : record.at("units")) {
            Unit unit;
            unit.index = entry.at("index").get<size_t>();
            unit.fileName = entry.at("file").get<std::string>();
            unit.offset = entry.at("offset").get<uint64_t>();
            unit.size = entry.at("size").get<uint64_t>();
            if (!entry.at("digest").is_null()) {
                unit.digest = entry.at("digest").get<std::string>();
            }
            if (!entry.at("block").is_null()) {
                unit.redundancyBlock = entry.at("block").get<size_t>();
            }
            unit.status = parseUnitStatus(entry.at("status").get<std::string>());
            units_.push_back(unit);
        }

        blocks_.clear();
        blockTrusted_.clear();
        for (const auto& entry : record.at("blocks")) {
            RedundancyBlock block;
            block.index = entry.at("index").get<size_t>();
            block.unitIndices = entry.at("units").get<std::vector<size_t>>();
            block.unitSizes = entry.at("sizes").get<std::vector<uint64_t>>();
            block.parameters.codec = entry.at("codec").get<std::string>();
            block.parameters.groupSize = entry.at("groupSize").get<size_t>();
            block.parameters.shardSize = entry.at("shardSize").get<uint64_t>();
            block.checksum = entry.at("checksum").get<std::string>();
            if (entry.contains("trusted")) {
                blockTrusted_.push_back(entry.at("trusted").get<bool>());
            }
            blocks_.push_back(std::move(block));
        }
        if (blockTrusted_.size() != blocks_.size()) {
            blockTrusted_.clear();
        }
    } catch (const json::exception& e) {
        throw BackupError(ErrorKind::StorageIOError, std::string("Malformed job record: ") + e.what());
    }

    log_.setJobId(getId());
    if (failureKind_ != ErrorKind::None) {
        setError(errorKindToString(failureKind_) + ": " + failureDetail_);
    }
    setStatus(stateToString(getState()));
    updateProgress(progressFor(getState()));
}

void BackupJob::reconcile() {
    State state = getState();
    if (isTerminalState(state)) {
        log_.debug("Loaded finished job (" + stateToString(state) + ")");
        return;
    }

    size_t stale = staging_.cleanupTemporaries(getId());
    if (stale > 0) {
        log_.info("Removed " + std::to_string(stale) + " temporary files left by an interrupted run");
    }

    switch (state) {
        case State::CREATED:
        case State::EXTRACTING:
            // Extractor output cannot be trusted across a restart
            staging_.clearPartial(getId());
            staging_.clearUnits(getId());
            units_.clear();
            blocks_.clear();
            attempts_ = 0;
            nextRetryAt_.reset();
            setState(State::CREATED);
            persist();
            log_.info("Resuming: extraction restarts from the beginning");
            break;

        case State::CHECKSUMMING: {
            size_t recorded = 0;
            for (const auto& unit : units_) {
                if (ledger_->hasEntry(unit.index, config_.algorithm)) {
                    ++recorded;
                }
            }
            log_.info("Resuming checksumming: " + std::to_string(recorded) + " of " +
                      std::to_string(units_.size()) + " units already recorded");
            break;
        }

        case State::ENCODING: {
            std::error_code ec;
            fs::remove_all(staging_.redundancyDir(getId()), ec);
            if (ec) {
                throw BackupError(ErrorKind::StorageIOError, "Failed to clear redundancy directory: " + ec.message());
            }
            blocks_.clear();
            blockTrusted_.clear();
            for (auto& unit : units_) {
                unit.redundancyBlock.reset();
            }
            persist();
            log_.info("Resuming: redundancy encoding restarts");
            break;
        }

        case State::VERIFYING:
            for (auto& unit : units_) {
                if (unit.status != UnitStatus::Repaired) {
                    unit.status = UnitStatus::Unverified;
                }
            }
            blockTrusted_.clear();
            persist();
            log_.info("Resuming: verification restarts");
            break;

        default:
            break;
    }
}

std::string BackupJob::getParentJobId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parentJobId_;
}

std::vector<Unit> BackupJob::getUnits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return units_;
}

std::vector<RedundancyBlock> BackupJob::getBlocks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocks_;
}

int BackupJob::getExtractionAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

ErrorKind BackupJob::getFailureKind() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failureKind_;
}

std::string BackupJob::getFailureDetail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failureDetail_;
}

std::string BackupJob::getJobDirectory() const {
    return staging_.jobDir(getId());
}
